#pragma once

#include <crow/http_request.h>
#include <crow/http_response.h>
#include <crow/json.h>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "diagnostics.hpp"
#include "error.hpp"
#include "middleware_chain.hpp"
#include "route_pattern.hpp"

namespace switchyard {

/**
 * Per-request state handed to every middleware and handler.
 *
 * A Context lives for exactly one request on the stack of the dispatching
 * call and must not be kept after the chain returns. It carries the path
 * parameters of the matched route, the parsed query string and the cursor of
 * the running middleware chain.
 */
class Context {
public:
    Context(const crow::request& req, crow::response& res, const DiagnosticsEngine& diagnostics);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const crow::request& request() const { return req_; }
    crow::response& response() { return res_; }

    std::string method() const;
    const std::string& path() const { return path_; }
    std::string header(const std::string& name) const;

    // Path parameter by name, empty when absent
    std::string param(const std::string& name) const;
    const Params& params() const { return params_; }
    void setParams(Params params) { params_ = std::move(params); }

    // Query string value by name, empty when absent
    std::string queryParam(const std::string& name) const;
    const std::map<std::string, std::string>& query() const { return query_; }

    /**
     * Parse the request body as JSON.
     *
     * @return The parsed document, or a BadRequest error for an empty or malformed body
     */
    Result<crow::json::rvalue> bindJSON() const;

    void setHeader(const std::string& name, const std::string& value);

    // Terminal writes. Only the first one reaches the client
    void writeJSON(int status, const crow::json::wvalue& value);
    void writeText(int status, const std::string& value);
    void writeStatus(int status);
    void writeError(int status, const std::string& message,
                    crow::json::wvalue details = crow::json::wvalue(),
                    const std::string& trace = "");
    // Status and message from the error; its details string is used when no
    // structured details are given
    void writeError(const Error& error,
                    crow::json::wvalue details = crow::json::wvalue(),
                    const std::string& trace = "");

    bool responded() const { return responded_; }

    const DiagnosticsEngine& diagnostics() const { return diagnostics_; }

    /**
     * Continue with the next step of the chain. Each step may continue once;
     * repeated calls from the same step are ignored.
     */
    void next();

    // Executes a chain from its first step; used by MiddlewareChain::run
    void runChain(const MiddlewareChain& chain);

private:
    static constexpr size_t kNoStep = std::numeric_limits<size_t>::max();

    bool beginWrite(int status);
    void invokeStep(size_t index);

    const crow::request& req_;
    crow::response& res_;
    const DiagnosticsEngine& diagnostics_;

    std::string path_;
    Params params_;
    std::map<std::string, std::string> query_;

    const MiddlewareChain* chain_ = nullptr;
    size_t cursor_ = kNoStep;
    std::vector<bool> continued_;
    bool responded_ = false;
};

} // namespace switchyard
