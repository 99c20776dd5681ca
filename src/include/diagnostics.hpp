#pragma once

#include <crow/http_request.h>
#include <crow/json.h>
#include <string>
#include <vector>

namespace switchyard {

struct DiagnosticsOptions {
    // Adds details, trace and masked request headers to error payloads
    bool detailed = true;
};

/**
 * Builds the structured JSON body shared by every failure response and logs
 * routing failures.
 *
 * Payload: {error, message, path, method, timestamp, code}, extended with
 * {details, trace, headers} in detailed mode.
 */
class DiagnosticsEngine {
public:
    static constexpr size_t kMaxSuggestions = 3;
    static constexpr size_t kMaskKeep = 10;
    static constexpr const char* kMaskMarker = "***";

    explicit DiagnosticsEngine(DiagnosticsOptions options = DiagnosticsOptions{});

    bool detailed() const { return options_.detailed; }
    const DiagnosticsOptions& options() const { return options_; }

    /**
     * Pick at most three known paths resembling the requested one. A path
     * qualifies when it starts with the same character, or when both strings
     * are longer than three characters and end with the same three.
     */
    static std::vector<std::string> suggestRoutes(const std::string& requested_path,
                                                  const std::vector<std::string>& known_paths);

    // Keep the first ten characters of a sensitive header value, then append the mask marker
    static std::string maskHeader(const std::string& value);

    static std::string statusText(int code);

    // Current UTC time, RFC 3339
    static std::string timestamp();

    crow::json::wvalue buildPayload(const crow::request& req,
                                    int code,
                                    const std::string& message,
                                    crow::json::wvalue details = crow::json::wvalue(),
                                    const std::string& trace = "") const;

    void logRouteNotFound(const crow::request& req) const;
    void logMethodNotAllowed(const crow::request& req, const std::vector<std::string>& allowed) const;
    void logServerError(const crow::request& req, const std::string& error) const;
    void logAuthFailure(const crow::request& req, const std::string& reason) const;

private:
    DiagnosticsOptions options_;
};

} // namespace switchyard
