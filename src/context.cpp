#include "context.hpp"
#include "request_utils.hpp"

#include <crow/logging.h>

namespace switchyard {

namespace {

// Restores the chain cursor when a step returns or throws
class CursorGuard {
public:
    CursorGuard(size_t& cursor, size_t value) : cursor_(cursor), saved_(cursor) {
        cursor_ = value;
    }
    ~CursorGuard() { cursor_ = saved_; }

    CursorGuard(const CursorGuard&) = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;

private:
    size_t& cursor_;
    size_t saved_;
};

} // namespace

Context::Context(const crow::request& req, crow::response& res, const DiagnosticsEngine& diagnostics)
    : req_(req), res_(res), diagnostics_(diagnostics),
      path_(requestPath(req)), query_(parseQuery(rawQuery(req)))
{
}

std::string Context::method() const {
    return requestMethod(req_);
}

std::string Context::header(const std::string& name) const {
    return req_.get_header_value(name);
}

std::string Context::param(const std::string& name) const {
    auto it = params_.find(name);
    return it != params_.end() ? it->second : "";
}

std::string Context::queryParam(const std::string& name) const {
    auto it = query_.find(name);
    return it != query_.end() ? it->second : "";
}

Result<crow::json::rvalue> Context::bindJSON() const {
    if (req_.body.empty()) {
        return Error::BadRequest("Request body is empty", "Expected a JSON document");
    }

    auto body = crow::json::load(req_.body);
    if (!body) {
        return Error::BadRequest("Malformed JSON body", "The request body could not be decoded as JSON");
    }
    return body;
}

void Context::setHeader(const std::string& name, const std::string& value) {
    res_.set_header(name, value);
}

bool Context::beginWrite(int status) {
    if (responded_) {
        CROW_LOG_WARNING << "Response for " << method() << " " << path_
                         << " already written, ignoring second write with status " << status;
        return false;
    }
    responded_ = true;
    res_.code = status;
    return true;
}

void Context::writeJSON(int status, const crow::json::wvalue& value) {
    if (!beginWrite(status)) {
        return;
    }
    res_.set_header("Content-Type", "application/json");
    res_.body = value.dump();
}

void Context::writeText(int status, const std::string& value) {
    if (!beginWrite(status)) {
        return;
    }
    res_.set_header("Content-Type", "text/plain");
    res_.body = value;
}

void Context::writeStatus(int status) {
    if (!beginWrite(status)) {
        return;
    }
    res_.body.clear();
}

void Context::writeError(int status, const std::string& message,
                         crow::json::wvalue details, const std::string& trace) {
    writeJSON(status, diagnostics_.buildPayload(req_, status, message, std::move(details), trace));
}

void Context::writeError(const Error& error, crow::json::wvalue details, const std::string& trace) {
    if (details.t() == crow::json::type::Null && !error.details.empty()) {
        details["reason"] = error.details;
    }
    writeError(error.http_status_code, error.message, std::move(details), trace);
}

void Context::runChain(const MiddlewareChain& chain) {
    chain_ = &chain;
    continued_.assign(chain.size(), false);
    cursor_ = kNoStep;
    if (chain.empty()) {
        return;
    }
    invokeStep(0);
}

void Context::next() {
    if (!chain_ || cursor_ == kNoStep) {
        CROW_LOG_WARNING << "next() called outside of a running middleware chain";
        return;
    }

    size_t following = cursor_ + 1;
    if (following >= chain_->size()) {
        return;
    }

    if (continued_[cursor_]) {
        CROW_LOG_WARNING << "next() called more than once by step " << cursor_
                         << " on " << method() << " " << path_ << ", ignoring";
        return;
    }
    continued_[cursor_] = true;
    invokeStep(following);
}

void Context::invokeStep(size_t index) {
    CursorGuard guard(cursor_, index);
    chain_->step(index)(*this);
}

} // namespace switchyard
