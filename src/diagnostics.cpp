#include "diagnostics.hpp"
#include "request_utils.hpp"

#include <crow/logging.h>
#include <ctime>
#include <map>

namespace switchyard {

DiagnosticsEngine::DiagnosticsEngine(DiagnosticsOptions options)
    : options_(options)
{
}

std::vector<std::string> DiagnosticsEngine::suggestRoutes(const std::string& requested_path,
                                                          const std::vector<std::string>& known_paths) {
    std::vector<std::string> suggestions;
    if (requested_path.empty()) {
        return suggestions;
    }

    for (const auto& route : known_paths) {
        if (suggestions.size() >= kMaxSuggestions) {
            break;
        }
        if (route.empty()) {
            continue;
        }

        bool same_first = route.front() == requested_path.front();
        bool same_tail = route.size() > 3 && requested_path.size() > 3 &&
                         route.compare(route.size() - 3, 3, requested_path, requested_path.size() - 3, 3) == 0;

        if (same_first || same_tail) {
            suggestions.push_back(route);
        }
    }
    return suggestions;
}

std::string DiagnosticsEngine::maskHeader(const std::string& value) {
    if (value.empty()) {
        return "";
    }
    if (value.size() <= kMaskKeep) {
        return kMaskMarker;
    }
    return value.substr(0, kMaskKeep) + kMaskMarker;
}

std::string DiagnosticsEngine::statusText(int code) {
    static const std::map<int, std::string> texts = {
        {200, "OK"},
        {201, "Created"},
        {204, "No Content"},
        {400, "Bad Request"},
        {401, "Unauthorized"},
        {403, "Forbidden"},
        {404, "Not Found"},
        {405, "Method Not Allowed"},
        {409, "Conflict"},
        {422, "Unprocessable Entity"},
        {429, "Too Many Requests"},
        {500, "Internal Server Error"},
        {502, "Bad Gateway"},
        {503, "Service Unavailable"},
    };

    auto it = texts.find(code);
    if (it != texts.end()) {
        return it->second;
    }
    return "Unknown Status";
}

std::string DiagnosticsEngine::timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

crow::json::wvalue DiagnosticsEngine::buildPayload(const crow::request& req,
                                                   int code,
                                                   const std::string& message,
                                                   crow::json::wvalue details,
                                                   const std::string& trace) const {
    crow::json::wvalue payload;
    payload["error"] = statusText(code);
    payload["message"] = message;
    payload["path"] = requestPath(req);
    payload["method"] = requestMethod(req);
    payload["timestamp"] = timestamp();
    payload["code"] = code;

    if (!options_.detailed) {
        return payload;
    }

    if (details.t() != crow::json::type::Null) {
        payload["details"] = std::move(details);
    }
    if (!trace.empty()) {
        payload["trace"] = trace;
    }

    payload["headers"]["User-Agent"] = req.get_header_value("User-Agent");
    payload["headers"]["Content-Type"] = req.get_header_value("Content-Type");
    payload["headers"]["Authorization"] = maskHeader(req.get_header_value("Authorization"));
    payload["headers"]["Origin"] = req.get_header_value("Origin");

    return payload;
}

void DiagnosticsEngine::logRouteNotFound(const crow::request& req) const {
    CROW_LOG_INFO << "[404] Route not found: " << requestMethod(req) << " " << requestPath(req);
    CROW_LOG_DEBUG << "  query: " << rawQuery(req)
                   << ", user-agent: " << req.get_header_value("User-Agent")
                   << ", origin: " << req.get_header_value("Origin");
}

void DiagnosticsEngine::logMethodNotAllowed(const crow::request& req,
                                            const std::vector<std::string>& allowed) const {
    CROW_LOG_INFO << "[405] Method not allowed: " << requestMethod(req) << " " << requestPath(req)
                  << " (allowed: " << joinList(allowed) << ")";
}

void DiagnosticsEngine::logServerError(const crow::request& req, const std::string& error) const {
    CROW_LOG_ERROR << "[500] Server error on " << requestMethod(req) << " " << requestPath(req)
                   << ": " << error;
    CROW_LOG_DEBUG << "  user-agent: " << req.get_header_value("User-Agent")
                   << ", content-type: " << req.get_header_value("Content-Type")
                   << ", content-length: " << req.get_header_value("Content-Length");
}

void DiagnosticsEngine::logAuthFailure(const crow::request& req, const std::string& reason) const {
    CROW_LOG_WARNING << "[401] Auth failure on " << requestMethod(req) << " " << requestPath(req)
                     << ": " << reason;

    auto auth_header = req.get_header_value("Authorization");
    if (auth_header.empty()) {
        CROW_LOG_DEBUG << "  no Authorization header";
    } else {
        CROW_LOG_DEBUG << "  Authorization header present: " << maskHeader(auth_header);
    }
}

} // namespace switchyard
