#include "request_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace switchyard {

std::string requestMethod(const crow::request& req) {
    return crow::method_name(req.method);
}

std::string requestPath(const crow::request& req) {
    auto pos = req.url.find('?');
    if (pos == std::string::npos) {
        return req.url;
    }
    return req.url.substr(0, pos);
}

std::string rawQuery(const crow::request& req) {
    auto pos = req.raw_url.find('?');
    if (pos != std::string::npos) {
        return req.raw_url.substr(pos + 1);
    }
    pos = req.url.find('?');
    if (pos != std::string::npos) {
        return req.url.substr(pos + 1);
    }
    return "";
}

std::map<std::string, std::string> parseQuery(const std::string& query) {
    std::map<std::string, std::string> result;
    if (query.empty()) {
        return result;
    }

    std::stringstream ss(query);
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        result[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return result;
}

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n\f\v";
    auto start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::vector<std::string> splitList(const std::string& value, bool upper_case) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string cleaned = trim(item);
        if (cleaned.empty()) {
            continue;
        }
        items.push_back(upper_case ? toUpper(cleaned) : cleaned);
    }
    return items;
}

std::string joinList(const std::vector<std::string>& values, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += values[i];
    }
    return joined;
}

} // namespace switchyard
