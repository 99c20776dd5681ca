#pragma once

#include <crow/http_request.h>
#include <map>
#include <string>
#include <vector>

namespace switchyard {

// Upper-case HTTP method name of the request ("GET", "POST", ...)
std::string requestMethod(const crow::request& req);

// Request path without the query string
std::string requestPath(const crow::request& req);

// Raw query string (the part after '?'), empty when absent
std::string rawQuery(const crow::request& req);

/**
 * Parse a raw query string into a key/value map.
 * Pairs are separated by '&' and split at the first '='; pairs without '='
 * are skipped. Values are kept as sent, without percent-decoding.
 */
std::map<std::string, std::string> parseQuery(const std::string& query);

std::string trim(const std::string& value);
std::string toUpper(std::string value);

// Split a comma-separated list, trimming entries and dropping empty ones
std::vector<std::string> splitList(const std::string& value, bool upper_case = false);

std::string joinList(const std::vector<std::string>& values, const std::string& separator = ", ");

} // namespace switchyard
