#include "route_pattern.hpp"

#include <stdexcept>

namespace switchyard {

const std::regex RoutePattern::param_regex(":([^/]+)");

RoutePattern RoutePattern::compile(const std::string& templatePath) {
    if (templatePath.empty() || templatePath.front() != '/') {
        throw std::invalid_argument("Route template must start with '/': '" + templatePath + "'");
    }

    RoutePattern pattern;
    pattern.template_ = templatePath;

    if (templatePath.find(':') == std::string::npos) {
        return pattern;
    }

    std::string expression = "^";
    auto last = templatePath.cbegin();

    auto words_begin = std::sregex_iterator(templatePath.begin(), templatePath.end(), param_regex);
    auto words_end = std::sregex_iterator();

    for (std::sregex_iterator i = words_begin; i != words_end; ++i) {
        const std::smatch& match = *i;
        expression += escapeLiteral(std::string(last, match[0].first));
        expression += "([^/]+)";
        pattern.param_names_.push_back(match[1].str());
        last = match[0].second;
    }

    expression += escapeLiteral(std::string(last, templatePath.cend()));
    expression += "$";

    pattern.expression_ = expression;
    pattern.matcher_ = std::make_shared<const std::regex>(expression);
    return pattern;
}

bool RoutePattern::match(const std::string& path, Params& params) const {
    if (!matcher_) {
        return path == template_;
    }

    std::smatch matches;
    if (!std::regex_match(path, matches, *matcher_)) {
        return false;
    }

    for (size_t i = 1; i < matches.size() && i - 1 < param_names_.size(); ++i) {
        params[param_names_[i - 1]] = matches[i].str();
    }
    return true;
}

std::string RoutePattern::escapeLiteral(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

} // namespace switchyard
