#pragma once

#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace switchyard {

using Params = std::map<std::string, std::string>;

/**
 * Compiled form of a path template such as "/users/:id/posts/:postId".
 *
 * Templates without parameter markers stay static and are matched by exact
 * string equality. Every ":name" marker turns into a single-segment capture
 * and the resulting expression is anchored to the whole path.
 */
class RoutePattern {
public:
    /**
     * Compile a path template.
     *
     * @param templatePath Template starting with '/'
     * @return Compiled pattern
     * @throws std::invalid_argument for an empty template or one without a leading '/'
     */
    static RoutePattern compile(const std::string& templatePath);

    bool isStatic() const { return !matcher_; }
    const std::string& templatePath() const { return template_; }
    const std::vector<std::string>& paramNames() const { return param_names_; }

    // Regex source the template compiled to, empty for static templates
    const std::string& expression() const { return expression_; }

    /**
     * Match a request path against this pattern.
     * Captured values are written to params by name; a repeated name keeps the
     * last capture.
     */
    bool match(const std::string& path, Params& params) const;

private:
    RoutePattern() = default;

    static std::string escapeLiteral(const std::string& text);

    std::string template_;
    std::string expression_;
    std::vector<std::string> param_names_;
    std::shared_ptr<const std::regex> matcher_;

    static const std::regex param_regex;
};

} // namespace switchyard
