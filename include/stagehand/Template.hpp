/**
 * @file Template.hpp
 * @brief Target templates: file name pattern plus content loader
 *
 * A template recognizes target definition files by name and loads them
 * into a property context. The target name is always capture group 1 of
 * the first match of the pattern in the file name.
 */

#ifndef STAGEHAND_TEMPLATE_HPP
#define STAGEHAND_TEMPLATE_HPP

#include "stagehand/Properties.hpp"

#include <functional>
#include <istream>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace stagehand {

/**
 * @brief Converts a byte stream into a property context
 */
using Loader = std::function<Properties(std::istream&)>;

/**
 * @brief Target names are alphanumerics with dashes and underscores.
 *
 * Dots and slashes are excluded so the name never spans an extension.
 */
inline constexpr const char* PROPERTIES_MASK = "([a-zA-Z0-9_\\-]*).properties";

inline constexpr const char* XML_PROPERTIES_MASK = "([a-zA-Z0-9_\\-]*).xml";

class Template {
public:
    /**
     * @brief Compile a mask, pairing it with a loader
     * @param mask Regular expression source with at least one group
     * @param load Loader; the line-based properties loader if empty
     * @throws TemplateError if the mask does not compile
     */
    explicit Template(const std::string& mask, Loader load = {});

    /**
     * @brief Use a precompiled pattern
     * @param pattern Compiled pattern
     * @param source Pattern source text, used in error messages
     * @param load Loader; the line-based properties loader if empty
     */
    Template(std::regex pattern, std::string source, Loader load = {});

    /**
     * @brief True if the pattern matches anywhere in the file name
     */
    bool matches(const std::string& file_name) const;

    /**
     * @brief Capture group 1 of the first match, if any
     */
    std::optional<std::string> extract_name(const std::string& file_name) const;

    Properties load(std::istream& in) const;

    const std::string& source() const noexcept { return source_; }

private:
    std::regex pattern_;
    std::string source_;
    Loader load_;
};

Template properties_template();
Template xml_properties_template();

/**
 * @brief The built-in templates, `.properties` first, then `.xml`
 */
std::vector<Template> default_templates();

} // namespace stagehand

#endif // STAGEHAND_TEMPLATE_HPP
