#include "stagehand/Template.hpp"
#include "stagehand/Errors.hpp"

#include <utility>

namespace stagehand {

namespace {

std::regex compile(const std::string& mask) {
    try {
        return std::regex(mask);
    } catch (const std::regex_error& e) {
        throw TemplateError(mask, e.what());
    }
}

Loader or_default(Loader load) {
    if (load) return load;
    return [](std::istream& in) { return parse_properties(in); };
}

} // anonymous namespace

Template::Template(const std::string& mask, Loader load)
    : pattern_(compile(mask))
    , source_(mask)
    , load_(or_default(std::move(load)))
{}

Template::Template(std::regex pattern, std::string source, Loader load)
    : pattern_(std::move(pattern))
    , source_(std::move(source))
    , load_(or_default(std::move(load)))
{}

bool Template::matches(const std::string& file_name) const {
    return std::regex_search(file_name, pattern_);
}

std::optional<std::string> Template::extract_name(const std::string& file_name) const {
    std::smatch match;
    if (!std::regex_search(file_name, match, pattern_)) return std::nullopt;
    if (match.size() < 2 || !match[1].matched) return std::nullopt;
    return match[1].str();
}

Properties Template::load(std::istream& in) const {
    return load_(in);
}

Template properties_template() {
    return Template(PROPERTIES_MASK, [](std::istream& in) { return parse_properties(in); });
}

Template xml_properties_template() {
    return Template(XML_PROPERTIES_MASK, [](std::istream& in) { return parse_xml_properties(in); });
}

std::vector<Template> default_templates() {
    return { properties_template(), xml_properties_template() };
}

} // namespace stagehand
