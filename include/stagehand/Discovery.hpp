/**
 * @file Discovery.hpp
 * @brief Target discovery from a directory of target definition files
 *
 * Each file matched by a template defines one target: the name comes from
 * the template pattern, the context from the template loader.
 */

#ifndef STAGEHAND_DISCOVERY_HPP
#define STAGEHAND_DISCOVERY_HPP

#include "stagehand/Properties.hpp"
#include "stagehand/Template.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stagehand {

/**
 * @brief A named deployment target
 *
 * Targets without a context are staged without rendering.
 */
struct Target {
    std::string name;
    std::optional<Properties> context;
};

/**
 * @brief Targets keyed on name, iterated in name order
 */
using TargetMap = std::map<std::string, Target>;

/**
 * @brief Discover the targets defined in a directory
 *
 * Templates are applied in order; a target found by a later template
 * replaces one of the same name found by an earlier template.
 *
 * @param targets_dir Flat directory of target files
 * @param templates Templates to apply; the built-in templates if empty
 * @return Discovered targets
 * @throws FileNotFoundError if targets_dir is not a directory
 * @throws TargetNameParseError if a matched file yields no target name
 * @throws TargetParseError if a matched file cannot be loaded
 */
TargetMap discover(const std::filesystem::path& targets_dir,
                   const std::vector<Template>& templates = {});

/**
 * @brief Discover the targets matched by a single template
 */
TargetMap parse_targets(const std::filesystem::path& targets_dir, const Template& tmpl);

/**
 * @brief Load one target file
 */
Target parse_target_file(const std::filesystem::path& file, const Template& tmpl);

/**
 * @brief Read the target name from a file name
 * @throws TargetNameParseError if group 1 is absent or empty
 */
std::string parse_target_name(const std::filesystem::path& file, const Template& tmpl);

nlohmann::json to_json(const Target& target);
nlohmann::json to_json(const TargetMap& targets);

} // namespace stagehand

#endif // STAGEHAND_DISCOVERY_HPP
