/**
 * @file Settings.hpp
 * @brief Typed staging settings read from a Config tree
 *
 * Recognized keys (all optional unless noted):
 *
 *   project.group
 *   project.artifactId                     (mandatory)
 *   project.version                        (mandatory)
 *   paths.projectDir                       "."
 *   paths.buildDir                         <projectDir>/build
 *   paths.defaultsDir                      <projectDir>/src/main/defaults
 *   paths.templatesDir                     <projectDir>/src/main/templates
 *   paths.targetsDir                       <projectDir>/src/main/targets
 *   paths.resourcesDir                     <projectDir>/src/main/resources
 *   paths.generatedDir                     <buildDir>/vtl
 *   paths.libsDir                          <buildDir>/libs
 *   paths.repositoryDir                    <buildDir>/repository
 *   generate.sort / trim / prepend / structured / defaultsFileExtension
 *   stage.includeAllResources
 *   render.strict, render.context
 *   targets.<name>.context                 declared targets
 *   templates[]                            { "mask" | "pattern", "format" }
 *
 * Relative paths resolve against the project directory.
 */

#ifndef STAGEHAND_SETTINGS_HPP
#define STAGEHAND_SETTINGS_HPP

#include "stagehand/Config.hpp"
#include "stagehand/Defaults.hpp"
#include "stagehand/Discovery.hpp"
#include "stagehand/Properties.hpp"
#include "stagehand/Template.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

struct StagingSettings {
    std::string group;
    std::string artifact_id;
    std::string version;

    std::filesystem::path project_dir;
    std::filesystem::path build_dir;
    std::filesystem::path defaults_dir;
    std::filesystem::path templates_dir;
    std::filesystem::path targets_dir;
    std::filesystem::path resources_dir;
    std::filesystem::path generated_dir;
    std::filesystem::path libs_dir;
    std::filesystem::path repository_dir;

    GenerateOptions generate;
    bool include_all_resources = false;
    bool strict_render = false;
    Properties render_context;
    TargetMap declared_targets;
    std::vector<Template> templates;

    std::filesystem::path rendered_dir(const std::string& target) const;
    std::filesystem::path collected_dir(const std::string& target) const;

    /**
     * @brief `<artifactId>-<version>-<target>.<extension>`
     */
    std::string archive_name(const std::string& target, const std::string& extension) const;

    /**
     * @throws MissingMandatoryConfig if a mandatory key is missing or null
     * @throws StagingError on a malformed target or template declaration
     */
    static StagingSettings from_config(const Config& config);
};

/**
 * @brief Built-in defaults for LoadOptions::defaults
 */
nlohmann::json default_settings();

/**
 * @brief Keys that must be present after all layers are merged
 */
std::vector<std::string> mandatory_settings();

/**
 * @brief Build a template from a settings declaration
 *
 * `{"mask": "..."}` or `{"pattern": "..."}`, with an optional
 * `"format"` of `"properties"` (default) or `"xml"`.
 *
 * @throws StagingError on an unknown format or a missing mask
 * @throws TemplateError if the mask does not compile
 */
Template template_from_json(const nlohmann::json& declaration);

/**
 * @brief Declared targets overlaid with those discovered in targets_dir
 *
 * Discovery runs only if targets_dir exists. A discovered target replaces
 * a declared one of the same name.
 */
TargetMap resolve_targets(const StagingSettings& settings);

} // namespace stagehand

#endif // STAGEHAND_SETTINGS_HPP
