#include "stagehand/Settings.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Util.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace stagehand {

namespace {

fs::path resolve(const fs::path& base, const Config& config, const std::string& key,
                 const fs::path& fallback) {
    std::string value = config.get<std::string>(key, "");
    if (value.empty()) return fallback;
    fs::path p(value);
    return p.is_absolute() ? p : base / p;
}

} // anonymous namespace

nlohmann::json default_settings() {
    return {
        {"project", {
            {"group", ""},
            {"artifactId", nullptr},
            {"version", nullptr}
        }},
        {"paths", nlohmann::json::object()},
        {"generate", {
            {"sort", false},
            {"trim", false},
            {"prepend", false},
            {"structured", false},
            {"defaultsFileExtension", DEFAULTS_FILE_EXTENSION}
        }},
        {"stage", {
            {"includeAllResources", false}
        }},
        {"render", {
            {"strict", false},
            {"context", nlohmann::json::object()}
        }}
    };
}

std::vector<std::string> mandatory_settings() {
    return {"project.artifactId", "project.version"};
}

Template template_from_json(const nlohmann::json& declaration) {
    if (!declaration.is_object()) {
        throw StagingError("Define a string mask or regular expression pattern: " + dump_json(declaration));
    }
    std::string mask;
    if (declaration.contains("pattern")) mask = declaration["pattern"].get<std::string>();
    else if (declaration.contains("mask")) mask = declaration["mask"].get<std::string>();
    else throw StagingError("Define a string mask or regular expression pattern: " + dump_json(declaration));

    std::string format = declaration.value("format", "properties");
    if (format == "properties") {
        return Template(mask, [](std::istream& in) { return parse_properties(in); });
    }
    if (format == "xml") {
        return Template(mask, [](std::istream& in) { return parse_xml_properties(in); });
    }
    throw StagingError("Unknown target template format '" + format + "' for mask " + mask);
}

TargetMap resolve_targets(const StagingSettings& settings) {
    TargetMap targets = settings.declared_targets;
    if (!fs::is_directory(settings.targets_dir)) {
        spdlog::debug("No targets directory at {}", settings.targets_dir.string());
        return targets;
    }
    for (auto& [name, target] : discover(settings.targets_dir, settings.templates)) {
        if (targets.count(name)) spdlog::debug("Discovered target {} replaces declared target", name);
        targets[name] = std::move(target);
    }
    return targets;
}

fs::path StagingSettings::rendered_dir(const std::string& target) const {
    return build_dir / "templates" / target;
}

fs::path StagingSettings::collected_dir(const std::string& target) const {
    return build_dir / "resources" / target;
}

std::string StagingSettings::archive_name(const std::string& target, const std::string& extension) const {
    return artifact_id + "-" + version + "-" + target + "." + extension;
}

StagingSettings StagingSettings::from_config(const Config& config) {
    config.enforce_mandatory(mandatory_settings());

    StagingSettings s;
    s.group = config.get<std::string>("project.group", "");
    s.artifact_id = config.at("project.artifactId").get<std::string>();
    s.version = config.at("project.version").is_string()
        ? config.at("project.version").get<std::string>()
        : config.at("project.version").dump();

    s.project_dir = config.get<std::string>("paths.projectDir", ".");
    s.build_dir = resolve(s.project_dir, config, "paths.buildDir", s.project_dir / "build");
    s.defaults_dir = resolve(s.project_dir, config, "paths.defaultsDir",
                             s.project_dir / "src" / "main" / "defaults");
    s.templates_dir = resolve(s.project_dir, config, "paths.templatesDir",
                              s.project_dir / "src" / "main" / "templates");
    s.targets_dir = resolve(s.project_dir, config, "paths.targetsDir",
                            s.project_dir / "src" / "main" / "targets");
    s.resources_dir = resolve(s.project_dir, config, "paths.resourcesDir",
                              s.project_dir / "src" / "main" / "resources");
    s.generated_dir = resolve(s.project_dir, config, "paths.generatedDir", s.build_dir / "vtl");
    s.libs_dir = resolve(s.project_dir, config, "paths.libsDir", s.build_dir / "libs");
    s.repository_dir = resolve(s.project_dir, config, "paths.repositoryDir",
                               s.build_dir / "repository");

    s.generate.sort = config.get<bool>("generate.sort", false);
    s.generate.trim = config.get<bool>("generate.trim", false);
    s.generate.prepend = config.get<bool>("generate.prepend", false);
    s.generate.structured = config.get<bool>("generate.structured", false);
    s.generate.defaults_file_extension =
        config.get<std::string>("generate.defaultsFileExtension", DEFAULTS_FILE_EXTENSION);

    s.include_all_resources = config.get<bool>("stage.includeAllResources", false);
    s.strict_render = config.get<bool>("render.strict", false);
    if (config.contains("render.context")) {
        s.render_context = Properties::from_json(config.at("render.context"));
    }

    if (config.contains("targets")) {
        const auto& targets = config.at("targets");
        if (!targets.is_object()) {
            throw StagingError("'targets' must be an object keyed on target name");
        }
        for (auto it = targets.begin(); it != targets.end(); ++it) {
            Target target{it.key(), std::nullopt};
            if (it.value().is_object() && it.value().contains("context")) {
                target.context = Properties::from_json(it.value()["context"]);
            }
            s.declared_targets[it.key()] = std::move(target);
        }
    }

    if (config.contains("templates")) {
        const auto& templates = config.at("templates");
        if (!templates.is_array()) {
            throw StagingError("'templates' must be an array of template declarations");
        }
        for (const auto& declaration : templates) {
            s.templates.push_back(template_from_json(declaration));
        }
    }
    return s;
}

} // namespace stagehand
