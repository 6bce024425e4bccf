/**
 * @file test_config.cpp
 * @brief Tests for layered settings loading and typed staging settings
 */

#include <gtest/gtest.h>
#include "stagehand/Config.hpp"
#include "stagehand/Loader.hpp"
#include "stagehand/Settings.hpp"
#include "stagehand/Util.hpp"
#include "test_support.hpp"

#include <cstdlib>

using namespace stagehand;
using nlohmann::json;

namespace {

void set_env(const std::string& name, const std::string& value) {
#ifdef _WIN32
    _putenv_s(name.c_str(), value.c_str());
#else
    setenv(name.c_str(), value.c_str(), 1);
#endif
}

void unset_env(const std::string& name) {
#ifdef _WIN32
    _putenv_s(name.c_str(), "");
#else
    unsetenv(name.c_str());
#endif
}

LoadOptions staging_options() {
    LoadOptions opts;
    opts.defaults = default_settings();
    opts.mandatory = mandatory_settings();
    return opts;
}

} // anonymous namespace

// ============================================================================
// Loader
// ============================================================================

TEST(Loader, JsonFile) {
    TempDir dir;
    auto file = dir.create_file("settings.json", R"({"project": {"artifactId": "app"}})");
    EXPECT_EQ(load_config_file(file.string())["project"]["artifactId"], "app");
}

TEST(Loader, TomlFile) {
    TempDir dir;
    auto file = dir.create_file("settings.toml",
        "[project]\nartifactId = \"app\"\nversion = \"1.0\"\n\n[generate]\nsort = true\n");
    json j = load_config_file(file.string());
    EXPECT_EQ(j["project"]["version"], "1.0");
    EXPECT_EQ(j["generate"]["sort"], true);
}

TEST(Loader, Errors) {
    TempDir dir;
    EXPECT_THROW(load_config_file((dir / "missing.json").string()), FileNotFoundError);

    auto bad_json = dir.create_file("bad.json", "{ not json");
    EXPECT_THROW(load_config_file(bad_json.string()), ConfigParseError);

    auto bad_toml = dir.create_file("bad.toml", "[project\nname = 1\n");
    try {
        load_config_file(bad_toml.string());
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_GT(e.line(), 0);
    }

    auto yaml = dir.create_file("settings.yaml", "a: 1\n");
    EXPECT_THROW(load_config_file(yaml.string()), ConfigParseError);
}

TEST(Loader, EmptyPathIsEmptyObject) {
    EXPECT_EQ(load_config_file(""), json::object());
}

// ============================================================================
// Config layering
// ============================================================================

TEST(Config, LayersDefaultsFileEnvOverrides) {
    TempDir dir;
    auto file = dir.create_file("settings.json",
        R"({"project": {"artifactId": "from-file", "version": "1.0"}, "generate": {"sort": true}})");
    set_env("SHTEST_LAYER_PROJECT_VERSION", "2.0");

    LoadOptions opts = staging_options();
    opts.file_path = file.string();
    opts.prefix = "SHTEST_LAYER";
    opts.overrides = parse_overrides("generate.trim:true");
    Config cfg = Config::load(opts);
    unset_env("SHTEST_LAYER_PROJECT_VERSION");

    EXPECT_EQ(cfg.at("project.artifactId"), "from-file");
    EXPECT_EQ(cfg.at("project.version"), 2.0);
    EXPECT_TRUE(cfg.get<bool>("generate.sort", false));
    EXPECT_TRUE(cfg.get<bool>("generate.trim", false));
    EXPECT_FALSE(cfg.get<bool>("generate.prepend", true));
}

TEST(Config, EnvKeysMatchExistingCaseInsensitively) {
    set_env("SHTEST_CASE_PROJECT_ARTIFACTID", "env-app");
    set_env("SHTEST_CASE_STAGE_INCLUDEALLRESOURCES", "true");

    LoadOptions opts = staging_options();
    opts.prefix = "SHTEST_CASE";
    opts.overrides = {{"project.version", "1.0"}};
    Config cfg = Config::load(opts);
    unset_env("SHTEST_CASE_PROJECT_ARTIFACTID");
    unset_env("SHTEST_CASE_STAGE_INCLUDEALLRESOURCES");

    EXPECT_EQ(cfg.at("project.artifactId"), "env-app");
    EXPECT_TRUE(cfg.get<bool>("stage.includeAllResources", false));
}

TEST(Config, MissingMandatoryKeys) {
    LoadOptions opts = staging_options();
    opts.overrides = {{"project.version", "1.0"}};
    try {
        Config::load(opts);
        FAIL() << "expected MissingMandatoryConfig";
    } catch (const MissingMandatoryConfig& e) {
        EXPECT_EQ(e.missing_keys(), (std::vector<std::string>{"project.artifactId"}));
    }
}

TEST(Config, GetFallsBackOnTypeMismatch) {
    Config cfg(json{{"generate", {{"sort", "yes"}}}});
    EXPECT_FALSE(cfg.get<bool>("generate.sort", false));
    EXPECT_EQ(cfg.get<std::string>("generate.sort", ""), "yes");
    EXPECT_THROW(cfg.at("generate.trim"), KeyError);
}

TEST(TransformEnvName, Separators) {
    EXPECT_EQ(transform_env_name("PROJECT_VERSION"), "project.version");
    EXPECT_EQ(transform_env_name("RENDER_CONTEXT_DB__HOST"), "render.context.db_host");
}

// ============================================================================
// StagingSettings
// ============================================================================

TEST(StagingSettings, DefaultPathsFollowProjectLayout) {
    Config cfg(default_settings());
    cfg.set("project.artifactId", "app");
    cfg.set("project.version", "1.0");
    cfg.set("paths.projectDir", "/work/app");

    StagingSettings s = StagingSettings::from_config(cfg);
    const fs::path root("/work/app");
    EXPECT_EQ(s.build_dir, root / "build");
    EXPECT_EQ(s.defaults_dir, root / "src" / "main" / "defaults");
    EXPECT_EQ(s.templates_dir, root / "src" / "main" / "templates");
    EXPECT_EQ(s.targets_dir, root / "src" / "main" / "targets");
    EXPECT_EQ(s.resources_dir, root / "src" / "main" / "resources");
    EXPECT_EQ(s.generated_dir, root / "build" / "vtl");
    EXPECT_EQ(s.libs_dir, root / "build" / "libs");
    EXPECT_EQ(s.generate.defaults_file_extension, DEFAULTS_FILE_EXTENSION);
    EXPECT_EQ(s.archive_name("dev", "zip"), "app-1.0-dev.zip");
    EXPECT_EQ(s.rendered_dir("dev"), root / "build" / "templates" / "dev");
    EXPECT_EQ(s.collected_dir("dev"), root / "build" / "resources" / "dev");
}

TEST(StagingSettings, RelativePathsResolveAgainstProjectDir) {
    Config cfg(json{
        {"project", {{"artifactId", "app"}, {"version", 3}}},
        {"paths", {{"projectDir", "/work/app"}, {"buildDir", "out"}, {"libsDir", "/tmp/libs"}}}
    });

    StagingSettings s = StagingSettings::from_config(cfg);
    EXPECT_EQ(s.version, "3");
    EXPECT_EQ(s.build_dir, fs::path("/work/app/out"));
    EXPECT_EQ(s.generated_dir, fs::path("/work/app/out/vtl"));
    EXPECT_EQ(s.libs_dir, fs::path("/tmp/libs"));
}

TEST(StagingSettings, DeclaredTargetsTemplatesAndRenderContext) {
    Config cfg(json::parse(R"({
        "project": {"artifactId": "app", "version": "1.0"},
        "generate": {"sort": true, "structured": true},
        "render": {"strict": true, "context": {"region": "eu", "replicas": 3}},
        "targets": {"dev": {"context": {"debug": true}}, "prod": {}},
        "templates": [{"mask": "([a-z]+)\\.env"}, {"pattern": "([a-z]+)\\.xml", "format": "xml"}]
    })"));

    StagingSettings s = StagingSettings::from_config(cfg);
    EXPECT_TRUE(s.generate.sort);
    EXPECT_TRUE(s.generate.structured);
    EXPECT_FALSE(s.generate.trim);
    EXPECT_TRUE(s.strict_render);
    EXPECT_EQ(s.render_context.at("replicas"), "3");

    ASSERT_EQ(s.declared_targets.size(), 2u);
    EXPECT_EQ(s.declared_targets.at("dev").context->at("debug"), "true");
    EXPECT_FALSE(s.declared_targets.at("prod").context.has_value());

    ASSERT_EQ(s.templates.size(), 2u);
    EXPECT_EQ(s.templates[0].extract_name("dev.env"), "dev");
    EXPECT_EQ(s.templates[1].source(), "([a-z]+)\\.xml");
}

TEST(StagingSettings, RejectsMalformedDeclarations) {
    json base = {{"project", {{"artifactId", "app"}, {"version", "1.0"}}}};

    json bad_format = base;
    bad_format["templates"] = json::array({{{"mask", "(x)"}, {"format", "yaml"}}});
    EXPECT_THROW(StagingSettings::from_config(Config(bad_format)), StagingError);

    json no_mask = base;
    no_mask["templates"] = json::array({{{"format", "xml"}}});
    EXPECT_THROW(StagingSettings::from_config(Config(no_mask)), StagingError);

    json bad_regex = base;
    bad_regex["templates"] = json::array({{{"mask", "(unclosed"}}});
    EXPECT_THROW(StagingSettings::from_config(Config(bad_regex)), TemplateError);

    json bad_targets = base;
    bad_targets["targets"] = json::array({"dev"});
    EXPECT_THROW(StagingSettings::from_config(Config(bad_targets)), StagingError);
}

TEST(ResolveTargets, DiscoveredTargetsReplaceDeclaredOnes) {
    TempDir dir;
    dir.create_file("src/main/targets/dev.properties", "source=file\n");
    dir.create_file("src/main/targets/qa.properties", "source=file\n");

    Config cfg(json{
        {"project", {{"artifactId", "app"}, {"version", "1.0"}}},
        {"paths", {{"projectDir", dir.path().string()}}},
        {"targets", {{"dev", {{"context", {{"source", "declared"}}}}}, {"prod", json::object()}}}
    });

    TargetMap targets = resolve_targets(StagingSettings::from_config(cfg));
    ASSERT_EQ(targets.size(), 3u);
    EXPECT_EQ(targets.at("dev").context->at("source"), "file");
    EXPECT_EQ(targets.at("qa").context->at("source"), "file");
    EXPECT_FALSE(targets.at("prod").context.has_value());
}

TEST(ResolveTargets, MissingTargetsDirectoryKeepsDeclaredTargets) {
    TempDir dir;
    Config cfg(json{
        {"project", {{"artifactId", "app"}, {"version", "1.0"}}},
        {"paths", {{"projectDir", dir.path().string()}}},
        {"targets", {{"prod", json::object()}}}
    });

    TargetMap targets = resolve_targets(StagingSettings::from_config(cfg));
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_TRUE(targets.count("prod"));
}

TEST(StagingSettings, VersionKeepsItsTextFromOverridesAndEnv) {
    LoadOptions opts = staging_options();
    opts.overrides = parse_overrides("project.artifactId:app, project.version:1.10");
    StagingSettings s = StagingSettings::from_config(Config::load(opts));
    EXPECT_EQ(s.version, "1.10");
    EXPECT_EQ(s.archive_name("dev", "zip"), "app-1.10-dev.zip");

    set_env("SHTEST_VERSION_PROJECT_VERSION", "2.50");
    LoadOptions env_opts = staging_options();
    env_opts.prefix = "SHTEST_VERSION";
    env_opts.overrides = {{"project.artifactId", "app"}};
    Config cfg = Config::load(env_opts);
    unset_env("SHTEST_VERSION_PROJECT_VERSION");
    EXPECT_EQ(StagingSettings::from_config(cfg).version, "2.50");
}

TEST(StagingSettings, NullCoordinatesAreMissing) {
    EXPECT_THROW(StagingSettings::from_config(Config(default_settings())), MissingMandatoryConfig);
}
