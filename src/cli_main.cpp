#include <cxxopts.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "stagehand/Archive.hpp"
#include "stagehand/Config.hpp"
#include "stagehand/Defaults.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Publication.hpp"
#include "stagehand/Renderer.hpp"
#include "stagehand/Settings.hpp"
#include "stagehand/Stage.hpp"
#include "stagehand/Util.hpp"

using nlohmann::json;
using namespace stagehand;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("stagehand-cli", "Generate, render and stage per-target configuration bundles");
        options.positional_help("COMMAND");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for settings overrides",
             cxxopts::value<std::string>()->default_value(DEFAULT_ENV_PREFIX))
            ("overrides", "Comma-separated dot:key,JSON_value pairs", cxxopts::value<std::string>()->default_value(""))
            ("v,verbose", "Log debug output")
            ("q,quiet", "Log warnings and errors only")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: generate | targets | plan | stage\n";
            return 0;
        }

        if (result.count("verbose")) spdlog::set_level(spdlog::level::debug);
        else if (result.count("quiet")) spdlog::set_level(spdlog::level::warn);

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());
        load.defaults = default_settings();
        load.mandatory = mandatory_settings();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        Config cfg = Config::load(load);
        StagingSettings settings = StagingSettings::from_config(cfg);

        auto generate = [&settings]() {
            merge_defaults(settings.defaults_dir, settings.templates_dir,
                           settings.generated_dir, settings.generate);
        };

        // GENERATE
        if (cmd == "generate") {
            generate();
            return 0;
        }

        // TARGETS
        if (cmd == "targets") {
            std::cout << dump_json(to_json(resolve_targets(settings)), 2) << "\n";
            return 0;
        }

        // PLAN / STAGE
        if (cmd == "plan" || cmd == "stage") {
            VelocityRenderer renderer(settings.strict_render);
            ZipArchiveWriter archiver;
            RepositoryPublicationSink sink(settings.repository_dir, settings.group,
                                           settings.artifact_id, settings.version);
            OrchestrationContext context(settings, renderer, archiver, sink);
            Stager stager(context);

            if (cmd == "stage") generate();
            stager.configure(resolve_targets(settings));

            if (cmd == "plan") {
                std::cout << dump_json(stager.plan(), 2) << "\n";
                return 0;
            }
            stager.run();
            std::cout << "Published " << sink.publication().artifacts.size()
                      << " artifact(s) to " << sink.publication_dir().string() << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const MissingMandatoryConfig& mmc) {
        std::cerr << "Error: " << mmc.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
