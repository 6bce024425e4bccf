/**
 * @file Discovery.cpp
 * @brief Target discovery implementation
 */

#include "stagehand/Discovery.hpp"
#include "stagehand/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace stagehand {

TargetMap discover(const fs::path& targets_dir, const std::vector<Template>& templates) {
    std::error_code ec;
    if (!fs::is_directory(targets_dir, ec)) {
        throw FileNotFoundError(targets_dir.string());
    }

    const std::vector<Template>& applied = templates.empty() ? default_templates() : templates;
    TargetMap result;
    for (const auto& tmpl : applied) {
        for (auto& [name, target] : parse_targets(targets_dir, tmpl)) {
            if (result.count(name) > 0) {
                spdlog::debug("Target '{}' redefined by template {}", name, tmpl.source());
            }
            result[name] = std::move(target);
        }
    }
    spdlog::info("Discovered {} target(s) in {}", result.size(), targets_dir.string());
    return result;
}

TargetMap parse_targets(const fs::path& targets_dir, const Template& tmpl) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(targets_dir)) {
        if (!entry.is_regular_file()) continue;
        if (tmpl.matches(entry.path().filename().string())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    TargetMap result;
    for (const auto& file : files) {
        Target target = parse_target_file(file, tmpl);
        std::string name = target.name;
        result[name] = std::move(target);
    }
    return result;
}

Target parse_target_file(const fs::path& file, const Template& tmpl) {
    std::string name = parse_target_name(file, tmpl);

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw TargetParseError(fs::absolute(file).string(), "cannot open file");
    }
    try {
        Target target{name, tmpl.load(in)};
        spdlog::debug("Loaded target '{}' from {}", name, file.string());
        return target;
    } catch (const std::exception& e) {
        throw TargetParseError(fs::absolute(file).string(), e.what());
    }
}

std::string parse_target_name(const fs::path& file, const Template& tmpl) {
    auto name = tmpl.extract_name(file.filename().string());
    if (!name.has_value() || name->empty()) {
        throw TargetNameParseError(file.string(), tmpl.source());
    }
    return *name;
}

nlohmann::json to_json(const Target& target) {
    nlohmann::json j = {{"name", target.name}};
    if (target.context.has_value()) {
        j["context"] = target.context->to_json();
    }
    return j;
}

nlohmann::json to_json(const TargetMap& targets) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, target] : targets) {
        j[name] = to_json(target);
    }
    return j;
}

} // namespace stagehand
