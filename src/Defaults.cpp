/**
 * @file Defaults.cpp
 * @brief Defaults merge engine implementation
 */

#include "stagehand/Defaults.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace stagehand {

std::vector<DefaultsEntry> read_defaults(const fs::path& root, const std::string& extension) {
    std::vector<DefaultsEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return entries;
    }

    for (const auto& rel : list_files_recursive(root)) {
        const std::string name = rel.filename().string();
        if (!ends_with(name, extension)) continue;

        DefaultsEntry entry;
        entry.relative_path = rel;
        entry.basename = name.substr(0, name.size() - extension.size());
        for (auto& line : read_lines(root / rel)) {
            if (!trim(line).empty()) entry.lines.push_back(std::move(line));
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<std::string> merge_lines(const std::vector<std::string>& defaults,
                                     const std::vector<std::string>& own,
                                     const GenerateOptions& options) {
    const auto& prefix = options.prepend ? own : defaults;
    const auto& suffix = options.prepend ? defaults : own;

    std::vector<std::string> lines;
    lines.reserve(prefix.size() + suffix.size());
    lines.insert(lines.end(), prefix.begin(), prefix.end());
    lines.insert(lines.end(), suffix.begin(), suffix.end());

    if (options.trim) {
        lines.erase(std::remove_if(lines.begin(), lines.end(),
                                   [](const std::string& line) { return trim(line).empty(); }),
                    lines.end());
    }
    // Flat sort: defaults and own lines interleave
    if (options.sort) {
        std::sort(lines.begin(), lines.end());
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
#if defined(_WIN32)
    const char* separator = "\r\n";
#else
    const char* separator = "\n";
#endif
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) text += separator;
        text += lines[i];
    }
    return text;
}

void throw_if_not_structured(const std::vector<Properties>& sets) {
    StructureReport report = check_structure(sets);
    if (report.difference.empty()) return;
    throw StructuralInconsistencyError(
        std::vector<std::string>(report.difference.begin(), report.difference.end()));
}

// ============================================================================
// PropertiesGenerator
// ============================================================================

PropertiesGenerator::PropertiesGenerator(fs::path defaults_dir,
                                         fs::path templates_dir,
                                         fs::path output_dir,
                                         GenerateOptions options)
    : defaults_dir_(std::move(defaults_dir))
    , templates_dir_(std::move(templates_dir))
    , output_dir_(std::move(output_dir))
    , options_(std::move(options))
    , defaults_(read_defaults(defaults_dir_, options_.defaults_file_extension))
{}

std::vector<fs::path> PropertiesGenerator::run() {
    std::error_code ec;
    if (!fs::is_directory(templates_dir_, ec)) {
        spdlog::info("No templates at {}, nothing to generate", templates_dir_.string());
        return {};
    }
    fs::create_directories(output_dir_);

    if (defaults_.empty()) {
        return copy_templates();
    }

    std::vector<fs::path> all;
    for (const auto& entry : defaults_) {
        auto generated = generate(entry);
        all.insert(all.end(), generated.begin(), generated.end());
    }
    return all;
}

std::vector<fs::path> PropertiesGenerator::generate(const DefaultsEntry& entry) {
    const fs::path rel_dir = entry.relative_path.parent_path();
    const fs::path input_dir = templates_dir_ / rel_dir;
    const fs::path output_dir = output_dir_ / rel_dir;

    std::vector<fs::path> candidates;
    std::error_code ec;
    if (fs::is_directory(input_dir, ec)) {
        for (const auto& dirent : fs::directory_iterator(input_dir)) {
            if (!dirent.is_regular_file()) continue;
            if (starts_with(dirent.path().filename().string(), entry.basename)) {
                candidates.push_back(dirent.path());
            }
        }
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<fs::path> generated;
    for (const auto& candidate : candidates) {
        fs::path out = output_dir / candidate.filename();
        write_text(out, join_lines(merge_lines(entry.lines, read_lines(candidate), options_)));
        spdlog::info("Generated {}", fs::absolute(out).string());
        generated.push_back(out);
    }

    check(generated);
    return generated;
}

std::vector<fs::path> PropertiesGenerator::copy_templates() {
    // Without defaults the templates pass through unchanged
    std::vector<fs::path> copied = copy_tree(templates_dir_, output_dir_);
    spdlog::info("Copied {} template(s) from {} to {}", copied.size(),
                 templates_dir_.string(), output_dir_.string());
    check(copied);
    return copied;
}

void PropertiesGenerator::check(const std::vector<fs::path>& generated) const {
    if (!options_.structured) return;
    std::vector<Properties> sets;
    sets.reserve(generated.size());
    for (const auto& file : generated) {
        sets.push_back(load_properties_file(file));
    }
    throw_if_not_structured(sets);
}

void merge_defaults(const fs::path& defaults_root,
                    const fs::path& templates_root,
                    const fs::path& output_root,
                    const GenerateOptions& options) {
    PropertiesGenerator generator(defaults_root, templates_root, output_root, options);
    generator.run();
}

} // namespace stagehand
