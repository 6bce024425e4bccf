/**
 * @file Stage.cpp
 * @brief Staging pipeline implementation
 */

#include "stagehand/Stage.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Util.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace stagehand {

std::string to_string(StageKind kind) {
    switch (kind) {
        case StageKind::Render: return "render";
        case StageKind::Collect: return "collect";
        case StageKind::Archive: return "archive";
        case StageKind::Publish: return "publish";
    }
    return "unknown";
}

nlohmann::json to_json(const PipelineStage& stage) {
    nlohmann::json inputs = nlohmann::json::array();
    for (const auto& input : stage.inputs) inputs.push_back(input.string());
    return {
        {"name", stage.name},
        {"kind", to_string(stage.kind)},
        {"target", stage.target},
        {"inputs", inputs},
        {"output", stage.output.string()},
        {"dependsOn", stage.depends_on}
    };
}

// ============================================================================
// StageRegistry
// ============================================================================

PipelineStage* StageRegistry::find(const std::string& name) {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

const PipelineStage* StageRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

PipelineStage& StageRegistry::find_or_create(const std::string& name, StageKind kind,
                                             const std::function<PipelineStage()>& factory) {
    if (PipelineStage* existing = find(name)) {
        if (existing->kind != kind) {
            throw PipelineStageError(name, "name already used by a " + to_string(existing->kind) +
                                     " stage, expected " + to_string(kind));
        }
        spdlog::debug("Reusing stage {}", name);
        return *existing;
    }

    std::unique_ptr<PipelineStage> stage;
    try {
        stage = std::make_unique<PipelineStage>(factory());
    } catch (const StagingError&) {
        throw;
    } catch (const std::exception& e) {
        throw PipelineStageError(name, e.what());
    }
    stage->name = name;
    stage->kind = kind;
    PipelineStage& ref = *stage;
    stages_.push_back(std::move(stage));
    index_.emplace(name, &ref);
    spdlog::debug("Created {} stage {}", to_string(kind), name);
    return ref;
}

size_t StageRegistry::count(StageKind kind) const {
    size_t n = 0;
    for (const auto& stage : stages_) {
        if (stage->kind == kind) ++n;
    }
    return n;
}

// ============================================================================
// Resource collection
// ============================================================================

std::vector<fs::path> collect_resources(const fs::path& source_dir,
                                        const fs::path& dest_dir,
                                        const std::string& target_name,
                                        bool include_all) {
    std::vector<fs::path> written;
    const std::string suffix = "." + target_name;
    for (const auto& rel : list_files_recursive(source_dir)) {
        fs::path dest_rel = rel;
        if (!include_all) {
            const std::string name = rel.filename().string();
            if (!ends_with(name, suffix)) continue;
            if (name.size() == suffix.size()) continue;
            dest_rel = rel.parent_path() / name.substr(0, name.size() - suffix.size());
        }
        const fs::path dest = dest_dir / dest_rel;
        fs::create_directories(dest.parent_path());
        fs::copy_file(source_dir / rel, dest, fs::copy_options::overwrite_existing);
        written.push_back(dest);
    }
    return written;
}

// ============================================================================
// Stager
// ============================================================================

void Stager::configure(const TargetMap& targets) {
    spdlog::info("Configuring staging for {} target(s)", targets.size());
    for (const auto& [key, target] : targets) {
        configure_target(target);
    }
}

void Stager::configure_target(const Target& target) {
    if (target.name.empty()) {
        throw InvalidTargetError(dump_json(to_json(target)));
    }
    spdlog::info("Configuring staging target {}", target.name);

    const PipelineStage* render = nullptr;
    if (target.context.has_value()) {
        render = &create_render_stage(target);
    }
    PipelineStage& resources = create_resources_stage(target, render);
    PipelineStage& archive = create_archive_stage(target, resources);
    const std::string publish = target.name + "Publish";
    try {
        Artifact artifact = create_artifact(target, archive);
        configure_publishing(target, artifact);
        create_publish_stage(target, archive, artifact);
    } catch (const StagingError&) {
        throw;
    } catch (const std::exception& e) {
        // Artifact and publication belong to the publish step of the target
        throw PipelineStageError(publish, e.what());
    }
}

PipelineStage& Stager::create_render_stage(const Target& target) {
    const auto& settings = context_.settings;
    return context_.stages.find_or_create(target.name + "Render", StageKind::Render, [&]() {
        PipelineStage stage;
        stage.target = target.name;
        stage.inputs = {settings.generated_dir};
        stage.output = settings.rendered_dir(target.name);

        // The global context is inherited, the target context overrides it
        Properties context = settings.render_context;
        context.merge(*target.context);

        TemplateRenderer& renderer = context_.renderer;
        const fs::path input = settings.generated_dir;
        const fs::path output = stage.output;
        stage.action = [&renderer, context, input, output]() {
            fs::remove_all(output);
            std::error_code ec;
            if (!fs::is_directory(input, ec)) {
                spdlog::info("No generated templates at {}, nothing to render", input.string());
                return;
            }
            renderer.render_directory(context, input, output);
        };
        return stage;
    });
}

PipelineStage& Stager::create_resources_stage(const Target& target, const PipelineStage* render) {
    const auto& settings = context_.settings;
    return context_.stages.find_or_create(target.name + "Resources", StageKind::Collect, [&]() {
        PipelineStage stage;
        stage.target = target.name;
        stage.inputs = {settings.resources_dir};
        stage.output = settings.collected_dir(target.name);
        if (render != nullptr) {
            stage.inputs.push_back(render->output);
            stage.depends_on.push_back(render->name);
        }

        const std::string name = target.name;
        const bool include_all = settings.include_all_resources;
        const fs::path resources = settings.resources_dir;
        const fs::path rendered = render != nullptr ? render->output : fs::path();
        const fs::path output = stage.output;
        stage.action = [name, include_all, resources, rendered, output]() {
            fs::remove_all(output);
            fs::create_directories(output);
            auto collected = collect_resources(resources, output, name, include_all);
            if (!rendered.empty()) {
                auto copied = copy_tree(rendered, output);
                collected.insert(collected.end(), copied.begin(), copied.end());
            }
            spdlog::info("Collected {} resource(s) for target {}", collected.size(), name);
        };
        return stage;
    });
}

PipelineStage& Stager::create_archive_stage(const Target& target, const PipelineStage& resources) {
    const auto& settings = context_.settings;
    return context_.stages.find_or_create(target.name + "Archive", StageKind::Archive, [&]() {
        PipelineStage stage;
        stage.target = target.name;
        stage.inputs = {resources.output};
        stage.output = settings.libs_dir /
                       settings.archive_name(target.name, context_.archiver.extension());
        stage.depends_on = {resources.name};

        ArchiveWriter& archiver = context_.archiver;
        const fs::path input = resources.output;
        const fs::path output = stage.output;
        stage.action = [&archiver, input, output]() {
            archiver.write(input, output);
        };
        return stage;
    });
}

Artifact Stager::create_artifact(const Target& target, const PipelineStage& archive) {
    return context_.artifacts.get_or_create(target.name, [&]() {
        Artifact artifact;
        artifact.name = context_.settings.artifact_id;
        artifact.classifier = target.name;
        artifact.extension = context_.archiver.extension();
        artifact.type = artifact.extension;
        artifact.file = archive.output;
        artifact.built_by = archive.name;
        return artifact;
    });
}

void Stager::configure_publishing(const Target& target, const Artifact& artifact) {
    PublicationSink& sink = context_.sink;
    context_.artifacts.register_publication_once(target.name, artifact, [&]() {
        sink.add(artifact, target.name);
    });
}

PipelineStage& Stager::create_publish_stage(const Target& target, const PipelineStage& archive,
                                            const Artifact& artifact) {
    return context_.stages.find_or_create(target.name + "Publish", StageKind::Publish, [&]() {
        PipelineStage stage;
        stage.target = target.name;
        stage.inputs = {archive.output};
        stage.depends_on = {archive.name};

        PublicationSink& sink = context_.sink;
        stage.action = [&sink, artifact]() {
            sink.publish(artifact);
        };
        return stage;
    });
}

void Stager::run() {
    for (const auto& stage : context_.stages.stages()) {
        spdlog::info("Running stage {}", stage->name);
        if (!stage->action) continue;
        try {
            stage->action();
        } catch (const PipelineStageError&) {
            throw;
        } catch (const std::exception& e) {
            throw PipelineStageError(stage->name, e.what());
        }
    }
}

nlohmann::json Stager::plan() const {
    nlohmann::json stages = nlohmann::json::array();
    for (const auto& stage : context_.stages.stages()) {
        stages.push_back(to_json(*stage));
    }
    return stages;
}

} // namespace stagehand
