/**
 * @file Stage.hpp
 * @brief Per-target staging pipeline: render, collect, archive, publish
 *
 * Stages are created by name ("devRender", "devResources", "devArchive",
 * "devPublish") in an explicit registry, so configuring the same targets
 * again reuses the existing stages instead of adding new ones. Archive
 * artifacts and publication registration go through the ArtifactCache and
 * happen at most once per target name.
 */

#ifndef STAGEHAND_STAGE_HPP
#define STAGEHAND_STAGE_HPP

#include "stagehand/Archive.hpp"
#include "stagehand/ArtifactCache.hpp"
#include "stagehand/Discovery.hpp"
#include "stagehand/Publication.hpp"
#include "stagehand/Renderer.hpp"
#include "stagehand/Settings.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stagehand {

enum class StageKind {
    Render,
    Collect,
    Archive,
    Publish
};

std::string to_string(StageKind kind);

/**
 * @brief One step of a target's pipeline
 */
struct PipelineStage {
    std::string name;
    StageKind kind = StageKind::Render;
    std::string target;
    std::vector<std::filesystem::path> inputs;
    std::filesystem::path output;
    std::vector<std::string> depends_on;
    std::function<void()> action;
};

nlohmann::json to_json(const PipelineStage& stage);

/**
 * @brief Stages keyed on name, kept in creation order
 */
class StageRegistry {
public:
    PipelineStage* find(const std::string& name);
    const PipelineStage* find(const std::string& name) const;

    /**
     * @brief Return the stage registered under name, or create it
     *
     * @param name Stage name
     * @param kind Expected kind
     * @param factory Called only if no stage of that name exists
     * @throws PipelineStageError if the name is taken by a stage of another kind
     */
    PipelineStage& find_or_create(const std::string& name, StageKind kind,
                                  const std::function<PipelineStage()>& factory);

    const std::vector<std::unique_ptr<PipelineStage>>& stages() const noexcept { return stages_; }
    size_t size() const noexcept { return stages_.size(); }
    size_t count(StageKind kind) const;

private:
    std::vector<std::unique_ptr<PipelineStage>> stages_;
    std::map<std::string, PipelineStage*> index_;
};

/**
 * @brief State of one orchestration run
 *
 * Holds the stage registry and artifact cache, and refers to the
 * collaborators that stage actions use. The collaborators must outlive
 * the context.
 */
class OrchestrationContext {
public:
    OrchestrationContext(StagingSettings settings,
                         TemplateRenderer& renderer,
                         ArchiveWriter& archiver,
                         PublicationSink& sink)
        : settings(std::move(settings))
        , renderer(renderer)
        , archiver(archiver)
        , sink(sink)
    {}

    OrchestrationContext(const OrchestrationContext&) = delete;
    OrchestrationContext& operator=(const OrchestrationContext&) = delete;

    StagingSettings settings;
    TemplateRenderer& renderer;
    ArchiveWriter& archiver;
    PublicationSink& sink;
    StageRegistry stages;
    ArtifactCache artifacts;
};

/**
 * @brief Copy the resources selected for a target
 *
 * With include_all, every file is copied unchanged. Otherwise only files
 * named `*.<target>` are copied, with the `.<target>` suffix removed, so
 * `app.conf.dev` becomes `app.conf` for target `dev`.
 *
 * @return The files written
 */
std::vector<std::filesystem::path> collect_resources(const std::filesystem::path& source_dir,
                                                     const std::filesystem::path& dest_dir,
                                                     const std::string& target_name,
                                                     bool include_all);

/**
 * @brief Builds and runs the staging pipeline of every target
 */
class Stager {
public:
    explicit Stager(OrchestrationContext& context) : context_(context) {}

    /**
     * @brief Configure every target, in map order
     *
     * Safe to call repeatedly. Stops at the first failing target; targets
     * configured before it stay configured.
     *
     * @throws InvalidTargetError if a target has no name
     * @throws PipelineStageError if a stage cannot be created
     */
    void configure(const TargetMap& targets);

    /**
     * @brief Configure a single target
     */
    void configure_target(const Target& target);

    /**
     * @brief Execute every configured stage in creation order
     * @throws PipelineStageError naming the failing stage
     */
    void run();

    /**
     * @brief Describe the configured stages without running them
     */
    nlohmann::json plan() const;

private:
    OrchestrationContext& context_;

    PipelineStage& create_render_stage(const Target& target);
    PipelineStage& create_resources_stage(const Target& target, const PipelineStage* render);
    PipelineStage& create_archive_stage(const Target& target, const PipelineStage& resources);
    Artifact create_artifact(const Target& target, const PipelineStage& archive);
    void configure_publishing(const Target& target, const Artifact& artifact);
    PipelineStage& create_publish_stage(const Target& target, const PipelineStage& archive,
                                        const Artifact& artifact);
};

} // namespace stagehand

#endif // STAGEHAND_STAGE_HPP
