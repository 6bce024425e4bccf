/**
 * @file Publication.hpp
 * @brief Publication of target archives
 */

#ifndef STAGEHAND_PUBLICATION_HPP
#define STAGEHAND_PUBLICATION_HPP

#include "stagehand/ArtifactCache.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

/**
 * @brief Coordinates plus the artifacts registered for publishing
 */
struct Publication {
    struct Entry {
        Artifact artifact;
        std::string classifier;
    };

    std::string group_id;
    std::string artifact_id;
    std::string version;
    std::vector<Entry> artifacts;
};

nlohmann::json to_json(const Publication& publication);

/**
 * @brief Accepts (artifact, classifier) registrations and delivers artifacts
 */
class PublicationSink {
public:
    virtual ~PublicationSink() = default;

    /**
     * @brief Register an artifact for publishing, at configuration time
     */
    virtual void add(const Artifact& artifact, const std::string& classifier) = 0;

    /**
     * @brief Deliver a registered artifact, once the file has been built
     */
    virtual void publish(const Artifact& artifact) = 0;
};

/**
 * @brief Publishes into a directory laid out like a Maven repository
 *
 * Files land in `<repository>/<group path>/<artifactId>/<version>/` next
 * to a `publication.json` describing every registered artifact.
 */
class RepositoryPublicationSink : public PublicationSink {
public:
    RepositoryPublicationSink(std::filesystem::path repository_dir,
                              std::string group_id,
                              std::string artifact_id,
                              std::string version);

    void add(const Artifact& artifact, const std::string& classifier) override;

    /**
     * @throws StagingError if the artifact was never registered or its file is missing
     */
    void publish(const Artifact& artifact) override;

    const Publication& publication() const noexcept { return publication_; }
    std::filesystem::path publication_dir() const;

private:
    std::filesystem::path repository_dir_;
    Publication publication_;
};

} // namespace stagehand

#endif // STAGEHAND_PUBLICATION_HPP
