#include "stagehand/Publication.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace stagehand {

nlohmann::json to_json(const Publication& publication) {
    nlohmann::json artifacts = nlohmann::json::array();
    for (const auto& entry : publication.artifacts) {
        artifacts.push_back({
            {"classifier", entry.classifier},
            {"extension", entry.artifact.extension},
            {"file", entry.artifact.file.filename().string()}
        });
    }
    return {
        {"groupId", publication.group_id},
        {"artifactId", publication.artifact_id},
        {"version", publication.version},
        {"artifacts", artifacts}
    };
}

RepositoryPublicationSink::RepositoryPublicationSink(fs::path repository_dir,
                                                     std::string group_id,
                                                     std::string artifact_id,
                                                     std::string version)
    : repository_dir_(std::move(repository_dir))
{
    publication_.group_id = std::move(group_id);
    publication_.artifact_id = std::move(artifact_id);
    publication_.version = std::move(version);
}

fs::path RepositoryPublicationSink::publication_dir() const {
    fs::path dir = repository_dir_;
    for (const auto& part : split(publication_.group_id, '.')) {
        dir /= part;
    }
    return dir / publication_.artifact_id / publication_.version;
}

void RepositoryPublicationSink::add(const Artifact& artifact, const std::string& classifier) {
    publication_.artifacts.push_back({artifact, classifier});
    spdlog::info("Registered {} for publishing with classifier '{}'",
                 artifact.file.filename().string(), classifier);
}

void RepositoryPublicationSink::publish(const Artifact& artifact) {
    auto it = std::find_if(publication_.artifacts.begin(), publication_.artifacts.end(),
                           [&](const Publication::Entry& e) { return e.artifact == artifact; });
    if (it == publication_.artifacts.end()) {
        throw StagingError("Artifact not registered for publishing: " + artifact.file.string());
    }
    std::error_code ec;
    if (!fs::is_regular_file(artifact.file, ec)) {
        throw FileNotFoundError(artifact.file.string());
    }

    const fs::path dir = publication_dir();
    const fs::path dest = dir / (publication_.artifact_id + "-" + publication_.version + "-" +
                                 it->classifier + "." + artifact.extension);
    fs::create_directories(dir);
    fs::copy_file(artifact.file, dest, fs::copy_options::overwrite_existing);
    write_text(dir / "publication.json", dump_json(to_json(publication_), 2) + "\n");
    spdlog::info("Published {}", dest.string());
}

} // namespace stagehand
