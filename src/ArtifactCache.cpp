#include "stagehand/ArtifactCache.hpp"

#include <spdlog/spdlog.h>

namespace stagehand {

bool operator==(const Artifact& a, const Artifact& b) {
    return a.name == b.name && a.classifier == b.classifier &&
           a.extension == b.extension && a.type == b.type &&
           a.file == b.file && a.built_by == b.built_by;
}

nlohmann::json to_json(const Artifact& artifact) {
    return {
        {"name", artifact.name},
        {"classifier", artifact.classifier},
        {"extension", artifact.extension},
        {"type", artifact.type},
        {"file", artifact.file.string()},
        {"builtBy", artifact.built_by}
    };
}

Artifact ArtifactCache::get_or_create(const std::string& target_name,
                                      const std::function<Artifact()>& factory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_artifacts.find(target_name);
    if (it != m_artifacts.end()) {
        spdlog::debug("Reusing artifact for target '{}'", target_name);
        return it->second;
    }
    Artifact artifact = factory();
    m_artifacts.emplace(target_name, artifact);
    spdlog::info("Created publishing artifact {}", artifact.file.string());
    return artifact;
}

void ArtifactCache::register_publication_once(const std::string& target_name,
                                              const Artifact& artifact,
                                              const std::function<void()>& register_fn) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_registered.count(target_name) > 0) {
        spdlog::debug("Publication for target '{}' already registered", target_name);
        return;
    }
    register_fn();
    m_registered.insert(target_name);
    m_artifacts.emplace(target_name, artifact);
}

std::optional<Artifact> ArtifactCache::find(const std::string& target_name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_artifacts.find(target_name);
    if (it == m_artifacts.end()) return std::nullopt;
    return it->second;
}

bool ArtifactCache::is_registered(const std::string& target_name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registered.count(target_name) > 0;
}

size_t ArtifactCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_artifacts.size();
}

} // namespace stagehand
