/**
 * @file ArtifactCache.hpp
 * @brief Per-target memo of archive artifacts and publication registration
 */

#ifndef STAGEHAND_ARTIFACTCACHE_HPP
#define STAGEHAND_ARTIFACTCACHE_HPP

#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace stagehand {

/**
 * @brief A publishable file produced by a stage
 */
struct Artifact {
    std::string name;        ///< Artifact id
    std::string classifier;  ///< Target name
    std::string extension;   ///< "zip"
    std::string type;        ///< "zip"
    std::filesystem::path file;
    std::string built_by;    ///< Name of the producing stage
};

bool operator==(const Artifact& a, const Artifact& b);
nlohmann::json to_json(const Artifact& artifact);

/**
 * @brief Keyed registry guarding one-time artifact side effects
 *
 * Holds at most one artifact per target name, and remembers which target
 * names already have a registered publication. Both operations are atomic;
 * the callbacks run under the cache lock and must not call back into the
 * cache.
 */
class ArtifactCache {
public:
    /**
     * @brief Return the artifact cached for a target, creating it on first use
     * @param target_name Target name
     * @param factory Called only if nothing is cached for target_name
     */
    Artifact get_or_create(const std::string& target_name,
                           const std::function<Artifact()>& factory);

    /**
     * @brief Run register_fn the first time a target is registered
     *
     * Later calls for the same target name are no-ops. If register_fn
     * throws, the target stays unregistered.
     */
    void register_publication_once(const std::string& target_name,
                                   const Artifact& artifact,
                                   const std::function<void()>& register_fn);

    std::optional<Artifact> find(const std::string& target_name) const;
    bool is_registered(const std::string& target_name) const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Artifact> m_artifacts;
    std::set<std::string> m_registered;
};

} // namespace stagehand

#endif // STAGEHAND_ARTIFACTCACHE_HPP
