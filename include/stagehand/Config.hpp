#ifndef STAGEHAND_CONFIG_HPP
#define STAGEHAND_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <vector>
#include <optional>
#include "stagehand/Errors.hpp"

namespace stagehand {

/**
 * @brief Default environment variable prefix for settings overrides.
 */
inline constexpr const char* DEFAULT_ENV_PREFIX = "STAGEHAND";

/**
 * @brief Options for constructing a Config from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix; // Environment variable prefix, e.g. "STAGEHAND"
    std::map<std::string, nlohmann::json> overrides; // final precedence
    nlohmann::json defaults = nlohmann::json::object();
    std::vector<std::string> mandatory;
};

/**
 * @brief Layered settings tree with dot-notation helpers.
 *
 * Internally uses nlohmann::json to represent a hierarchical tree.
 */
class Config {
public:
    Config() = default;
    explicit Config(nlohmann::json data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Config load(const LoadOptions& opts);

    // Access the underlying tree
    const nlohmann::json& data() const noexcept { return data_; }
    nlohmann::json& data() noexcept { return data_; }

    // Dot helpers
    const nlohmann::json& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const nlohmann::json& v);

    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        const nlohmann::json& v = at(path);
        if (v.is_null()) return fallback;
        try {
            return v.get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    // Enforcement
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, nlohmann::json>& kv);

private:
    nlohmann::json data_ = nlohmann::json::object();
};

/**
 * @brief Transform an environment variable name (prefix removed) to a dot-path.
 *
 * Lowercases, maps `__` to `_` and `_` to `.`:
 *   PROJECT_VERSION -> project.version
 *   STAGE_INCLUDE__ALL -> stage.include_all
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Match a dot-path case-insensitively against an existing tree.
 *
 * Each segment that names an existing key (ignoring case) takes that key's
 * spelling, so `project.artifactid` resolves to `project.artifactId`.
 */
std::string remap_env_key(const nlohmann::json& base, const std::string& dot_path);

} // namespace stagehand

#endif // STAGEHAND_CONFIG_HPP
