#include "stagehand/Config.hpp"
#include "stagehand/Loader.hpp"
#include "stagehand/Util.hpp"
#include <algorithm>
#include <cctype>

namespace stagehand {

Config Config::load(const LoadOptions& opts) {
    nlohmann::json merged = nlohmann::json::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        nlohmann::json filej = load_config_file(*opts.file_path);
        deep_merge(merged, filej);
    }

    Config cfg(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    // 5) mandatory
    cfg.enforce_mandatory(opts.mandatory);

    return cfg;
}

const nlohmann::json& Config::at(const std::string& path) const {
    return get_by_dot(data_, path);
}

bool Config::contains(const std::string& path) const {
    return exists_by_dot(data_, path);
}

void Config::set(const std::string& path, const nlohmann::json& v) {
    set_by_dot(data_, path, v);
}

void Config::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k) || at(k).is_null()) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

void Config::apply_env_prefix(const std::string& prefix) {
    // prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";
    const std::string wanted = to_lower(normalized);

    for (const auto& [name, value] : enumerate_environment()) {
        if (to_lower(name).rfind(wanted, 0) != 0) continue;

        std::string key = transform_env_name(name.substr(normalized.size()));
        if (key.empty()) continue;
        set_by_dot(data_, remap_env_key(data_, key), parse_json_or_string(value));
    }
}

void Config::apply_overrides(const std::map<std::string, nlohmann::json>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, remap_env_key(data_, k), v);
    }
}

std::string transform_env_name(const std::string& name) {
    std::string lower = to_lower(name);
    std::string out;
    out.reserve(lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        if (lower[i] != '_') {
            out += lower[i];
        } else if (i + 1 < lower.size() && lower[i + 1] == '_') {
            out += '_';
            ++i;
        } else {
            out += '.';
        }
    }
    return out;
}

std::string remap_env_key(const nlohmann::json& base, const std::string& dot_path) {
    const nlohmann::json* cur = &base;
    std::string result;
    for (const auto& segment : split(dot_path, '.')) {
        std::string chosen = segment;
        if (cur != nullptr && cur->is_object()) {
            const nlohmann::json* next = nullptr;
            auto exact = cur->find(segment);
            if (exact != cur->end()) next = &(*exact);
            for (auto it = cur->begin(); next == nullptr && it != cur->end(); ++it) {
                if (to_lower(it.key()) == to_lower(segment)) {
                    chosen = it.key();
                    next = &it.value();
                    break;
                }
            }
            cur = next;
        } else {
            cur = nullptr;
        }
        if (!result.empty()) result += '.';
        result += chosen;
    }
    return result;
}

} // namespace stagehand
