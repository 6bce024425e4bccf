/**
 * @file Loader.cpp
 * @brief Settings file loading implementation
 */

#include "stagehand/Loader.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Util.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace stagehand {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
nlohmann::json toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return nlohmann::json(node.as_string()->get());

        case toml::node_type::integer:
            return nlohmann::json(node.as_integer()->get());

        case toml::node_type::floating_point:
            return nlohmann::json(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return nlohmann::json(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return nlohmann::json(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return nlohmann::json(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return nlohmann::json(ss.str());
        }

        case toml::node_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

nlohmann::json load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content = read_text(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path, 0, 0, e.what());
    }
}

nlohmann::json load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_value_to_json(table);
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

nlohmann::json load_config_file(const std::string& path) {
    if (path.empty()) {
        return nlohmann::json::object();
    }
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigParseError(path, 0, 0,
                           "Unsupported settings file type: " + ext + " (expected .json or .toml)");
}

} // namespace stagehand
