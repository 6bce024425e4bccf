/**
 * @file Loader.hpp
 * @brief Settings file loading
 *
 * Implements loading project settings from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * The format is chosen by file extension.
 */

#ifndef STAGEHAND_LOADER_HPP
#define STAGEHAND_LOADER_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace stagehand {

/**
 * @brief Load settings from a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed JSON tree
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if JSON syntax is invalid
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Load settings from a TOML file.
 *
 * TOML tables map to nested objects; dates and times become strings.
 *
 * @param path Path to the TOML file
 * @return Parsed tree as JSON
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if TOML syntax is invalid
 */
nlohmann::json load_toml_file(const std::string& path);

/**
 * @brief Load a settings file, detecting the format by extension.
 *
 * - Empty path: empty object
 * - ".json": load_json_file
 * - ".toml": load_toml_file
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError for any other extension or a syntax error
 */
nlohmann::json load_config_file(const std::string& path);

/**
 * @brief Get lowercase file extension, including the dot.
 */
std::string get_file_extension(const std::string& path);

} // namespace stagehand

#endif // STAGEHAND_LOADER_HPP
