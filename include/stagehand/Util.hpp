#ifndef STAGEHAND_UTIL_HPP
#define STAGEHAND_UTIL_HPP

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <map>
#include <vector>
#include <utility>

namespace stagehand {

// Merge b into a (recursively). Values in b take precedence.
void deep_merge(nlohmann::json& a, const nlohmann::json& b);

// Set a nested value by dot-notation, creating intermediate objects
void set_by_dot(nlohmann::json& obj, const std::string& path, const nlohmann::json& value);

// Get a nested value by dot-notation. Throws KeyError if missing.
const nlohmann::json& get_by_dot(const nlohmann::json& obj, const std::string& path);

// Check existence of a nested key by dot-notation.
bool exists_by_dot(const nlohmann::json& obj, const std::string& path);

// String helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Parse an --overrides string: "k1:json, k2:json, ..."
std::map<std::string, nlohmann::json> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Try parsing string as JSON, otherwise return it as a string.
// Numbers that would not print back as the same text (e.g. "1.10") stay strings.
nlohmann::json parse_json_or_string(const std::string& raw);

// Serialize, replacing invalid UTF-8 (e.g. Latin-1 property values) with U+FFFD.
std::string dump_json(const nlohmann::json& j, int indent = -1);

// File helpers. Reading throws FileNotFoundError, writing throws StagingError.
std::string read_text(const std::filesystem::path& file);

// Lines split on \n, \r\n or \r; a trailing separator does not produce an empty last line.
std::vector<std::string> read_lines(const std::filesystem::path& file);

// Writes text, creating parent directories first.
void write_text(const std::filesystem::path& file, const std::string& text);

// Regular files below root, as paths relative to root, sorted.
std::vector<std::filesystem::path> list_files_recursive(const std::filesystem::path& root);

// Copy every file below from into to, overwriting. Returns the copied destinations.
std::vector<std::filesystem::path> copy_tree(const std::filesystem::path& from,
                                             const std::filesystem::path& to);

} // namespace stagehand

#endif // STAGEHAND_UTIL_HPP
