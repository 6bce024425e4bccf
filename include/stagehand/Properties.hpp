/**
 * @file Properties.hpp
 * @brief Property sets and their file formats
 *
 * Implements loading of:
 * - Line-based `.properties` text (key=value, key:value, key value)
 * - XML property files (<properties><entry key="...">...</entry></properties>)
 *
 * and the structural comparison of several property sets.
 */

#ifndef STAGEHAND_PROPERTIES_HPP
#define STAGEHAND_PROPERTIES_HPP

#include <nlohmann/json.hpp>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace stagehand {

/**
 * @brief Insertion-ordered string to string mapping
 *
 * Setting an existing key replaces its value and keeps its position.
 */
class Properties {
public:
    using Entry = std::pair<std::string, std::string>;

    Properties() = default;
    Properties(std::initializer_list<Entry> entries);

    void set(const std::string& key, std::string value);

    /**
     * @brief Get the value of a key
     * @throws KeyError if the key is not defined
     */
    const std::string& at(const std::string& key) const;

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;

    bool empty() const noexcept { return entries_.empty(); }
    size_t size() const noexcept { return entries_.size(); }

    const std::vector<Entry>& entries() const noexcept { return entries_; }
    std::vector<Entry>::const_iterator begin() const noexcept { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const noexcept { return entries_.end(); }

    std::set<std::string> key_set() const;

    /**
     * @brief Overlay other on top of this set; other's values win
     */
    void merge(const Properties& other);

    nlohmann::json to_json() const;
    static Properties from_json(const nlohmann::json& object);

    bool operator==(const Properties& other) const;
    bool operator!=(const Properties& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
    std::map<std::string, size_t> index_;
};

/**
 * @brief Parse line-based properties text
 *
 * - Lines whose first non-blank character is '#' or '!' are comments
 * - A line ending in an odd number of backslashes continues on the next line
 * - The key ends at the first unescaped '=', ':' or whitespace
 * - Escapes: \t \n \r \f \uXXXX, any other escaped character stands for itself
 *
 * @throws StagingError on a malformed \u escape
 */
Properties parse_properties(std::istream& in);

/**
 * @brief Parse XML properties
 *
 * Expects a <properties> root holding <entry key="..."> elements; a
 * <comment> element is ignored.
 *
 * @throws StagingError if the document is not well-formed or an entry has no key
 */
Properties parse_xml_properties(std::istream& in);

/**
 * @brief Load a `.properties` file
 * @throws FileNotFoundError if the file cannot be opened
 */
Properties load_properties_file(const std::filesystem::path& file);

/**
 * @brief Result of comparing the key sets of several property sets
 */
struct StructureReport {
    std::set<std::string> keys;        ///< Union of all keys
    std::set<std::string> difference;  ///< Keys missing from at least one set
};

/**
 * @brief Compare key sets pairwise
 *
 * The difference is the union, over every unordered pair, of the symmetric
 * difference of the pair's key sets.
 */
StructureReport check_structure(const std::vector<Properties>& sets);

} // namespace stagehand

#endif // STAGEHAND_PROPERTIES_HPP
