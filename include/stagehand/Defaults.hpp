/**
 * @file Defaults.hpp
 * @brief Defaults merge engine
 *
 * Generates property files by merging a shared set of default lines into
 * every template file that shares the defaults' basename:
 *
 *   src/main/defaults/app.defaults.vtl   x=1, y=2
 *   src/main/templates/app.properties    y=3
 *   build/vtl/app.properties             x=1, y=2, y=3
 *
 * The engine concatenates lines; it never deduplicates keys. Consumers of
 * the generated file resolve duplicate keys (last value wins for the
 * properties parser).
 */

#ifndef STAGEHAND_DEFAULTS_HPP
#define STAGEHAND_DEFAULTS_HPP

#include "stagehand/Properties.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

inline constexpr const char* DEFAULTS_FILE_EXTENSION = ".defaults.vtl";

/**
 * @brief Options controlling line merging and validation
 */
struct GenerateOptions {
    /// Sort all merged lines; the order of the source files is kept otherwise
    bool sort = false;
    /// Drop lines that are blank after trimming
    bool trim = false;
    /// Put the template's own lines before the defaults
    bool prepend = false;
    /// Require every generated file of a batch to define the same keys
    bool structured = false;
    std::string defaults_file_extension = DEFAULTS_FILE_EXTENSION;
};

/**
 * @brief One defaults file
 */
struct DefaultsEntry {
    std::filesystem::path relative_path;  ///< Relative to the defaults root
    std::string basename;                 ///< File name without the defaults extension
    std::vector<std::string> lines;       ///< Non-blank lines, in file order
};

/**
 * @brief Find every defaults file below root
 *
 * A missing root yields no entries.
 *
 * @param root Defaults root directory
 * @param extension Defaults file suffix
 * @return Entries sorted by relative path
 */
std::vector<DefaultsEntry> read_defaults(const std::filesystem::path& root,
                                         const std::string& extension = DEFAULTS_FILE_EXTENSION);

/**
 * @brief Merge default lines with a file's own lines
 *
 * Concatenation order follows `prepend`; then blank lines are dropped if
 * `trim`; then the whole sequence is sorted if `sort`.
 */
std::vector<std::string> merge_lines(const std::vector<std::string>& defaults,
                                     const std::vector<std::string>& own,
                                     const GenerateOptions& options);

/**
 * @brief Join lines with the platform line separator, no trailing separator
 */
std::string join_lines(const std::vector<std::string>& lines);

/**
 * @brief Throw if the property sets do not share one key set
 * @throws StructuralInconsistencyError listing the offending keys
 */
void throw_if_not_structured(const std::vector<Properties>& sets);

/**
 * @brief Generates merged property files for one invocation
 */
class PropertiesGenerator {
public:
    PropertiesGenerator(std::filesystem::path defaults_dir,
                        std::filesystem::path templates_dir,
                        std::filesystem::path output_dir,
                        GenerateOptions options = {});

    /**
     * @brief Generate all outputs
     *
     * Merges each defaults entry into its template files, or copies the
     * templates unchanged when no defaults exist. Does nothing if the
     * templates directory does not exist.
     *
     * @return Every file written
     * @throws StructuralInconsistencyError in structured mode
     */
    std::vector<std::filesystem::path> run();

    /**
     * @brief Generate the files for one defaults entry
     * @return The files generated for the entry
     */
    std::vector<std::filesystem::path> generate(const DefaultsEntry& entry);

    const std::vector<DefaultsEntry>& defaults() const noexcept { return defaults_; }
    const GenerateOptions& options() const noexcept { return options_; }

private:
    std::filesystem::path defaults_dir_;
    std::filesystem::path templates_dir_;
    std::filesystem::path output_dir_;
    GenerateOptions options_;
    std::vector<DefaultsEntry> defaults_;

    std::vector<std::filesystem::path> copy_templates();
    void check(const std::vector<std::filesystem::path>& generated) const;
};

/**
 * @brief Run one defaults merge
 */
void merge_defaults(const std::filesystem::path& defaults_root,
                    const std::filesystem::path& templates_root,
                    const std::filesystem::path& output_root,
                    const GenerateOptions& options = {});

} // namespace stagehand

#endif // STAGEHAND_DEFAULTS_HPP
