/**
 * @file Errors.hpp
 * @brief Exception types for stagehand staging errors
 *
 * Error taxonomy:
 * - StagingError: Base class
 * - TemplateError: Target template mask does not compile
 * - TargetNameParseError: Template pattern yields no target name
 * - TargetParseError: Target file cannot be loaded
 * - InvalidTargetError: Target without a name
 * - StructuralInconsistencyError: Generated property sets diverge
 * - PipelineStageError: Stage construction or execution failed
 * - RenderError: Unresolved reference in strict rendering
 * - FileNotFoundError / ConfigParseError / MissingMandatoryConfig / KeyError:
 *   settings loading
 */

#ifndef STAGEHAND_ERRORS_HPP
#define STAGEHAND_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace stagehand {

/**
 * @brief Base class for all stagehand exceptions
 */
class StagingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A target template mask is not a valid regular expression
 */
class TemplateError : public StagingError {
public:
    TemplateError(std::string mask, const std::string& details)
        : StagingError("Not a valid context mask: " + mask + " (" + details + ")")
        , mask_(std::move(mask))
    {}

    const std::string& mask() const noexcept {
        return mask_;
    }

private:
    std::string mask_;
};

/**
 * @brief A template matched a file name but no target name could be read
 *
 * The target name is always capture group 1 of the template pattern.
 */
class TargetNameParseError : public StagingError {
public:
    /**
     * @brief Construct with the file and the pattern source
     * @param file Path of the target file
     * @param pattern Source text of the template pattern
     */
    TargetNameParseError(std::string file, std::string pattern)
        : StagingError("Unable to parse target name from '" + file +
                       "' using pattern " + pattern)
        , file_(std::move(file))
        , pattern_(std::move(pattern))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& pattern() const noexcept {
        return pattern_;
    }

private:
    std::string file_;
    std::string pattern_;
};

/**
 * @brief A target file could not be opened or loaded by its template loader
 */
class TargetParseError : public StagingError {
public:
    /**
     * @brief Construct with the file path and the underlying cause
     * @param file Path of the target file
     * @param cause Message of the underlying error
     */
    TargetParseError(std::string file, std::string cause)
        : StagingError("Unable to parse target properties file: " + file + ": " + cause)
        , file_(std::move(file))
        , cause_(std::move(cause))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& cause() const noexcept {
        return cause_;
    }

private:
    std::string file_;
    std::string cause_;
};

/**
 * @brief A target was handed to the stager without a name
 */
class InvalidTargetError : public StagingError {
public:
    explicit InvalidTargetError(const std::string& description)
        : StagingError("Missing target name: " + description)
    {}
};

/**
 * @brief Generated property sets do not share the same key set
 *
 * Contains every distinct key that is missing from at least one of the
 * generated property sets, sorted.
 */
class StructuralInconsistencyError : public StagingError {
public:
    explicit StructuralInconsistencyError(std::vector<std::string> keys)
        : StagingError(format_message(keys))
        , keys_(std::move(keys))
    {}

    /**
     * @brief Get the offending keys
     * @return Sorted vector of keys
     */
    const std::vector<std::string>& keys() const noexcept {
        return keys_;
    }

private:
    std::vector<std::string> keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Detected disjoint property sets: ";
        for (const auto& key : keys) {
            oss << "\n\t" << key;
        }
        return oss.str();
    }
};

/**
 * @brief A pipeline stage could not be constructed or executed
 */
class PipelineStageError : public StagingError {
public:
    /**
     * @brief Construct with the stage name and the underlying cause
     * @param stage Name of the failing stage (e.g., "devArchive")
     * @param cause Message of the underlying error
     */
    PipelineStageError(std::string stage, std::string cause)
        : StagingError("Stage '" + stage + "' failed: " + cause)
        , stage_(std::move(stage))
        , cause_(std::move(cause))
    {}

    const std::string& stage() const noexcept {
        return stage_;
    }

    const std::string& cause() const noexcept {
        return cause_;
    }

private:
    std::string stage_;
    std::string cause_;
};

/**
 * @brief A template reference could not be resolved in strict mode
 */
class RenderError : public StagingError {
public:
    RenderError(std::string file, std::string reference)
        : StagingError("Unresolved reference '" + reference + "' in " + file)
        , file_(std::move(file))
        , reference_(std::move(reference))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& reference() const noexcept {
        return reference_;
    }

private:
    std::string file_;
    std::string reference_;
};

/**
 * @brief Mandatory settings are missing after merge
 *
 * Contains the list of all missing mandatory keys.
 */
class MissingMandatoryConfig : public StagingError {
public:
    /**
     * @brief Construct with list of missing keys
     * @param keys Dot-paths of missing mandatory keys
     */
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : StagingError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    /**
     * @brief Get the list of missing keys
     * @return Vector of dot-path strings
     */
    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief File or directory not found
 */
class FileNotFoundError : public StagingError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : StagingError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Settings file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public StagingError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line Line of the error, 0 if unknown
     * @param column Column of the error, 0 if unknown
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : StagingError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public StagingError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "project.version")
     * @param segment The specific segment that doesn't exist (e.g., "version")
     */
    KeyError(std::string path, std::string segment)
        : StagingError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

} // namespace stagehand

#endif // STAGEHAND_ERRORS_HPP
