/**
 * @file Archive.hpp
 * @brief Archive writing for staged target directories
 */

#ifndef STAGEHAND_ARCHIVE_HPP
#define STAGEHAND_ARCHIVE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

/**
 * @brief Packs a directory into a single archive file
 */
class ArchiveWriter {
public:
    virtual ~ArchiveWriter() = default;

    /**
     * @brief Archive every file below source_dir
     * @return Number of entries written
     */
    virtual size_t write(const std::filesystem::path& source_dir,
                         const std::filesystem::path& archive_file) = 0;

    /**
     * @brief File extension of produced archives, without the dot
     */
    virtual std::string extension() const = 0;
};

/**
 * @brief ZIP writer (deflate, no ZIP64)
 *
 * Entries are sorted by relative path and stamped with a fixed timestamp,
 * so the same input tree always produces the same bytes.
 */
class ZipArchiveWriter : public ArchiveWriter {
public:
    explicit ZipArchiveWriter(int level = -1) : level_(level) {}

    size_t write(const std::filesystem::path& source_dir,
                 const std::filesystem::path& archive_file) override;

    std::string extension() const override { return "zip"; }

private:
    int level_;
};

/**
 * @brief Central directory record of a ZIP archive
 */
struct ZipEntry {
    std::string name;
    uint16_t method = 0;
    uint32_t crc = 0;
    uint32_t compressed_size = 0;
    uint32_t size = 0;
    uint32_t offset = 0;
};

/**
 * @brief Read the central directory of a ZIP archive
 * @throws StagingError if the file is not a ZIP archive
 */
std::vector<ZipEntry> read_zip_directory(const std::filesystem::path& archive_file);

/**
 * @brief Extract one entry's content
 * @throws StagingError if the entry is missing or corrupt
 */
std::string read_zip_entry(const std::filesystem::path& archive_file, const std::string& name);

} // namespace stagehand

#endif // STAGEHAND_ARCHIVE_HPP
