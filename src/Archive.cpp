/**
 * @file Archive.cpp
 * @brief ZIP archive writer and reader on top of zlib
 */

#include "stagehand/Archive.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Util.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <fstream>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

namespace stagehand {

namespace {

constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_DIR_SIGNATURE = 0x06054b50;
constexpr uint16_t VERSION = 20;
constexpr uint16_t VERSION_MADE_BY_UNIX = (3 << 8) | VERSION;
constexpr uint16_t FLAG_UTF8 = 0x0800;
constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATED = 8;
// 1980-01-01 00:00:00, the DOS epoch
constexpr uint16_t DOS_TIME = 0;
constexpr uint16_t DOS_DATE = (1 << 5) | 1;
constexpr uint32_t UNIX_FILE_MODE = 0100644;
constexpr size_t END_OF_CENTRAL_DIR_SIZE = 22;

void put16(std::string& out, uint16_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
}

void put32(std::string& out, uint32_t v) {
    for (int shift = 0; shift < 32; shift += 8) {
        out += static_cast<char>((v >> shift) & 0xFF);
    }
}

uint16_t get16(const std::string& in, size_t pos) {
    if (pos + 2 > in.size()) throw StagingError("Truncated ZIP archive");
    return static_cast<uint16_t>(static_cast<unsigned char>(in[pos]) |
                                 (static_cast<unsigned char>(in[pos + 1]) << 8));
}

uint32_t get32(const std::string& in, size_t pos) {
    return static_cast<uint32_t>(get16(in, pos)) |
           (static_cast<uint32_t>(get16(in, pos + 2)) << 16);
}

uint32_t checked32(size_t v, const std::string& what) {
    if (v > std::numeric_limits<uint32_t>::max()) {
        throw StagingError("ZIP archive too large (" + what + "), ZIP64 is not supported");
    }
    return static_cast<uint32_t>(v);
}

std::string deflate_raw(const std::string& data, int level) {
    z_stream strm{};
    if (deflateInit2(&strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw StagingError("zlib deflateInit2 failed");
    }

    std::string out;
    out.resize(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = reinterpret_cast<Bytef*>(&out[0]);
    strm.avail_out = static_cast<uInt>(out.size());

    int result = deflate(&strm, Z_FINISH);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    if (result != Z_STREAM_END) {
        throw StagingError("zlib compression failed with code " + std::to_string(result));
    }
    return out;
}

std::string inflate_raw(const std::string& data, size_t size) {
    z_stream strm{};
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
        throw StagingError("zlib inflateInit2 failed");
    }

    std::string out(size, '\0');
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = reinterpret_cast<Bytef*>(out.empty() ? nullptr : &out[0]);
    strm.avail_out = static_cast<uInt>(out.size());

    int result = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);
    if (result != Z_STREAM_END) {
        throw StagingError("zlib decompression failed with code " + std::to_string(result));
    }
    return out;
}

std::string entry_name(const fs::path& rel) {
    return rel.generic_string();
}

} // anonymous namespace

size_t ZipArchiveWriter::write(const fs::path& source_dir, const fs::path& archive_file) {
    std::string body;
    std::string central;
    size_t count = 0;

    for (const auto& rel : list_files_recursive(source_dir)) {
        const std::string name = entry_name(rel);
        const std::string data = read_text(source_dir / rel);
        const uint32_t crc = static_cast<uint32_t>(
            crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(data.data()),
                  static_cast<uInt>(data.size())));

        const bool stored = data.empty();
        const std::string payload = stored ? data : deflate_raw(data, level_);
        const uint16_t method = stored ? METHOD_STORED : METHOD_DEFLATED;
        const uint32_t offset = checked32(body.size(), "offset");

        put32(body, LOCAL_HEADER_SIGNATURE);
        put16(body, VERSION);
        put16(body, FLAG_UTF8);
        put16(body, method);
        put16(body, DOS_TIME);
        put16(body, DOS_DATE);
        put32(body, crc);
        put32(body, checked32(payload.size(), name));
        put32(body, checked32(data.size(), name));
        put16(body, static_cast<uint16_t>(name.size()));
        put16(body, 0);
        body += name;
        body += payload;

        put32(central, CENTRAL_HEADER_SIGNATURE);
        put16(central, VERSION_MADE_BY_UNIX);
        put16(central, VERSION);
        put16(central, FLAG_UTF8);
        put16(central, method);
        put16(central, DOS_TIME);
        put16(central, DOS_DATE);
        put32(central, crc);
        put32(central, static_cast<uint32_t>(payload.size()));
        put32(central, static_cast<uint32_t>(data.size()));
        put16(central, static_cast<uint16_t>(name.size()));
        put16(central, 0);  // extra
        put16(central, 0);  // comment
        put16(central, 0);  // disk
        put16(central, 0);  // internal attributes
        put32(central, UNIX_FILE_MODE << 16);
        put32(central, offset);
        central += name;
        ++count;
    }

    if (count > std::numeric_limits<uint16_t>::max()) {
        throw StagingError("Too many entries for a ZIP archive without ZIP64: " +
                           std::to_string(count));
    }

    std::string end;
    put32(end, END_OF_CENTRAL_DIR_SIGNATURE);
    put16(end, 0);
    put16(end, 0);
    put16(end, static_cast<uint16_t>(count));
    put16(end, static_cast<uint16_t>(count));
    put32(end, checked32(central.size(), "central directory"));
    put32(end, checked32(body.size(), "central directory offset"));
    put16(end, 0);

    write_text(archive_file, body + central + end);
    spdlog::info("Wrote {} ({} entries)", archive_file.string(), count);
    return count;
}

std::vector<ZipEntry> read_zip_directory(const fs::path& archive_file) {
    const std::string data = read_text(archive_file);
    if (data.size() < END_OF_CENTRAL_DIR_SIZE) {
        throw StagingError("Not a ZIP archive: " + archive_file.string());
    }

    size_t eocd = std::string::npos;
    for (size_t pos = data.size() - END_OF_CENTRAL_DIR_SIZE + 1; pos-- > 0;) {
        if (get32(data, pos) == END_OF_CENTRAL_DIR_SIGNATURE) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos) {
        throw StagingError("Not a ZIP archive: " + archive_file.string());
    }

    const uint16_t count = get16(data, eocd + 10);
    size_t pos = get32(data, eocd + 16);

    std::vector<ZipEntry> entries;
    entries.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        if (get32(data, pos) != CENTRAL_HEADER_SIGNATURE) {
            throw StagingError("Corrupt ZIP central directory: " + archive_file.string());
        }
        ZipEntry entry;
        entry.method = get16(data, pos + 10);
        entry.crc = get32(data, pos + 16);
        entry.compressed_size = get32(data, pos + 20);
        entry.size = get32(data, pos + 24);
        const uint16_t name_len = get16(data, pos + 28);
        const uint16_t extra_len = get16(data, pos + 30);
        const uint16_t comment_len = get16(data, pos + 32);
        entry.offset = get32(data, pos + 42);
        if (pos + 46 + name_len > data.size()) {
            throw StagingError("Truncated ZIP archive: " + archive_file.string());
        }
        entry.name = data.substr(pos + 46, name_len);
        entries.push_back(std::move(entry));
        pos += 46 + name_len + extra_len + comment_len;
    }
    return entries;
}

std::string read_zip_entry(const fs::path& archive_file, const std::string& name) {
    for (const auto& entry : read_zip_directory(archive_file)) {
        if (entry.name != name) continue;

        const std::string data = read_text(archive_file);
        const size_t header = entry.offset;
        if (get32(data, header) != LOCAL_HEADER_SIGNATURE) {
            throw StagingError("Corrupt ZIP entry '" + name + "' in " + archive_file.string());
        }
        const size_t start = header + 30 + get16(data, header + 26) + get16(data, header + 28);
        if (start + entry.compressed_size > data.size()) {
            throw StagingError("Truncated ZIP entry '" + name + "' in " + archive_file.string());
        }
        const std::string payload = data.substr(start, entry.compressed_size);
        std::string content = entry.method == METHOD_STORED ? payload
                                                            : inflate_raw(payload, entry.size);

        const uint32_t crc = static_cast<uint32_t>(
            crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(content.data()),
                  static_cast<uInt>(content.size())));
        if (crc != entry.crc) {
            throw StagingError("CRC mismatch for ZIP entry '" + name + "' in " + archive_file.string());
        }
        return content;
    }
    throw StagingError("No entry '" + name + "' in " + archive_file.string());
}

} // namespace stagehand
