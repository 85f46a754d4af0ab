#include "epubdiff/archive.hpp"
#include "epubdiff/path_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace epubdiff {

// ============================================================================
// ZIP Format Constants (APPNOTE.TXT)
// ============================================================================

static constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
static constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
static constexpr uint32_t EOCD_SIGNATURE = 0x06054b50;
static constexpr uint32_t ZIP64_EOCD_SIGNATURE = 0x06064b50;
static constexpr uint32_t ZIP64_LOCATOR_SIGNATURE = 0x07064b50;

static constexpr size_t LOCAL_HEADER_SIZE = 30;
static constexpr size_t CENTRAL_HEADER_SIZE = 46;
static constexpr size_t EOCD_SIZE = 22;
static constexpr size_t ZIP64_EOCD_SIZE = 56;
static constexpr size_t ZIP64_LOCATOR_SIZE = 20;
static constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;

static constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;

static constexpr size_t INFLATE_CHUNK_SIZE = 64 * 1024;

// ============================================================================
// Helper Functions
// ============================================================================

static uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

static uint64_t read_u64(const uint8_t* p) {
    return static_cast<uint64_t>(read_u32(p)) |
           (static_cast<uint64_t>(read_u32(p + 4)) << 32);
}

// Inflate a raw deflate stream that must produce exactly expected_size bytes.
// The declared size comes from the archive, so output grows chunk by chunk
// and inflation stops as soon as it would run past that size.
static bool raw_inflate(const std::vector<uint8_t>& compressed,
                        uint64_t expected_size,
                        std::vector<uint8_t>& out) {
    out.clear();
    if (compressed.size() > std::numeric_limits<uInt>::max()) {
        return false;
    }

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (inflateInit2(&strm, -15) != Z_OK) {
        return false;
    }

    std::vector<uint8_t> chunk(INFLATE_CHUNK_SIZE);
    strm.next_in = const_cast<Bytef*>(compressed.data());
    strm.avail_in = static_cast<uInt>(compressed.size());

    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = chunk.data();
        strm.avail_out = static_cast<uInt>(chunk.size());

        // Z_BUF_ERROR here means truncated input: no progress is possible
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            break;
        }

        size_t produced = chunk.size() - strm.avail_out;
        if (out.size() + produced > expected_size) {
            ret = Z_DATA_ERROR;
            break;
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    inflateEnd(&strm);

    if (ret != Z_STREAM_END || out.size() != expected_size) {
        out.clear();
        return false;
    }
    return true;
}

// Apply a ZIP64 extended information extra field to the entry.
// Only the fields whose 32-bit counterpart is saturated are present.
static bool apply_zip64_extra(const uint8_t* extra, size_t extra_len,
                              bool need_usize, bool need_csize, bool need_offset,
                              ArchiveEntry& entry) {
    size_t pos = 0;
    while (pos + 4 <= extra_len) {
        uint16_t id = read_u16(extra + pos);
        uint16_t size = read_u16(extra + pos + 2);
        pos += 4;
        if (pos + size > extra_len) {
            return false;
        }
        if (id == ZIP64_EXTRA_ID) {
            size_t field = pos;
            size_t end = pos + size;
            if (need_usize) {
                if (field + 8 > end) return false;
                entry.uncompressed_size = read_u64(extra + field);
                field += 8;
            }
            if (need_csize) {
                if (field + 8 > end) return false;
                entry.compressed_size = read_u64(extra + field);
                field += 8;
            }
            if (need_offset) {
                if (field + 8 > end) return false;
                entry.local_header_offset = read_u64(extra + field);
            }
            return true;
        }
        pos += size;
    }
    return !(need_usize || need_csize || need_offset);
}

std::string compression_method_name(uint16_t method) {
    switch (method) {
        case 0:  return "stored";
        case 8:  return "deflated";
        case 9:  return "deflate64";
        case 12: return "bzip2";
        case 14: return "lzma";
        case 93: return "zstd";
        case 95: return "xz";
        default: return "method(" + std::to_string(method) + ")";
    }
}

bool ArchiveEntry::is_directory() const {
    return !stored_name.empty() &&
           (stored_name.back() == '/' || stored_name.back() == '\\');
}

// ============================================================================
// Opening and Indexing
// ============================================================================

ArchiveOpenResult ZipArchive::open(const std::string& path) {
    ArchiveOpenResult result;

    std::unique_ptr<ZipArchive> archive(new ZipArchive());
    archive->path_ = path;
    archive->file_.open(path, std::ios::binary);
    if (!archive->file_) {
        result.error = "failed to open archive: " + path;
        return result;
    }

    archive->file_.seekg(0, std::ios::end);
    std::streamoff end = archive->file_.tellg();
    if (end < 0) {
        result.error = "failed to determine archive size: " + path;
        return result;
    }
    archive->file_size_ = static_cast<uint64_t>(end);

    if (archive->file_size_ < EOCD_SIZE) {
        result.error = "not a zip archive (too small): " + path;
        return result;
    }

    // The EOCD record sits at the end, followed by an optional comment
    size_t tail_size = static_cast<size_t>(
        std::min<uint64_t>(archive->file_size_, EOCD_SIZE + MAX_COMMENT_SIZE));
    uint64_t tail_offset = archive->file_size_ - tail_size;
    std::vector<uint8_t> tail;
    if (!archive->read_at(tail_offset, tail_size, tail)) {
        result.error = "failed to read archive trailer: " + path;
        return result;
    }

    size_t eocd_pos = std::string::npos;
    for (size_t i = tail_size - EOCD_SIZE + 1; i-- > 0;) {
        if (read_u32(tail.data() + i) != EOCD_SIGNATURE) continue;
        uint16_t comment_len = read_u16(tail.data() + i + 20);
        if (i + EOCD_SIZE + comment_len <= tail_size) {
            eocd_pos = i;
            break;
        }
    }

    if (eocd_pos == std::string::npos) {
        result.error = "not a zip archive (no end of central directory): " + path;
        return result;
    }

    const uint8_t* eocd = tail.data() + eocd_pos;
    uint64_t entry_count = read_u16(eocd + 10);
    uint64_t cd_size = read_u32(eocd + 12);
    uint64_t cd_offset = read_u32(eocd + 16);

    bool zip64 = entry_count == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF;
    uint64_t eocd_offset = tail_offset + eocd_pos;
    if (zip64 && eocd_offset >= ZIP64_LOCATOR_SIZE) {
        std::vector<uint8_t> locator;
        if (archive->read_at(eocd_offset - ZIP64_LOCATOR_SIZE, ZIP64_LOCATOR_SIZE, locator) &&
            read_u32(locator.data()) == ZIP64_LOCATOR_SIGNATURE) {
            uint64_t zip64_eocd_offset = read_u64(locator.data() + 8);
            std::vector<uint8_t> record;
            if (!archive->read_at(zip64_eocd_offset, ZIP64_EOCD_SIZE, record) ||
                read_u32(record.data()) != ZIP64_EOCD_SIGNATURE) {
                result.error = "corrupt zip64 end of central directory: " + path;
                return result;
            }
            entry_count = read_u64(record.data() + 32);
            cd_size = read_u64(record.data() + 40);
            cd_offset = read_u64(record.data() + 48);
        }
    }

    if (cd_offset > archive->file_size_ || cd_size > archive->file_size_ - cd_offset) {
        result.error = "central directory out of range: " + path;
        return result;
    }

    std::vector<uint8_t> cd;
    if (!archive->read_at(cd_offset, static_cast<size_t>(cd_size), cd)) {
        result.error = "failed to read central directory: " + path;
        return result;
    }

    size_t pos = 0;
    for (uint64_t n = 0; n < entry_count; ++n) {
        if (pos + CENTRAL_HEADER_SIZE > cd.size() ||
            read_u32(cd.data() + pos) != CENTRAL_HEADER_SIGNATURE) {
            result.error = "corrupt central directory entry " + std::to_string(n) + ": " + path;
            return result;
        }

        const uint8_t* header = cd.data() + pos;
        uint16_t name_len = read_u16(header + 28);
        uint16_t extra_len = read_u16(header + 30);
        uint16_t comment_len = read_u16(header + 32);

        if (pos + CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len > cd.size()) {
            result.error = "truncated central directory entry " + std::to_string(n) + ": " + path;
            return result;
        }

        ArchiveEntry entry;
        entry.index = static_cast<size_t>(n);
        entry.flags = read_u16(header + 8);
        entry.method = read_u16(header + 10);
        entry.crc32 = read_u32(header + 16);
        entry.compressed_size = read_u32(header + 20);
        entry.uncompressed_size = read_u32(header + 24);
        entry.local_header_offset = read_u32(header + 42);
        entry.stored_name.assign(reinterpret_cast<const char*>(header + CENTRAL_HEADER_SIZE), name_len);

        bool need_usize = entry.uncompressed_size == 0xFFFFFFFF;
        bool need_csize = entry.compressed_size == 0xFFFFFFFF;
        bool need_offset = entry.local_header_offset == 0xFFFFFFFF;
        if (need_usize || need_csize || need_offset) {
            if (!apply_zip64_extra(header + CENTRAL_HEADER_SIZE + name_len, extra_len,
                                   need_usize, need_csize, need_offset, entry)) {
                result.error = "invalid zip64 extra field for: " + entry.stored_name;
                return result;
            }
        }

        entry.path = normalize_path(entry.stored_name);

        if (!entry.is_directory() && !entry.path.empty() &&
            archive->by_path_.find(entry.path) == archive->by_path_.end()) {
            archive->by_path_[entry.path] = archive->entries_.size();
        }
        archive->entries_.push_back(std::move(entry));

        pos += CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
    }

    spdlog::debug("Opened archive {} ({} entries)", path, archive->entries_.size());

    result.ok = true;
    result.archive = std::move(archive);
    return result;
}

bool ZipArchive::read_at(uint64_t offset, size_t size, std::vector<uint8_t>& out) const {
    if (offset > file_size_ || size > file_size_ - offset) {
        return false;
    }
    out.resize(size);
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file_) {
        return false;
    }
    if (size == 0) {
        return true;
    }
    file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    return static_cast<size_t>(file_.gcount()) == size;
}

// ============================================================================
// Listings
// ============================================================================

std::vector<std::string> ZipArchive::file_list() const {
    std::vector<std::string> files;
    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (entry.is_directory() || entry.path.empty()) continue;
        files.push_back(entry.path);
    }
    return files;
}

std::set<std::string> ZipArchive::file_set() const {
    auto files = file_list();
    return std::set<std::string>(files.begin(), files.end());
}

const ArchiveEntry* ZipArchive::find(const std::string& path) const {
    auto it = by_path_.find(path);
    if (it == by_path_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

// ============================================================================
// Entry Reading
// ============================================================================

ReadResult ZipArchive::read(const std::string& path) const {
    const ArchiveEntry* entry = find(path);
    if (!entry) {
        ReadResult result;
        result.error = "entry not found: " + path;
        return result;
    }
    return read_entry(*entry);
}

ReadResult ZipArchive::read_entry(const ArchiveEntry& entry) const {
    ReadResult result;

    if (entry.is_encrypted()) {
        result.error = "encrypted entry not supported: " + entry.path;
        return result;
    }

    if (entry.method != ZIP_METHOD_STORED && entry.method != ZIP_METHOD_DEFLATED) {
        result.error = "unsupported compression (" + compression_method_name(entry.method) +
                       "): " + entry.path;
        return result;
    }

    std::vector<uint8_t> local;
    if (!read_at(entry.local_header_offset, LOCAL_HEADER_SIZE, local) ||
        read_u32(local.data()) != LOCAL_HEADER_SIGNATURE) {
        result.error = "invalid local header: " + entry.path;
        return result;
    }

    // Local name/extra lengths may differ from the central directory copy
    uint64_t data_offset = entry.local_header_offset + LOCAL_HEADER_SIZE +
                           read_u16(local.data() + 26) + read_u16(local.data() + 28);

    if (entry.compressed_size > std::numeric_limits<size_t>::max()) {
        result.error = "entry too large: " + entry.path;
        return result;
    }

    std::vector<uint8_t> raw;
    if (!read_at(data_offset, static_cast<size_t>(entry.compressed_size), raw)) {
        result.error = "truncated entry data: " + entry.path;
        return result;
    }

    if (entry.method == ZIP_METHOD_STORED) {
        result.data = std::move(raw);
    } else if (!raw_inflate(raw, entry.uncompressed_size, result.data)) {
        result.error = "failed to inflate: " + entry.path;
        return result;
    }

    uint32_t crc = static_cast<uint32_t>(
        crc32(0, result.data.data(), static_cast<uInt>(result.data.size())));
    if (crc != entry.crc32) {
        result.data.clear();
        result.error = "crc mismatch: " + entry.path;
        return result;
    }

    result.ok = true;
    return result;
}

std::optional<std::string> ZipArchive::read_text(const std::string& path,
                                                 const std::string& encoding,
                                                 DecodePolicy policy) const {
    auto read_result = read(path);
    if (!read_result.ok) {
        spdlog::debug("Cannot read {} from {}: {}", path, path_, read_result.error);
        return std::nullopt;
    }
    return decode_text(read_result.data, encoding, policy);
}

} // namespace epubdiff
