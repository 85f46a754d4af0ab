#pragma once

#include "epubdiff/text.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace epubdiff {

// ============================================================================
// ZIP Constants
// ============================================================================

static constexpr uint16_t ZIP_METHOD_STORED = 0;
static constexpr uint16_t ZIP_METHOD_DEFLATED = 8;

// General purpose flag bit 0
static constexpr uint16_t ZIP_FLAG_ENCRYPTED = 0x0001;

// Human-readable name for a ZIP compression method
std::string compression_method_name(uint16_t method);

// ============================================================================
// Archive Entries
// ============================================================================

// One central-directory record
struct ArchiveEntry {
    std::string path;               // Normalized path (see normalize_path)
    std::string stored_name;        // Name exactly as recorded in the archive
    size_t index = 0;               // Position in the central directory listing
    uint16_t method = ZIP_METHOD_STORED;
    uint16_t flags = 0;
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;

    bool is_directory() const;
    bool is_stored() const { return method == ZIP_METHOD_STORED; }
    bool is_encrypted() const { return (flags & ZIP_FLAG_ENCRYPTED) != 0; }
};

struct ReadResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

class ZipArchive;

struct ArchiveOpenResult {
    bool ok = false;
    std::string error;
    std::unique_ptr<ZipArchive> archive;
};

// ============================================================================
// ZIP Archive Reader
// ============================================================================
//
// Read-only view of a ZIP container. The central directory is parsed once
// on open; entry payloads are read on demand from the underlying file, which
// stays open for the lifetime of the object and is closed on destruction.
//
// Supports stored and deflated entries and ZIP64 sizes/offsets. Encrypted
// entries and other compression methods produce read errors.

class ZipArchive {
public:
    // Open and index an archive. Fails if the file cannot be read or has no
    // valid end-of-central-directory record.
    static ArchiveOpenResult open(const std::string& path);

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    const std::string& path() const { return path_; }

    // All central-directory records in listing order (directories included)
    const std::vector<ArchiveEntry>& entries() const { return entries_; }

    // Normalized paths of non-directory entries, in listing order
    std::vector<std::string> file_list() const;

    // Normalized paths of non-directory entries, sorted and unique
    std::set<std::string> file_set() const;

    // Look up a non-directory entry by normalized path
    const ArchiveEntry* find(const std::string& path) const;
    bool contains(const std::string& path) const { return find(path) != nullptr; }

    // Read and decompress an entry
    ReadResult read(const std::string& path) const;
    ReadResult read_entry(const ArchiveEntry& entry) const;

    // Read an entry as text. Returns nullopt if the entry cannot be read;
    // decoding itself never fails (see decode_text).
    std::optional<std::string> read_text(const std::string& path,
                                         const std::string& encoding = "utf-8",
                                         DecodePolicy policy = DecodePolicy::Replace) const;

private:
    ZipArchive() = default;

    bool read_at(uint64_t offset, size_t size, std::vector<uint8_t>& out) const;

    std::string path_;
    mutable std::ifstream file_;
    uint64_t file_size_ = 0;
    std::vector<ArchiveEntry> entries_;
    std::unordered_map<std::string, size_t> by_path_;   // normalized path -> entries_ index
};

} // namespace epubdiff
