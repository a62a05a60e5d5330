#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flowpack {

// ============================================================================
// Deterministic Archive (tar + gzip)
// ============================================================================
//
// Archives are byte-for-byte reproducible:
//   - entries sorted lexicographically, directories before files
//   - uid/gid 0, mtime 0, empty uname/gname
//   - gzip header with mtime 0, no file name, OS 255
//   - only regular files and directories

enum class TarEntryType {
    RegularFile,
    Directory,
};

struct TarEntry {
    std::string path;           // Relative path within archive, forward slashes
    TarEntryType type = TarEntryType::RegularFile;
    std::vector<uint8_t> data;  // File content (empty for directories)
};

struct ArchiveResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;  // The complete .tar.gz archive
};

// Build a file entry from text or bytes
TarEntry make_file_entry(const std::string& path, const std::string& content);
TarEntry make_file_entry(const std::string& path, std::vector<uint8_t> content);

// Add a Directory entry for every parent of every file entry that does not
// already have one. Entry order is irrelevant; the writer sorts.
void add_parent_directories(std::vector<TarEntry>& entries);

// Create a deterministic tar.gz from the given entries.
// Fails on duplicate paths, absolute paths, or ".." components.
ArchiveResult create_deterministic_archive(const std::vector<TarEntry>& entries);

struct ReadArchiveResult {
    bool ok = false;
    std::string error;
    std::vector<TarEntry> entries;  // In archive order
};

// Decompress and parse an archive entirely in memory
ReadArchiveResult read_archive_entries(const std::vector<uint8_t>& archive_data);

} // namespace flowpack
