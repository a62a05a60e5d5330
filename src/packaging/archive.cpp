#include "flowpack/archive.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <optional>
#include <set>
#include <utility>

#include <zlib.h>

namespace flowpack {

namespace {

// ============================================================================
// ustar Header Layout
// ============================================================================

constexpr size_t BLOCK_SIZE = 512;
using HeaderBlock = std::array<uint8_t, BLOCK_SIZE>;

struct Field {
    size_t offset;
    size_t size;
};

constexpr Field NAME{0, 100};
constexpr Field MODE{100, 8};
constexpr Field UID{108, 8};
constexpr Field GID{116, 8};
constexpr Field SIZE{124, 12};
constexpr Field MTIME{136, 12};
constexpr Field CHECKSUM{148, 8};
constexpr Field TYPEFLAG{156, 1};
constexpr Field MAGIC{257, 6};
constexpr Field VERSION{263, 2};
constexpr Field PREFIX{345, 155};

constexpr uint8_t TYPE_FILE = '0';
constexpr uint8_t TYPE_DIR = '5';

void put_bytes(HeaderBlock& block, Field field, const std::string& value) {
    std::memcpy(block.data() + field.offset, value.data(), std::min(value.size(), field.size));
}

// Zero-padded octal filling all but the last byte, which stays NUL
void put_octal(HeaderBlock& block, Field field, uint64_t value) {
    uint8_t* out = block.data() + field.offset;
    for (size_t i = field.size - 1; i > 0; --i) {
        out[i - 1] = static_cast<uint8_t>('0' + (value & 7));
        value >>= 3;
    }
    out[field.size - 1] = '\0';
}

std::string get_text(const uint8_t* header, Field field) {
    const char* begin = reinterpret_cast<const char*>(header + field.offset);
    return std::string(begin, strnlen(begin, field.size));
}

uint64_t get_octal(const uint8_t* header, Field field) {
    uint64_t value = 0;
    for (size_t i = 0; i < field.size; ++i) {
        uint8_t c = header[field.offset + i];
        if (c == '\0' || c == ' ') break;
        if (c < '0' || c > '7') continue;
        value = (value << 3) | static_cast<uint64_t>(c - '0');
    }
    return value;
}

// Paths over 99 bytes are split at a '/' into prefix (<= 154) and name (<= 99)
bool split_ustar_path(const std::string& path, std::string& prefix, std::string& name) {
    if (path.size() < NAME.size) {
        prefix.clear();
        name = path;
        return true;
    }
    for (size_t slash = path.rfind('/'); slash != std::string::npos && slash > 0;
         slash = path.rfind('/', slash - 1)) {
        size_t tail = path.size() - slash - 1;
        if (slash < PREFIX.size && tail < NAME.size) {
            prefix = path.substr(0, slash);
            name = path.substr(slash + 1);
            return true;
        }
    }
    return false;
}

std::optional<HeaderBlock> encode_header(const TarEntry& entry) {
    bool is_dir = entry.type == TarEntryType::Directory;
    std::string path = entry.path;
    if (is_dir && path.back() != '/') path += '/';

    std::string prefix;
    std::string name;
    if (!split_ustar_path(path, prefix, name)) return std::nullopt;

    HeaderBlock block{};
    put_bytes(block, NAME, name);
    put_bytes(block, PREFIX, prefix);
    put_octal(block, MODE, is_dir ? 0755 : 0644);
    put_octal(block, UID, 0);
    put_octal(block, GID, 0);
    put_octal(block, SIZE, is_dir ? 0 : entry.data.size());
    put_octal(block, MTIME, 0);
    block[TYPEFLAG.offset] = is_dir ? TYPE_DIR : TYPE_FILE;
    put_bytes(block, MAGIC, std::string("ustar", 6));
    put_bytes(block, VERSION, "00");

    // Checksum is computed with its own field blank, then stored as
    // six octal digits, NUL, space
    std::fill_n(block.begin() + CHECKSUM.offset, CHECKSUM.size, ' ');
    uint32_t sum = 0;
    for (uint8_t byte : block) sum += byte;
    char digits[8];
    std::snprintf(digits, sizeof(digits), "%06o", sum);
    std::memcpy(block.data() + CHECKSUM.offset, digits, 6);
    block[CHECKSUM.offset + 6] = '\0';
    block[CHECKSUM.offset + 7] = ' ';
    return block;
}

// ============================================================================
// Gzip
// ============================================================================
//
// zlib runs in raw deflate mode; the 10-byte header and the CRC32/ISIZE
// trailer are written here so the header carries mtime 0 and OS 255.

constexpr uint8_t GZIP_HEADER[10] = {0x1f, 0x8b, 0x08, 0x00, 0, 0, 0, 0, 0x00, 0xff};

class DeflateStream {
public:
    DeflateStream() {
        ok_ = deflateInit2(&z_, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                           Z_DEFAULT_STRATEGY) == Z_OK;
    }
    ~DeflateStream() {
        if (ok_) deflateEnd(&z_);
    }
    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    bool ok() const { return ok_; }
    z_stream* get() { return &z_; }

private:
    z_stream z_{};
    bool ok_ = false;
};

class InflateStream {
public:
    InflateStream() { ok_ = inflateInit2(&z_, -MAX_WBITS) == Z_OK; }
    ~InflateStream() {
        if (ok_) inflateEnd(&z_);
    }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    bool ok() const { return ok_; }
    z_stream* get() { return &z_; }

private:
    z_stream z_{};
    bool ok_ = false;
};

void append_le32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(value >> (8 * i)));
}

uint32_t read_le32(const uint8_t* in) {
    return static_cast<uint32_t>(in[0]) | (static_cast<uint32_t>(in[1]) << 8) |
           (static_cast<uint32_t>(in[2]) << 16) | (static_cast<uint32_t>(in[3]) << 24);
}

bool gzip_compress(const std::vector<uint8_t>& input, std::vector<uint8_t>& out) {
    DeflateStream stream;
    if (!stream.ok()) return false;
    z_stream* z = stream.get();

    out.assign(std::begin(GZIP_HEADER), std::end(GZIP_HEADER));
    z->next_in = const_cast<Bytef*>(input.data());
    z->avail_in = static_cast<uInt>(input.size());

    std::array<uint8_t, 32768> chunk;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        z->next_out = chunk.data();
        z->avail_out = static_cast<uInt>(chunk.size());
        ret = deflate(z, Z_FINISH);
        if (ret == Z_STREAM_ERROR) return false;
        out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - z->avail_out));
    }

    append_le32(out, static_cast<uint32_t>(crc32(0, input.data(), static_cast<uInt>(input.size()))));
    append_le32(out, static_cast<uint32_t>(input.size()));
    return true;
}

// Offset of the deflate payload, skipping optional FEXTRA/FNAME/FCOMMENT/FHCRC
std::optional<size_t> gzip_payload_offset(const std::vector<uint8_t>& data) {
    if (data.size() < 18 || data[0] != 0x1f || data[1] != 0x8b || data[2] != 0x08) {
        return std::nullopt;
    }
    uint8_t flags = data[3];
    size_t pos = sizeof(GZIP_HEADER);

    auto skip_cstring = [&]() {
        while (pos < data.size() && data[pos] != 0) ++pos;
        ++pos;
    };

    if (flags & 0x04) {
        if (pos + 2 > data.size()) return std::nullopt;
        pos += 2 + static_cast<size_t>(data[pos] | (data[pos + 1] << 8));
    }
    if (flags & 0x08) skip_cstring();
    if (flags & 0x10) skip_cstring();
    if (flags & 0x02) pos += 2;

    if (pos + 8 > data.size()) return std::nullopt;
    return pos;
}

bool gzip_decompress(const std::vector<uint8_t>& data, std::vector<uint8_t>& out,
                     std::string& error) {
    auto payload = gzip_payload_offset(data);
    if (!payload) {
        error = "not a gzip stream";
        return false;
    }

    InflateStream stream;
    if (!stream.ok()) {
        error = "cannot initialise inflate";
        return false;
    }
    z_stream* z = stream.get();
    z->next_in = const_cast<Bytef*>(data.data() + *payload);
    z->avail_in = static_cast<uInt>(data.size() - *payload - 8);

    out.clear();
    std::array<uint8_t, 32768> chunk;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        z->next_out = chunk.data();
        z->avail_out = static_cast<uInt>(chunk.size());
        ret = inflate(z, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            error = "corrupt deflate stream";
            return false;
        }
        size_t produced = chunk.size() - z->avail_out;
        out.insert(out.end(), chunk.data(), chunk.data() + produced);
        if (ret == Z_OK && z->avail_in == 0 && produced == 0) {
            error = "truncated deflate stream";
            return false;
        }
    }

    const uint8_t* trailer = data.data() + data.size() - 8;
    uint32_t crc = static_cast<uint32_t>(crc32(0, out.data(), static_cast<uInt>(out.size())));
    if (read_le32(trailer) != crc) {
        error = "gzip CRC mismatch";
        return false;
    }
    if (read_le32(trailer + 4) != static_cast<uint32_t>(out.size())) {
        error = "gzip length mismatch";
        return false;
    }
    return true;
}

// ============================================================================
// Entry Ordering and Validation
// ============================================================================

std::string sort_key(const TarEntry& entry) {
    std::string path = entry.path;
    if (entry.type == TarEntryType::Directory && !path.empty() && path.back() != '/') {
        path += '/';
    }
    return path;
}

// Split a path into (is_file, name) steps. Every step but the last is a
// directory; the last is a directory only for Directory entries.
std::vector<std::pair<bool, std::string>> order_steps(const TarEntry& entry) {
    std::vector<std::pair<bool, std::string>> steps;
    std::string path = sort_key(entry);
    size_t start = 0;
    while (start < path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            steps.emplace_back(true, path.substr(start));
            break;
        }
        steps.emplace_back(false, path.substr(start, end - start));
        start = end + 1;
    }
    return steps;
}

// Parents before children, and within one directory subdirectories before
// files, each group in byte order
bool compare_entries(const TarEntry& a, const TarEntry& b) {
    return order_steps(a) < order_steps(b);
}

bool is_safe_entry_path(const std::string& path) {
    if (path.empty() || path[0] == '/' || path.find('\\') != std::string::npos) {
        return false;
    }
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0) return false;
        start = end + 1;
    }
    return true;
}

std::string strip_entry_path(std::string path) {
    while (!path.empty() && path.back() == '/') path.pop_back();
    if (path.rfind("./", 0) == 0) path.erase(0, 2);
    return path;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

TarEntry make_file_entry(const std::string& path, const std::string& content) {
    return make_file_entry(path, std::vector<uint8_t>(content.begin(), content.end()));
}

TarEntry make_file_entry(const std::string& path, std::vector<uint8_t> content) {
    TarEntry entry;
    entry.path = path;
    entry.type = TarEntryType::RegularFile;
    entry.data = std::move(content);
    return entry;
}

void add_parent_directories(std::vector<TarEntry>& entries) {
    std::set<std::string> dirs;
    for (const auto& entry : entries) {
        if (entry.type == TarEntryType::Directory) {
            dirs.insert(strip_entry_path(entry.path));
        }
    }

    std::vector<TarEntry> added;
    for (const auto& entry : entries) {
        for (size_t slash = entry.path.find('/'); slash != std::string::npos;
             slash = entry.path.find('/', slash + 1)) {
            std::string parent = entry.path.substr(0, slash);
            if (!parent.empty() && dirs.insert(parent).second) {
                TarEntry dir;
                dir.path = parent;
                dir.type = TarEntryType::Directory;
                added.push_back(std::move(dir));
            }
        }
    }
    std::move(added.begin(), added.end(), std::back_inserter(entries));
}

ArchiveResult create_deterministic_archive(const std::vector<TarEntry>& entries) {
    ArchiveResult result;

    std::set<std::string> seen;
    for (const auto& entry : entries) {
        if (!is_safe_entry_path(entry.path)) {
            result.error = "invalid archive entry path: " + entry.path;
            return result;
        }
        if (!seen.insert(sort_key(entry)).second) {
            result.error = "duplicate archive entry: " + entry.path;
            return result;
        }
    }

    std::vector<const TarEntry*> ordered;
    ordered.reserve(entries.size());
    for (const auto& entry : entries) ordered.push_back(&entry);
    std::sort(ordered.begin(), ordered.end(),
              [](const TarEntry* a, const TarEntry* b) { return compare_entries(*a, *b); });

    std::vector<uint8_t> tar;
    for (const TarEntry* entry : ordered) {
        auto header = encode_header(*entry);
        if (!header) {
            result.error = "archive entry path too long: " + entry->path;
            return result;
        }
        tar.insert(tar.end(), header->begin(), header->end());

        if (entry->type == TarEntryType::RegularFile && !entry->data.empty()) {
            tar.insert(tar.end(), entry->data.begin(), entry->data.end());
            size_t tail = entry->data.size() % BLOCK_SIZE;
            if (tail != 0) tar.insert(tar.end(), BLOCK_SIZE - tail, 0);
        }
    }
    // End-of-archive marker
    tar.insert(tar.end(), BLOCK_SIZE * 2, 0);

    if (!gzip_compress(tar, result.archive_data)) {
        result.archive_data.clear();
        result.error = "gzip compression failed";
        return result;
    }

    result.ok = true;
    return result;
}

ReadArchiveResult read_archive_entries(const std::vector<uint8_t>& archive_data) {
    ReadArchiveResult result;

    std::vector<uint8_t> tar;
    if (!gzip_decompress(archive_data, tar, result.error)) {
        return result;
    }

    size_t pos = 0;
    while (pos + BLOCK_SIZE <= tar.size()) {
        const uint8_t* header = tar.data() + pos;
        if (std::all_of(header, header + BLOCK_SIZE, [](uint8_t b) { return b == 0; })) {
            break;
        }

        std::string prefix = get_text(header, PREFIX);
        std::string path = strip_entry_path((prefix.empty() ? "" : prefix + "/") +
                                            get_text(header, NAME));

        uint8_t type = header[TYPEFLAG.offset];
        if (type == '\0') type = TYPE_FILE;
        if (type != TYPE_FILE && type != TYPE_DIR) {
            result.error = "unsupported entry type: " + path;
            return result;
        }
        if (!is_safe_entry_path(path)) {
            result.error = "invalid archive entry path: " + path;
            return result;
        }

        uint64_t size = get_octal(header, SIZE);
        pos += BLOCK_SIZE;

        TarEntry entry;
        entry.path = path;
        if (type == TYPE_DIR) {
            entry.type = TarEntryType::Directory;
        } else {
            if (size > tar.size() - pos) {
                result.error = "truncated archive: " + path;
                return result;
            }
            entry.type = TarEntryType::RegularFile;
            entry.data.assign(tar.begin() + static_cast<std::ptrdiff_t>(pos),
                              tar.begin() + static_cast<std::ptrdiff_t>(pos + size));
            pos += static_cast<size_t>((size + BLOCK_SIZE - 1) / BLOCK_SIZE * BLOCK_SIZE);
        }
        result.entries.push_back(std::move(entry));
    }

    result.ok = true;
    return result;
}

} // namespace flowpack
