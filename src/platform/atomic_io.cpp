#include "flowpack/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace flowpack {

namespace fs = std::filesystem;

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

// Sibling temp file that is removed unless committed by a rename.
class StagedFile {
public:
    explicit StagedFile(const std::string& target)
        : path_(target + ".flowpack-" + generate_uuid().substr(0, 8)) {}

    ~StagedFile() {
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    const std::string& path() const { return path_; }
    void commit() { committed_ = true; }

private:
    std::string path_;
    bool committed_ = false;
};

#ifndef _WIN32
bool flush_to_disk(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// Best effort: makes a completed rename durable
void sync_directory(const std::string& dir) {
    if (dir.empty()) return;
    int fd = open(dir.c_str(), O_RDONLY);
    if (fd < 0) return;
    flush_to_disk(fd);
    close(fd);
}

bool write_fully(int fd, const uint8_t* data, size_t size) {
    size_t done = 0;
    while (done < size) {
        ssize_t n = write(fd, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}
#endif

template <typename Op>
bool fs_call(Op op) {
    std::error_code ec;
    op(ec);
    return !ec;
}

} // namespace

// ============================================================================
// Atomic File Operations
// ============================================================================

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;
    StagedFile staged(path);

#ifdef _WIN32
    {
        std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            result.error = "cannot write " + staged.path();
            return result;
        }
    }
    if (!MoveFileExA(staged.path().c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        result.error = "cannot replace " + path;
        return result;
    }
#else
    int fd = open(staged.path().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "cannot create " + staged.path() + ": " + errno_text();
        return result;
    }

    bool written = write_fully(fd, content.data(), content.size());
    std::string write_error = written ? "" : errno_text();
    bool synced = written && flush_to_disk(fd);
    close(fd);

    if (!written) {
        result.error = "cannot write " + staged.path() + ": " + write_error;
        return result;
    }
    if (!synced) {
        result.error = "cannot sync " + staged.path();
        return result;
    }
    if (std::rename(staged.path().c_str(), path.c_str()) != 0) {
        result.error = "cannot replace " + path + ": " + errno_text();
        return result;
    }
    sync_directory(get_parent_directory(path));
#endif

    staged.commit();
    result.ok = true;
    return result;
}

AtomicWriteResult atomic_create_directory(const std::string& path) {
    AtomicWriteResult result;
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.error = "cannot create directory " + path + ": " + ec.message();
        return result;
    }
#ifndef _WIN32
    sync_directory(get_parent_directory(path));
#endif
    result.ok = true;
    return result;
}

// ============================================================================
// File Reading
// ============================================================================

std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::optional<std::vector<uint8_t>> read_binary_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    return bytes;
}

// ============================================================================
// Path Utilities
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string portable(path);
    std::replace(portable.begin(), portable.end(), '\\', '/');
    return portable;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    return to_portable_path((fs::path(base) / rel).string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool create_directories(const std::string& path) {
    return fs_call([&](std::error_code& ec) { fs::create_directories(path, ec); });
}

bool remove_directory(const std::string& path) {
    return fs_call([&](std::error_code& ec) { fs::remove_all(path, ec); });
}

bool remove_file(const std::string& path) {
    return fs_call([&](std::error_code& ec) { fs::remove(path, ec); });
}

std::optional<std::string> create_temp_directory(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) return std::nullopt;

    // Name collisions are retried a few times before giving up
    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path dir = base / (prefix + generate_uuid().substr(0, 13));
        if (fs::create_directory(dir, ec) && !ec) {
            return to_portable_path(dir.string());
        }
    }
    return std::nullopt;
}

// ============================================================================
// Environment, Time, Identifiers
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* raw = nullptr;
    size_t len = 0;
    if (_dupenv_s(&raw, &len, name.c_str()) != 0 || raw == nullptr) {
        return std::nullopt;
    }
    std::string value(raw);
    free(raw);
    return value;
#else
    if (const char* raw = std::getenv(name.c_str())) {
        return std::string(raw);
    }
    return std::nullopt;
#endif
}

std::string format_timestamp(std::time_t seconds) {
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    char text[32];
    std::strftime(text, sizeof(text), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return text;
}

std::string get_current_timestamp() {
    return format_timestamp(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string generate_uuid() {
    std::random_device seed;
    std::mt19937_64 rng((static_cast<uint64_t>(seed()) << 32) ^ seed());

    uint64_t hi = rng();
    uint64_t lo = rng();

    // RFC 4122 version 4, variant 10
    hi = (hi & ~0xF000ULL) | 0x4000ULL;
    lo = (lo & (~0ULL >> 2)) | (1ULL << 63);

    char text[37];
    std::snprintf(text, sizeof(text), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return text;
}

} // namespace flowpack
