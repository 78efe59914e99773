#include "attest/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace attest {

namespace fs = std::filesystem;

namespace {

// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Generate a temporary filename
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

// Write all of `data`, retrying short writes and EINTR
bool write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

std::string errno_message(const std::string& what) {
    return what + ": " + std::string(strerror(errno));
}

} // namespace

TempWriteResult write_temp_file(const std::string& path, const std::string& content) {
    TempWriteResult result;
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = errno_message("failed to create temp file");
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        result.error = errno_message("failed to write content");
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    if (!fsync_fd(fd)) {
        result.error = errno_message("failed to fsync temp file");
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    close(fd);
    result.ok = true;
    result.temp_path = temp_path;
    return result;
}

AtomicWriteResult commit_temp_file(const std::string& temp_path, const std::string& path) {
    AtomicWriteResult result;

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = errno_message("failed to rename temp file");
        unlink(temp_path.c_str());
        return result;
    }

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    auto temp = write_temp_file(path, content);
    if (!temp.ok) {
        return AtomicWriteResult{false, temp.error};
    }
    return commit_temp_file(temp.temp_path, path);
}

AtomicWriteResult append_line_durable(const std::string& path, const std::string& line) {
    AtomicWriteResult result;

    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd < 0) {
        result.error = errno_message("failed to open " + path);
        return result;
    }

    std::string data = line + "\n";
    if (!write_all(fd, data.data(), data.size())) {
        result.error = errno_message("failed to append to " + path);
        close(fd);
        return result;
    }

    if (!fsync_fd(fd)) {
        result.error = errno_message("failed to fsync " + path);
        close(fd);
        return result;
    }

    close(fd);
    result.ok = true;
    return result;
}

AtomicWriteResult truncate_file(const std::string& path, std::uint64_t size) {
    AtomicWriteResult result;

    int fd = open(path.c_str(), O_WRONLY);
    if (fd < 0) {
        result.error = errno_message("failed to open " + path);
        return result;
    }
    if (ftruncate(fd, static_cast<off_t>(size)) != 0) {
        result.error = errno_message("failed to truncate " + path);
        close(fd);
        return result;
    }
    if (!fsync_fd(fd)) {
        result.error = errno_message("failed to fsync " + path);
        close(fd);
        return result;
    }
    close(fd);
    result.ok = true;
    return result;
}

// ============================================================================
// Path Utilities
// ============================================================================

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return buffer.str();
}

std::optional<std::uint64_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<std::uint64_t>(size);
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    if (rel.empty()) return base;
    return (fs::path(base) / rel).string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }
    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace attest
