#include "common/file_io.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace kvcache {

namespace {

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data,
                                        std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

} // anonymous namespace

std::error_code read_file(const std::filesystem::path& path, std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return {errno, std::system_category()};
    }

    out.clear();
    char buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            std::error_code ec{errno, std::system_category()};
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }

    ::close(fd);
    return {};
}

std::error_code write_file_atomic(const std::filesystem::path& path,
                                  std::string_view data) {
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return {errno, std::system_category()};
    }

    std::error_code ignored;
    if (auto ec = write_all(fd, data.data(), data.size())) {
        ::close(fd);
        std::filesystem::remove(tmp_path, ignored);
        return ec;
    }

    if (::fsync(fd) < 0) {
        std::error_code ec{errno, std::system_category()};
        ::close(fd);
        std::filesystem::remove(tmp_path, ignored);
        return ec;
    }

    if (::close(fd) < 0) {
        std::error_code ec{errno, std::system_category()};
        std::filesystem::remove(tmp_path, ignored);
        return ec;
    }

    // Rename .tmp → final path.
    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        std::filesystem::remove(tmp_path, ignored);
        return rename_ec;
    }
    return {};
}

} // namespace kvcache
