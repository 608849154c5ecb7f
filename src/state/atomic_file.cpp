/*
 * Atomic file replacement implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/state/atomic_file.hpp>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace devdeck {

std::filesystem::path temp_path_for(const std::filesystem::path& target) {
    std::filesystem::path tmp = target;
    tmp += ".tmp";
    return tmp;
}

static ExecError io_error(const std::string& what, const std::filesystem::path& p, int err) {
    return ExecError{ErrorKind::Io, what + " " + p.string() + ": " + std::strerror(err)};
}

std::optional<ExecError> write_file_atomic(const std::filesystem::path& target, const std::string& content) {
    std::filesystem::path tmp = temp_path_for(target);
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return io_error("open", tmp, errno);

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            return io_error("write", tmp, e);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        int e = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        return io_error("fsync", tmp, e);
    }
    if (::close(fd) != 0) {
        int e = errno;
        ::unlink(tmp.c_str());
        return io_error("close", tmp, e);
    }
    if (std::rename(tmp.c_str(), target.c_str()) != 0) {
        int e = errno;
        ::unlink(tmp.c_str());
        return io_error("rename", target, e);
    }
    return std::nullopt;
}

} // namespace devdeck
