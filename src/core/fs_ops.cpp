/*
 * POSIX-only file I/O for whole-image loads and saves
 * src/core/fs_ops.cpp
 */

#include "fs_ops.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <utility>
#include <vector>

namespace RomHex::FsOps {

namespace {

class ScopedFd {
   public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { reset(); }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Closes explicitly so a deferred write error is not lost.
    bool close(Error& err);

   private:
    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int fd_;
};

// Unlinks the temp file unless the rename went through.
class TempFileGuard {
   public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!committed_) {
            ::unlink(path_.c_str());
        }
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::string& path() const { return path_; }
    void commit() { committed_ = true; }

   private:
    std::string path_;
    bool committed_ = false;
};

void set_error(Error& err, const char* context, const std::string& path) {
    const int saved = errno;
    err.code = saved;
    err.message = path.empty() ? std::string(context) : std::string(context) + " " + path;
    err.message += std::string(": ") + std::strerror(saved);
}

bool ScopedFd::close(Error& err) {
    const int fd = fd_;
    fd_ = -1;
    if (fd >= 0 && ::close(fd) < 0 && errno != EINTR) {
        set_error(err, "close", std::string());
        return false;
    }
    return true;
}

std::string parent_of(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

bool read_into(int fd, std::uint8_t* dest, std::size_t size, std::size_t& bytesRead, Error& err) {
    bytesRead = 0;
    while (bytesRead < size) {
        const ssize_t n = ::read(fd, dest + bytesRead, size - bytesRead);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            set_error(err, "read", std::string());
            return false;
        }
        if (n == 0) {
            break;
        }
        bytesRead += static_cast<std::size_t>(n);
    }
    return true;
}

bool write_from(int fd, const std::uint8_t* data, std::size_t size, Error& err) {
    std::size_t written = 0;
    while (written < size) {
        const ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            set_error(err, "write", std::string());
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

// Makes the rename itself durable. Failure here is not fatal: the data is already in place.
void sync_directory(const std::string& dir) {
    ScopedFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.valid()) {
        ::fsync(fd.get());
    }
}

}  // namespace

bool stat_file(const std::string& path, FileStatus& out, Error& err) {
    err = {};
    struct stat st{};
    if (::stat(path.c_str(), &st) < 0) {
        set_error(err, "stat", path);
        return false;
    }
    out.size = static_cast<std::uint64_t>(st.st_size);
    out.isRegular = S_ISREG(st.st_mode);
    out.mtimeSec = static_cast<std::int64_t>(st.st_mtim.tv_sec);
    return true;
}

bool read_file_sized(const std::string& path, const AllocateCallback& allocate, std::size_t& bytesRead, Error& err) {
    err = {};
    bytesRead = 0;

    ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        set_error(err, "open", path);
        return false;
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) < 0) {
        set_error(err, "fstat", path);
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        err.code = EINVAL;
        err.message = path + " is not a regular file";
        return false;
    }

    const auto size = static_cast<std::size_t>(st.st_size);
    std::uint8_t* dest = allocate(size);
    if (!dest && size > 0) {
        err.code = ENOMEM;
        err.message = "unable to allocate " + std::to_string(size) + " bytes for " + path;
        return false;
    }
    if (size == 0) {
        return true;
    }
    if (!read_into(fd.get(), dest, size, bytesRead, err)) {
        err.message += " (" + path + ")";
        return false;
    }
    return true;
}

bool write_file_atomic(const std::string& path, const std::uint8_t* data, std::size_t size, Error& err) {
    err = {};

    const std::string dir = parent_of(path);
    if (!make_dir_parents(dir, err)) {
        return false;
    }

    std::string tmpl = path + ".XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');
    ScopedFd fd(::mkostemp(name.data(), O_CLOEXEC));
    if (!fd.valid()) {
        set_error(err, "mkstemp", path);
        return false;
    }
    TempFileGuard temp(name.data());

    // mkstemp creates 0600; a replaced image keeps its old mode.
    struct stat existing{};
    const mode_t mode = ::stat(path.c_str(), &existing) == 0 ? (existing.st_mode & 07777) : 0644;
    if (::fchmod(fd.get(), mode) < 0) {
        set_error(err, "chmod", temp.path());
        return false;
    }

    if (!write_from(fd.get(), data, size, err)) {
        err.message += " (" + temp.path() + ")";
        return false;
    }
    if (::fsync(fd.get()) < 0) {
        set_error(err, "fsync", temp.path());
        return false;
    }
    if (!fd.close(err)) {
        return false;
    }
    if (::rename(temp.path().c_str(), path.c_str()) < 0) {
        set_error(err, "rename", path);
        return false;
    }
    temp.commit();
    sync_directory(dir);
    return true;
}

bool make_dir_parents(const std::string& path, Error& err) {
    err = {};
    if (path.empty()) {
        return true;
    }

    // Walk each prefix ending at a separator, then the full path.
    std::size_t pos = path[0] == '/' ? 1 : 0;
    while (pos <= path.size()) {
        const std::size_t next = path.find('/', pos);
        const std::size_t end = next == std::string::npos ? path.size() : next;
        if (end > pos) {
            const std::string prefix = path.substr(0, end);
            struct stat st{};
            if (::stat(prefix.c_str(), &st) == 0) {
                if (!S_ISDIR(st.st_mode)) {
                    err.code = ENOTDIR;
                    err.message = prefix + " is not a directory";
                    return false;
                }
            }
            else if (::mkdir(prefix.c_str(), 0777) < 0 && errno != EEXIST) {
                set_error(err, "mkdir", prefix);
                return false;
            }
        }
        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
    }
    return true;
}

}  // namespace RomHex::FsOps
