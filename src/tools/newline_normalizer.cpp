#include "tools/newline_normalizer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace eolfix::tools {

using core::errors::ErrorCategory;
using core::errors::FixError;
using protocol::FileOutcome;

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(const int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }

    // Close explicitly so a failed close (e.g. deferred write error) is seen.
    int release_and_close() {
        const int fd = fd_;
        fd_ = -1;
        return close(fd);
    }

private:
    int fd_;
};

FixError io_error(const std::string& action, const std::string& path,
                  const int error_number, const std::string& code) {
    return FixError{ErrorCategory::Io,
                    action + " " + path + ": " + std::strerror(error_number),
                    code};
}

}  // namespace

core::errors::Result<FileOutcome> NewlineNormalizer::normalize(
    const std::string& path) const {
    struct stat info {};
    if (stat(path.c_str(), &info) != 0) {
        const int stat_errno = errno;
        if (stat_errno == ENOENT || stat_errno == ENOTDIR) {
            return FileOutcome::SkippedNotFound;
        }
        return io_error("failed to stat", path, stat_errno, "stat_failed");
    }
    if (S_ISDIR(info.st_mode)) {
        return io_error("failed to open", path, EISDIR, "is_directory");
    }
    if (info.st_size == 0) {
        return FileOutcome::SkippedEmpty;
    }

    FileDescriptor file(open(path.c_str(), O_RDWR | O_APPEND | O_CLOEXEC));
    if (file.get() < 0) {
        return io_error("failed to open", path, errno, "open_failed");
    }

    if (lseek(file.get(), -1, SEEK_END) < 0) {
        return io_error("failed to seek", path, errno, "seek_failed");
    }

    char last_byte = 0;
    ssize_t read_bytes = 0;
    do {
        read_bytes = read(file.get(), &last_byte, 1);
    } while (read_bytes < 0 && errno == EINTR);
    if (read_bytes < 0) {
        return io_error("failed to read", path, errno, "read_failed");
    }
    if (read_bytes == 0) {
        // Truncated between stat and read.
        return FileOutcome::SkippedEmpty;
    }

    if (last_byte == kNewlineByte) {
        return FileOutcome::Unchanged;
    }

    ssize_t written = 0;
    do {
        written = write(file.get(), &kNewlineByte, 1);
    } while (written < 0 && errno == EINTR);
    if (written != 1) {
        return io_error("failed to add newline to", path,
                        written < 0 ? errno : EIO, "write_failed");
    }

    if (file.release_and_close() != 0) {
        return io_error("failed to close", path, errno, "close_failed");
    }
    return FileOutcome::Repaired;
}

}  // namespace eolfix::tools
