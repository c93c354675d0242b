#include "source_stream.hpp"
#include <cerrno>
#include <fmt/core.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pagesync::adapters {

auto read_exact(SourceStream& stream, std::span<std::byte> buffer) -> infra::VoidResult {
    std::size_t done = 0;
    while (done < buffer.size()) {
        auto n = stream.read(buffer.subspan(done));
        if (!n) {
            return std::unexpected(std::move(n.error()));
        }
        if (*n == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::SourceRead,
                fmt::format("Unexpected end of stream after {} of {} bytes", done, buffer.size())));
        }
        done += *n;
    }
    return {};
}

FileSourceStream::FileSourceStream(int fd, std::uint64_t size, std::filesystem::path path)
    : fd_(fd), size_(size), path_(std::move(path)) {}

FileSourceStream::~FileSourceStream() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

auto FileSourceStream::open(const std::filesystem::path& path)
    -> infra::Result<std::unique_ptr<FileSourceStream>>
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::SourceRead,
            fmt::format("Cannot open source {}", path.string()), errno));
    }

    struct stat sb;
    if (::fstat(fd, &sb) == -1) {
        const int err = errno;
        ::close(fd);
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::SourceRead,
            fmt::format("fstat failed for {}", path.string()), err));
    }

    return std::unique_ptr<FileSourceStream>(
        new FileSourceStream(fd, static_cast<std::uint64_t>(sb.st_size), path));
}

auto FileSourceStream::seek(std::uint64_t offset) -> infra::VoidResult {
    if (offset > size_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceRead,
            fmt::format("Seek to {} beyond end of {} ({} bytes)", offset, path_.string(), size_)));
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1)) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::SourceRead,
            fmt::format("lseek to {} failed", offset), errno));
    }
    return {};
}

auto FileSourceStream::read(std::span<std::byte> buffer) -> infra::Result<std::size_t> {
    for (;;) {
        ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return std::unexpected(infra::make_errno_error(infra::ErrorCode::SourceRead,
                fmt::format("read from {} failed", path_.string()), errno));
        }
    }
}

} // namespace pagesync::adapters
