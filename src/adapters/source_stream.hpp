#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include "infra/error_handler/error.hpp"

namespace pagesync::adapters {

// Seekable byte source over the logical image. Format parsing happens
// behind this interface.
class SourceStream {
public:
    virtual ~SourceStream() = default;

    [[nodiscard]] virtual auto size() const -> std::uint64_t = 0;
    [[nodiscard]] virtual auto seek(std::uint64_t offset) -> infra::VoidResult = 0;

    // Reads up to buffer.size() bytes; 0 means end of stream.
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> = 0;
};

// Fills the whole buffer or fails with ErrorCode::SourceRead.
[[nodiscard]] auto read_exact(SourceStream& stream, std::span<std::byte> buffer)
    -> infra::VoidResult;

class FileSourceStream final : public SourceStream {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> infra::Result<std::unique_ptr<FileSourceStream>>;

    ~FileSourceStream() override;

    FileSourceStream(const FileSourceStream&) = delete;
    FileSourceStream& operator=(const FileSourceStream&) = delete;

    [[nodiscard]] auto size() const -> std::uint64_t override { return size_; }
    [[nodiscard]] auto seek(std::uint64_t offset) -> infra::VoidResult override;
    [[nodiscard]] auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> override;

private:
    FileSourceStream(int fd, std::uint64_t size, std::filesystem::path path);

    int fd_;
    std::uint64_t size_;
    std::filesystem::path path_;
};

} // namespace pagesync::adapters
