#include <charconv>
#include <chrono>
#include <filesystem>
#include <fmt/core.h>
#include "metadata.hpp"
#include "infra/hash/xxhash_digest.hpp"

namespace pagesync::extensions {

namespace {

constexpr const char* kFileName = "pagesync_file_name";
constexpr const char* kSize = "pagesync_size";
constexpr const char* kModified = "pagesync_modified_time";
constexpr const char* kHash = "pagesync_content_hash";

template<typename T>
auto parse_number(const std::string& key, const std::string& text) -> infra::Result<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PrecheckMismatch,
            fmt::format("Malformed upload metadata {}='{}'", key, text)));
    }
    return value;
}

} // namespace

auto ImageMetadata::to_map() const -> adapters::ObjectMetadata {
    return {
        {kFileName, file_name},
        {kSize, std::to_string(size)},
        {kModified, std::to_string(modified_time)},
        {kHash, content_hash},
    };
}

auto ImageMetadata::from_map(const adapters::ObjectMetadata& map)
    -> infra::Result<std::optional<ImageMetadata>>
{
    auto size_it = map.find(kSize);
    auto hash_it = map.find(kHash);
    if (size_it == map.end() || hash_it == map.end()) {
        return std::optional<ImageMetadata>{};
    }

    ImageMetadata meta;
    meta.content_hash = hash_it->second;

    auto size = parse_number<std::uint64_t>(kSize, size_it->second);
    if (!size) return std::unexpected(std::move(size.error()));
    meta.size = *size;

    if (auto it = map.find(kModified); it != map.end()) {
        auto modified = parse_number<std::int64_t>(kModified, it->second);
        if (!modified) return std::unexpected(std::move(modified.error()));
        meta.modified_time = *modified;
    }
    if (auto it = map.find(kFileName); it != map.end()) {
        meta.file_name = it->second;
    }
    return std::optional<ImageMetadata>{std::move(meta)};
}

auto compute_local_metadata(const std::filesystem::path& path) -> infra::Result<ImageMetadata> {
    std::error_code ec;

    ImageMetadata meta;
    meta.file_name = path.filename().string();

    meta.size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceRead,
            fmt::format("Cannot stat {}: {}", path.string(), ec.message())));
    }

    // Временные метки
    auto time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceRead,
            fmt::format("Cannot read modification time of {}: {}", path.string(), ec.message())));
    }
    const auto sys_time = std::chrono::file_clock::to_sys(time);
    meta.modified_time = std::chrono::duration_cast<std::chrono::seconds>(
        sys_time.time_since_epoch()).count();

    auto hash = infra::XXHashDigest::hash_file(path);
    if (!hash) {
        return std::unexpected(std::move(hash.error()));
    }
    meta.content_hash = infra::XXHashDigest::to_hex(*hash);
    return meta;
}

auto compare_metadata(const ImageMetadata& remote, const ImageMetadata& local)
    -> std::vector<infra::Error>
{
    std::vector<infra::Error> errors;
    if (remote.size != local.size) {
        errors.push_back(infra::make_error(infra::ErrorCode::PrecheckMismatch,
            fmt::format("Image size differs: object was created for {} bytes, local image has {} bytes",
                        remote.size, local.size)));
    }
    if (remote.content_hash != local.content_hash) {
        errors.push_back(infra::make_error(infra::ErrorCode::PrecheckMismatch,
            fmt::format("Image content hash differs: object {} vs local {}",
                        remote.content_hash, local.content_hash)));
    }
    if (remote.modified_time != local.modified_time) {
        errors.push_back(infra::make_error(infra::ErrorCode::PrecheckMismatch,
            fmt::format("Image modification time differs: object {} vs local {}",
                        remote.modified_time, local.modified_time)));
    }
    return errors;
}

} // namespace pagesync::extensions
