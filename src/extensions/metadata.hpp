#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "adapters/storage_client.hpp"
#include "infra/error_handler/error.hpp"

namespace pagesync::extensions {

// Describes the local image an object was created from; stored in the
// object's metadata so a later session can check it is resuming the
// same image.
struct ImageMetadata {
    std::string file_name;
    std::uint64_t size = 0;
    std::int64_t modified_time = 0; // seconds since epoch
    std::string content_hash;       // xxh64, hex

    [[nodiscard]] auto to_map() const -> adapters::ObjectMetadata;

    // std::nullopt when the object carries no upload metadata
    [[nodiscard]] static auto from_map(const adapters::ObjectMetadata& map)
        -> infra::Result<std::optional<ImageMetadata>>;
};

[[nodiscard]] auto compute_local_metadata(const std::filesystem::path& path)
    -> infra::Result<ImageMetadata>;

// One PrecheckMismatch error per differing field; empty when they agree.
[[nodiscard]] auto compare_metadata(const ImageMetadata& remote, const ImageMetadata& local)
    -> std::vector<infra::Error>;

} // namespace pagesync::extensions
