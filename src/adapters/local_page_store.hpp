#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include "storage_client.hpp"

namespace pagesync::adapters {

// StorageClient backed by a local directory: a sparse data file holds the
// object, a YAML sidecar holds its size, metadata, content hash and the set
// of pages written so far. The sidecar is rewritten after every
// acknowledged write, so listed ranges are always durable.
class LocalPageStore final : public StorageClient {
public:
    LocalPageStore(std::filesystem::path directory,
                   std::string object_name,
                   std::uint64_t page_size = 512,
                   std::size_t ranges_per_listing = 512);
    ~LocalPageStore() override;

    LocalPageStore(const LocalPageStore&) = delete;
    LocalPageStore& operator=(const LocalPageStore&) = delete;

    [[nodiscard]] auto get_properties()
        -> infra::Result<std::optional<ObjectProperties>> override;
    [[nodiscard]] auto create_object(std::uint64_t size, const ObjectMetadata& metadata)
        -> infra::VoidResult override;
    [[nodiscard]] auto list_page_ranges(std::string_view marker)
        -> infra::Result<PageRangeListing> override;
    [[nodiscard]] auto write_pages(std::uint64_t offset, std::span<const std::byte> data)
        -> infra::VoidResult override;
    [[nodiscard]] auto set_content_hash(std::string_view hash) -> infra::VoidResult override;

    [[nodiscard]] auto data_path() const -> std::filesystem::path { return directory_ / object_name_; }
    [[nodiscard]] auto sidecar_path() const -> std::filesystem::path {
        return directory_ / (object_name_ + ".pagesync.yaml");
    }

private:
    struct State {
        std::uint64_t size = 0;
        ObjectMetadata metadata;
        std::optional<std::string> content_hash;
        core::RangeSet written;
    };

    auto load_locked_() -> infra::VoidResult;
    auto save_locked_() -> infra::VoidResult;
    auto open_data_locked_(bool truncate) -> infra::VoidResult;

    const std::filesystem::path directory_;
    const std::string object_name_;
    const std::uint64_t page_size_;
    const std::size_t ranges_per_listing_;

    std::mutex mutex_;
    bool loaded_ = false;
    std::optional<State> state_;
    int fd_ = -1;
};

} // namespace pagesync::adapters
