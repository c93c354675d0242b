#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "core/range/range_set.hpp"
#include "infra/error_handler/error.hpp"

namespace pagesync::adapters {

using ObjectMetadata = std::map<std::string, std::string>;

struct ObjectProperties {
    std::uint64_t size = 0;
    ObjectMetadata metadata;
    std::optional<std::string> content_hash; // выставляется только после успешной загрузки
};

// One page of a paginated listing; empty next_marker ends the listing.
struct PageRangeListing {
    std::vector<core::ByteRange> ranges;
    std::string next_marker;
};

// Destination page store: one object addressed in page-aligned units.
// Implementations must be safe to call from several upload workers at once.
class StorageClient {
public:
    virtual ~StorageClient() = default;

    // std::nullopt if the object does not exist yet
    [[nodiscard]] virtual auto get_properties()
        -> infra::Result<std::optional<ObjectProperties>> = 0;

    // Creates (or truncates and recreates) the object.
    [[nodiscard]] virtual auto create_object(std::uint64_t size, const ObjectMetadata& metadata)
        -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto list_page_ranges(std::string_view marker)
        -> infra::Result<PageRangeListing> = 0;

    // Returns only once the write is durable at the destination.
    [[nodiscard]] virtual auto write_pages(std::uint64_t offset, std::span<const std::byte> data)
        -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto set_content_hash(std::string_view hash) -> infra::VoidResult = 0;
};

// Drains the paginated listing into a single coalesced set.
[[nodiscard]] auto list_existing_ranges(StorageClient& client) -> infra::Result<core::RangeSet>;

} // namespace pagesync::adapters
