#include "storage_client.hpp"
#include <spdlog/spdlog.h>

namespace pagesync::adapters {

auto list_existing_ranges(StorageClient& client) -> infra::Result<core::RangeSet> {
    core::RangeSet existing;
    std::string marker;
    std::size_t pages = 0;

    do {
        auto listing = client.list_page_ranges(marker);
        if (!listing) {
            return std::unexpected(std::move(listing.error()));
        }
        for (const auto& r : listing->ranges) {
            existing.insert(r);
        }
        marker = std::move(listing->next_marker);
        ++pages;
    } while (!marker.empty());

    spdlog::debug("Listed {} existing range(s) in {} page(s), {} bytes present",
                  existing.size(), pages, existing.total_length());
    return existing;
}

} // namespace pagesync::adapters
