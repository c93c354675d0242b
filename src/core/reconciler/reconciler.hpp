#pragma once

#include <cstdint>
#include <vector>
#include "adapters/source_stream.hpp"
#include "core/range/range_set.hpp"
#include "infra/error_handler/error.hpp"

namespace pagesync::core {

// Ordered, non-overlapping, page-aligned ranges to upload. Unlike RangeSet
// neighbouring entries may touch: each entry is one unit of work.
using WorkList = std::vector<ByteRange>;

struct ReconcileParams {
    std::uint64_t image_size = 0;
    std::uint64_t page_alignment = 512;
    std::uint64_t chunk_granularity = 4 * 1024 * 1024;
};

struct ReconcileReport {
    WorkList ranges;
    std::size_t candidate_count = 0;
    std::size_t empty_count = 0;
    std::uint64_t skipped_bytes = 0; // уже на стороне назначения
    std::uint64_t empty_bytes = 0;   // нулевые диапазоны

    [[nodiscard]] auto effective_bytes() const -> std::uint64_t { return total_length(ranges); }
};

// Partitions [0, image_size) on a chunk grid and removes the whole pages
// of `skip`. Partially present pages are uploaded again.
[[nodiscard]] auto locate_uploadable_ranges(const ReconcileParams& params, const RangeSet& skip)
    -> infra::Result<WorkList>;

// Drops candidates whose bytes are all zero. Any read failure aborts.
[[nodiscard]] auto eliminate_empty_ranges(adapters::SourceStream& stream, const WorkList& candidates)
    -> infra::Result<WorkList>;

[[nodiscard]] auto is_all_zero(std::span<const std::byte> data) -> bool;

// Both stages; the work list is final once this returns.
[[nodiscard]] auto reconcile(adapters::SourceStream& stream,
                             const ReconcileParams& params,
                             const RangeSet& skip)
    -> infra::Result<ReconcileReport>;

} // namespace pagesync::core
