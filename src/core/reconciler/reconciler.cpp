#include "reconciler.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace pagesync::core {

namespace {

constexpr std::size_t kProbeBlockSize = 1024 * 1024;

auto validate(const ReconcileParams& params) -> infra::VoidResult {
    if (params.page_alignment == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "Page alignment must be positive"));
    }
    if (params.image_size % params.page_alignment != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Image size {} is not a multiple of the page alignment {}",
                        params.image_size, params.page_alignment)));
    }
    return {};
}

} // namespace

auto locate_uploadable_ranges(const ReconcileParams& params, const RangeSet& skip)
    -> infra::Result<WorkList>
{
    if (auto res = validate(params); !res) {
        return std::unexpected(std::move(res.error()));
    }

    WorkList out;
    if (params.image_size == 0) {
        return out;
    }

    // Размер чанка кратен странице, минимум одна страница
    const std::uint64_t page = params.page_alignment;
    const std::uint64_t chunk = std::max(page, params.chunk_granularity / page * page);

    const RangeSet whole{ByteRange{0, params.image_size - 1}};
    const RangeSet missing = whole.subtract(skip.aligned_inward(page));

    for (const auto& r : missing.ranges()) {
        std::uint64_t cursor = r.start();
        while (cursor <= r.end()) {
            const std::uint64_t cell_end = (cursor / chunk + 1) * chunk - 1;
            const std::uint64_t piece_end = std::min(r.end(), cell_end);
            out.emplace_back(cursor, piece_end);
            cursor = piece_end + 1;
        }
    }
    return out;
}

auto is_all_zero(std::span<const std::byte> data) -> bool {
    return std::all_of(data.begin(), data.end(), [](std::byte b) { return b == std::byte{0}; });
}

auto eliminate_empty_ranges(adapters::SourceStream& stream, const WorkList& candidates)
    -> infra::Result<WorkList>
{
    WorkList out;
    out.reserve(candidates.size());
    std::vector<std::byte> buffer;

    for (const auto& r : candidates) {
        if (auto res = stream.seek(r.start()); !res) {
            return std::unexpected(std::move(res.error()));
        }

        bool empty = true;
        std::uint64_t remaining = r.length();
        while (remaining > 0) {
            const auto block = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kProbeBlockSize));
            buffer.resize(block);
            if (auto res = adapters::read_exact(stream, buffer); !res) {
                return std::unexpected(std::move(res.error()));
            }
            if (!is_all_zero(buffer)) {
                empty = false;
                break; // остаток диапазона читать не нужно
            }
            remaining -= block;
        }

        if (!empty) {
            out.push_back(r);
        }
    }
    return out;
}

auto reconcile(adapters::SourceStream& stream,
               const ReconcileParams& params,
               const RangeSet& skip)
    -> infra::Result<ReconcileReport>
{
    if (params.image_size > stream.size()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Image size {} exceeds the source stream size {}", params.image_size, stream.size())));
    }

    auto candidates = locate_uploadable_ranges(params, skip);
    if (!candidates) {
        return std::unexpected(std::move(candidates.error()));
    }

    auto non_empty = eliminate_empty_ranges(stream, *candidates);
    if (!non_empty) {
        return std::unexpected(std::move(non_empty.error()));
    }

    ReconcileReport report;
    report.candidate_count = candidates->size();
    report.empty_count = candidates->size() - non_empty->size();
    report.skipped_bytes = params.image_size - total_length(*candidates);
    report.empty_bytes = total_length(*candidates) - total_length(*non_empty);
    report.ranges = std::move(*non_empty);

    spdlog::info("Reconciled {} candidate range(s): {} empty, {} to upload ({} bytes, {} already present)",
                 report.candidate_count, report.empty_count, report.ranges.size(),
                 report.effective_bytes(), report.skipped_bytes);
    return report;
}

} // namespace pagesync::core
