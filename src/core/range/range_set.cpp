#include "range_set.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>

namespace pagesync::core {

ByteRange::ByteRange(std::uint64_t start, std::uint64_t end)
    : start_(start), end_(end)
{
    if (start > end) {
        throw std::invalid_argument(fmt::format("invalid range [{}, {}]", start, end));
    }
}

auto ByteRange::from_length(std::uint64_t start, std::uint64_t length) -> ByteRange {
    if (length == 0) {
        throw std::invalid_argument("range length must be positive");
    }
    return ByteRange{start, start + length - 1};
}

auto ByteRange::to_string() const -> std::string {
    return fmt::format("[{}, {}]", start_, end_);
}

RangeSet::RangeSet(std::initializer_list<ByteRange> ranges) {
    for (const auto& r : ranges) {
        insert(r);
    }
}

void RangeSet::insert(const ByteRange& range) {
    // Первый элемент, который пересекается или соприкасается с range
    auto it = std::lower_bound(ranges_.begin(), ranges_.end(), range.start(),
        [](const ByteRange& r, std::uint64_t start) { return r.end() + 1 < start; });

    std::uint64_t start = range.start();
    std::uint64_t end = range.end();
    auto first = it;
    while (it != ranges_.end() && it->start() <= end + 1) {
        start = std::min(start, it->start());
        end = std::max(end, it->end());
        ++it;
    }

    it = ranges_.erase(first, it);
    ranges_.insert(it, ByteRange{start, end});
}

auto RangeSet::subtract(const RangeSet& other) const -> RangeSet {
    RangeSet out;
    std::size_t j = 0;
    const auto& holes = other.ranges_;

    for (const auto& r : ranges_) {
        while (j < holes.size() && holes[j].end() < r.start()) {
            ++j;
        }

        std::uint64_t cursor = r.start();
        bool consumed = false;
        for (std::size_t k = j; k < holes.size() && holes[k].start() <= r.end(); ++k) {
            if (holes[k].start() > cursor) {
                out.ranges_.emplace_back(cursor, holes[k].start() - 1);
            }
            if (holes[k].end() >= r.end()) {
                consumed = true;
                break;
            }
            cursor = std::max(cursor, holes[k].end() + 1);
        }

        if (!consumed) {
            out.ranges_.emplace_back(cursor, r.end());
        }
    }
    return out;
}

auto RangeSet::aligned_inward(std::uint64_t alignment) const -> RangeSet {
    RangeSet out;
    for (const auto& r : ranges_) {
        const std::uint64_t start = (r.start() + alignment - 1) / alignment * alignment;
        const std::uint64_t end_exclusive = (r.end() + 1) / alignment * alignment;
        if (start < end_exclusive) {
            out.ranges_.emplace_back(start, end_exclusive - 1);
        }
    }
    return out;
}

bool RangeSet::contains(std::uint64_t offset) const {
    auto it = std::lower_bound(ranges_.begin(), ranges_.end(), offset,
        [](const ByteRange& r, std::uint64_t off) { return r.end() < off; });
    return it != ranges_.end() && it->start() <= offset;
}

bool RangeSet::overlaps(const ByteRange& range) const {
    auto it = std::lower_bound(ranges_.begin(), ranges_.end(), range.start(),
        [](const ByteRange& r, std::uint64_t start) { return r.end() < start; });
    return it != ranges_.end() && it->overlaps(range);
}

auto RangeSet::total_length() const -> std::uint64_t {
    return core::total_length(ranges_);
}

auto total_length(std::span<const ByteRange> ranges) -> std::uint64_t {
    std::uint64_t total = 0;
    for (const auto& r : ranges) {
        total += r.length();
    }
    return total;
}

} // namespace pagesync::core
