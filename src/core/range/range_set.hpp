#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

namespace pagesync::core {

// Inclusive [start, end] offsets into the logical image.
class ByteRange {
public:
    ByteRange(std::uint64_t start, std::uint64_t end);

    [[nodiscard]] static auto from_length(std::uint64_t start, std::uint64_t length) -> ByteRange;

    [[nodiscard]] auto start() const -> std::uint64_t { return start_; }
    [[nodiscard]] auto end() const -> std::uint64_t { return end_; }
    [[nodiscard]] auto length() const -> std::uint64_t { return end_ - start_ + 1; }

    [[nodiscard]] bool overlaps(const ByteRange& other) const {
        return start_ <= other.end_ && other.start_ <= end_;
    }
    [[nodiscard]] bool is_aligned(std::uint64_t alignment) const {
        return start_ % alignment == 0 && (end_ + 1) % alignment == 0;
    }

    // "[start, end]"
    [[nodiscard]] auto to_string() const -> std::string;

    bool operator==(const ByteRange&) const = default;

private:
    std::uint64_t start_;
    std::uint64_t end_;
};

// Sorted, non-overlapping, coalesced set of ranges.
// Invariant: sorted by start; no two entries overlap or touch.
class RangeSet {
public:
    RangeSet() = default;
    RangeSet(std::initializer_list<ByteRange> ranges);

    // Insert a range and merge it with overlapping/adjacent entries.
    void insert(const ByteRange& range);

    // Ranges of *this not covered by `other`.
    [[nodiscard]] auto subtract(const RangeSet& other) const -> RangeSet;

    // Shrinks every entry to whole `alignment` units; entries smaller
    // than one unit disappear.
    [[nodiscard]] auto aligned_inward(std::uint64_t alignment) const -> RangeSet;

    [[nodiscard]] bool contains(std::uint64_t offset) const;
    [[nodiscard]] bool overlaps(const ByteRange& range) const;

    [[nodiscard]] auto ranges() const -> std::span<const ByteRange> { return ranges_; }
    [[nodiscard]] auto total_length() const -> std::uint64_t;
    [[nodiscard]] auto size() const -> std::size_t { return ranges_.size(); }
    [[nodiscard]] bool empty() const { return ranges_.empty(); }

    bool operator==(const RangeSet&) const = default;

private:
    std::vector<ByteRange> ranges_;
};

[[nodiscard]] auto total_length(std::span<const ByteRange> ranges) -> std::uint64_t;

} // namespace pagesync::core
