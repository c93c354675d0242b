#include <gtest/gtest.h>
#include <random>
#include "core/reconciler/reconciler.hpp"
#include "test_support.hpp"

using namespace pagesync;
using core::ByteRange;
using core::RangeSet;
using core::ReconcileParams;
using fixtures::kMiB;
using fixtures::MemorySourceStream;

namespace {

auto params_for(std::uint64_t size) -> ReconcileParams {
    return ReconcileParams{.image_size = size, .page_alignment = 512, .chunk_granularity = 4 * kMiB};
}

} // namespace

TEST(ReconcilerTest, TenMiBImageSplitsIntoThreeChunks)
{
    MemorySourceStream stream{fixtures::patterned_image(10 * kMiB)};

    auto report = core::reconcile(stream, params_for(10 * kMiB), {});
    ASSERT_TRUE(report.has_value()) << report.error().message;

    ASSERT_EQ(report->ranges.size(), 3u);
    EXPECT_EQ(report->ranges[0], ByteRange::from_length(0, 4 * kMiB));
    EXPECT_EQ(report->ranges[1], ByteRange::from_length(4 * kMiB, 4 * kMiB));
    EXPECT_EQ(report->ranges[2], ByteRange::from_length(8 * kMiB, 2 * kMiB));
    EXPECT_EQ(report->effective_bytes(), 10 * kMiB);
    EXPECT_EQ(report->skipped_bytes, 0u);
}

TEST(ReconcilerTest, SkippedPrefixIsExcluded)
{
    MemorySourceStream stream{fixtures::patterned_image(10 * kMiB)};
    const RangeSet skip{ByteRange::from_length(0, 4 * kMiB)};

    auto report = core::reconcile(stream, params_for(10 * kMiB), skip);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    ASSERT_EQ(report->ranges.size(), 2u);
    for (const auto& r : report->ranges) {
        EXPECT_GE(r.start(), 4 * kMiB);
    }
    EXPECT_EQ(report->skipped_bytes, 4 * kMiB);
}

TEST(ReconcilerTest, RandomSkipSetsArePartitionedExactly)
{
    constexpr std::uint64_t page = 512;
    std::mt19937_64 rng(42);

    for (int round = 0; round < 200; ++round) {
        const std::uint64_t pages = 1 + rng() % 4096;
        const std::uint64_t size = pages * page;

        // Случайные непересекающиеся диапазоны, не обязательно выровненные
        RangeSet skip;
        std::uint64_t cursor = rng() % 2048;
        while (cursor < size) {
            const std::uint64_t len = 1 + rng() % (64 * page);
            const std::uint64_t end = std::min(size - 1, cursor + len - 1);
            skip.insert({cursor, end});
            cursor = end + 2 + rng() % (128 * page);
        }

        const ReconcileParams params{.image_size = size, .page_alignment = page,
                                     .chunk_granularity = (1 + rng() % 64) * page};
        auto work = core::locate_uploadable_ranges(params, skip);
        ASSERT_TRUE(work.has_value());

        const RangeSet aligned_skip = skip.aligned_inward(page);
        RangeSet covered = aligned_skip;
        std::uint64_t previous_end = 0;
        bool first = true;
        for (const auto& r : *work) {
            EXPECT_TRUE(r.is_aligned(page)) << r.to_string();
            EXPECT_LE(r.length(), params.chunk_granularity);
            EXPECT_FALSE(aligned_skip.overlaps(r)) << r.to_string();
            if (!first) {
                EXPECT_GT(r.start(), previous_end) << "ranges must be ordered and disjoint";
            }
            previous_end = r.end();
            first = false;
            covered.insert(r);
        }

        // Объединение с пропущенными страницами покрывает весь образ ровно один раз
        EXPECT_EQ(covered, RangeSet{ByteRange(0, size - 1)});
        EXPECT_EQ(core::total_length(*work) + aligned_skip.total_length(), size);
    }
}

TEST(ReconcilerTest, PartiallyPresentPagesAreSentAgain)
{
    const RangeSet skip{{100, 1100}};
    auto work = core::locate_uploadable_ranges(
        ReconcileParams{.image_size = 4096, .page_alignment = 512, .chunk_granularity = 4096}, skip);
    ASSERT_TRUE(work.has_value());

    ASSERT_EQ(work->size(), 2u);
    EXPECT_EQ((*work)[0], ByteRange(0, 511));
    EXPECT_EQ((*work)[1], ByteRange(1024, 4095));
}

TEST(ReconcilerTest, ZeroChunksAreDroppedAnywhere)
{
    constexpr std::uint64_t chunk = 4096;
    constexpr std::uint64_t size = 8 * chunk;

    for (std::uint64_t zero_index = 0; zero_index < 8; ++zero_index) {
        auto data = fixtures::patterned_image(size);
        std::fill_n(data.begin() + static_cast<std::ptrdiff_t>(zero_index * chunk), chunk, std::byte{0});
        // Один ненулевой байт в конце соседнего чанка сохраняет его
        const std::uint64_t neighbour = (zero_index + 1) % 8;
        std::fill_n(data.begin() + static_cast<std::ptrdiff_t>(neighbour * chunk), chunk, std::byte{0});
        data[neighbour * chunk + chunk - 1] = std::byte{1};

        MemorySourceStream stream{std::move(data)};
        auto report = core::reconcile(stream,
            ReconcileParams{.image_size = size, .page_alignment = 512, .chunk_granularity = chunk}, {});
        ASSERT_TRUE(report.has_value());

        EXPECT_EQ(report->ranges.size(), 7u);
        EXPECT_EQ(report->empty_count, 1u);
        EXPECT_EQ(report->empty_bytes, chunk);
        for (const auto& r : report->ranges) {
            EXPECT_NE(r.start(), zero_index * chunk);
        }
    }
}

TEST(ReconcilerTest, AllZeroImageHasNothingToUpload)
{
    MemorySourceStream stream{std::vector<std::byte>(2 * kMiB)};
    auto report = core::reconcile(stream, params_for(2 * kMiB), {});
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->ranges.empty());
    EXPECT_EQ(report->empty_bytes, 2 * kMiB);
}

TEST(ReconcilerTest, ReadFailureAbortsReconciliation)
{
    MemorySourceStream stream{fixtures::patterned_image(8 * kMiB)};
    stream.fail_reads_at(4 * kMiB + 100);

    auto report = core::reconcile(stream, params_for(8 * kMiB), {});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, infra::ErrorCode::SourceRead);
}

TEST(ReconcilerTest, RerunAfterFullSuccessIsEmpty)
{
    MemorySourceStream stream{fixtures::patterned_image(10 * kMiB)};

    auto first = core::reconcile(stream, params_for(10 * kMiB), {});
    ASSERT_TRUE(first.has_value());

    RangeSet uploaded;
    for (const auto& r : first->ranges) {
        uploaded.insert(r);
    }

    auto second = core::reconcile(stream, params_for(10 * kMiB), uploaded);
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->ranges.empty());
}

TEST(ReconcilerTest, MisalignedImageSizeIsRejected)
{
    MemorySourceStream stream{fixtures::patterned_image(1000)};
    auto report = core::reconcile(stream,
        ReconcileParams{.image_size = 1000, .page_alignment = 512, .chunk_granularity = 4096}, {});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, infra::ErrorCode::InvalidArgument);
}

TEST(ReconcilerTest, EmptyImageYieldsEmptyWorkList)
{
    MemorySourceStream stream{std::vector<std::byte>{}};
    auto report = core::reconcile(stream, params_for(0), {});
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->ranges.empty());
}

TEST(ReconcilerTest, ChunkSizeIsRoundedToPages)
{
    auto work = core::locate_uploadable_ranges(
        ReconcileParams{.image_size = 4096, .page_alignment = 512, .chunk_granularity = 1000}, {});
    ASSERT_TRUE(work.has_value());
    ASSERT_EQ(work->size(), 8u);
    for (const auto& r : *work) {
        EXPECT_EQ(r.length(), 512u);
    }
}
