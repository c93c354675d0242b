#include <gtest/gtest.h>
#include <fstream>
#include "extensions/metadata.hpp"
#include "infra/hash/xxhash_digest.hpp"
#include "test_support.hpp"

using namespace pagesync;
using extensions::ImageMetadata;

namespace {

auto sample() -> ImageMetadata {
    return ImageMetadata{.file_name = "disk.img", .size = 4096, .modified_time = 1700000000,
                         .content_hash = "0123456789abcdef"};
}

} // namespace

TEST(MetadataTest, MapRoundTripKeepsEveryField)
{
    const auto meta = sample();
    auto parsed = ImageMetadata::from_map(meta.to_map());
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(parsed->has_value());
    EXPECT_EQ((*parsed)->file_name, meta.file_name);
    EXPECT_EQ((*parsed)->size, meta.size);
    EXPECT_EQ((*parsed)->modified_time, meta.modified_time);
    EXPECT_EQ((*parsed)->content_hash, meta.content_hash);
}

TEST(MetadataTest, ForeignMetadataIsAbsent)
{
    auto parsed = ImageMetadata::from_map({{"owner", "someone"}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->has_value());
}

TEST(MetadataTest, MalformedSizeIsPrecheckMismatch)
{
    auto map = sample().to_map();
    map["pagesync_size"] = "12ab";
    auto parsed = ImageMetadata::from_map(map);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, infra::ErrorCode::PrecheckMismatch);
}

TEST(MetadataTest, CompareReportsEachDifference)
{
    auto local = sample();
    EXPECT_TRUE(extensions::compare_metadata(sample(), local).empty());

    local.size = 8192;
    local.content_hash = "fedcba9876543210";
    auto errors = extensions::compare_metadata(sample(), local);
    ASSERT_EQ(errors.size(), 2u);
    for (const auto& e : errors) {
        EXPECT_EQ(e.code, infra::ErrorCode::PrecheckMismatch);
    }

    local = sample();
    local.modified_time += 1;
    EXPECT_EQ(extensions::compare_metadata(sample(), local).size(), 1u);
}

TEST(MetadataTest, LocalMetadataDescribesFile)
{
    fixtures::TempDir dir;
    const auto path = dir.path() / "image.raw";
    {
        std::ofstream out(path, std::ios::binary);
        out << "pagesync";
    }

    auto meta = extensions::compute_local_metadata(path);
    ASSERT_TRUE(meta.has_value()) << meta.error().message;
    EXPECT_EQ(meta->file_name, "image.raw");
    EXPECT_EQ(meta->size, 8u);
    EXPECT_GT(meta->modified_time, 0);
    EXPECT_EQ(meta->content_hash.size(), 16u);

    auto again = extensions::compute_local_metadata(path);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->content_hash, meta->content_hash);
}

TEST(MetadataTest, MissingFileIsSourceReadError)
{
    auto meta = extensions::compute_local_metadata("/nonexistent/pagesync/image.raw");
    ASSERT_FALSE(meta.has_value());
    EXPECT_EQ(meta.error().code, infra::ErrorCode::SourceRead);
}

TEST(XXHashDigestTest, HexIsSixteenLowercaseDigits)
{
    EXPECT_EQ(infra::XXHashDigest::to_hex(0x1), "0000000000000001");
    EXPECT_EQ(infra::XXHashDigest::to_hex(0xABCDEF0123456789ULL), "abcdef0123456789");
}
