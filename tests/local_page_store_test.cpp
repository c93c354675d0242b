#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>
#include "adapters/local_page_store.hpp"
#include "test_support.hpp"

using namespace pagesync;
using adapters::LocalPageStore;
using core::ByteRange;
using core::RangeSet;

namespace {

auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> out(raw.size());
    std::transform(raw.begin(), raw.end(), out.begin(), [](char c) { return static_cast<std::byte>(c); });
    return out;
}

} // namespace

TEST(LocalPageStoreTest, MissingObjectHasNoProperties)
{
    fixtures::TempDir dir;
    LocalPageStore store{dir.path(), "disk.img"};

    auto props = store.get_properties();
    ASSERT_TRUE(props.has_value());
    EXPECT_FALSE(props->has_value());
}

TEST(LocalPageStoreTest, CreateWriteAndReopen)
{
    fixtures::TempDir dir;
    const auto data = fixtures::patterned_image(1024);
    {
        LocalPageStore store{dir.path(), "disk.img"};
        ASSERT_TRUE(store.create_object(4096, {{"owner", "test"}}).has_value());
        ASSERT_TRUE(store.write_pages(2048, data).has_value());
        ASSERT_TRUE(store.write_pages(512, std::span(data).first(512)).has_value());
        EXPECT_EQ(std::filesystem::file_size(store.data_path()), 4096u);
    }

    // Новый экземпляр читает sidecar
    LocalPageStore reopened{dir.path(), "disk.img"};
    auto props = reopened.get_properties();
    ASSERT_TRUE(props.has_value() && props->has_value());
    EXPECT_EQ((*props)->size, 4096u);
    EXPECT_EQ((*props)->metadata.at("owner"), "test");
    EXPECT_FALSE((*props)->content_hash.has_value());

    auto existing = adapters::list_existing_ranges(reopened);
    ASSERT_TRUE(existing.has_value());
    EXPECT_EQ(*existing, (RangeSet{{512, 1023}, {2048, 3071}}));

    const auto contents = read_file(reopened.data_path());
    ASSERT_EQ(contents.size(), 4096u);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), contents.begin() + 2048));
    EXPECT_EQ(contents[0], std::byte{0});
}

TEST(LocalPageStoreTest, ListingIsPaginated)
{
    fixtures::TempDir dir;
    LocalPageStore store{dir.path(), "disk.img", 512, 2};
    ASSERT_TRUE(store.create_object(8 * 512, {}).has_value());

    const auto page = fixtures::patterned_image(512);
    for (std::uint64_t i = 0; i < 8; i += 2) {
        ASSERT_TRUE(store.write_pages(i * 512, page).has_value());
    }

    auto first = store.list_page_ranges("");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->ranges.size(), 2u);
    EXPECT_FALSE(first->next_marker.empty());

    auto all = adapters::list_existing_ranges(store);
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->size(), 4u);
    EXPECT_EQ(all->total_length(), 4u * 512);

    EXPECT_FALSE(store.list_page_ranges("garbage").has_value());
}

TEST(LocalPageStoreTest, RejectsMisalignedAndOutOfBoundsWrites)
{
    fixtures::TempDir dir;
    LocalPageStore store{dir.path(), "disk.img"};
    ASSERT_TRUE(store.create_object(1024, {}).has_value());

    const auto data = fixtures::patterned_image(512);
    auto misaligned = store.write_pages(100, data);
    ASSERT_FALSE(misaligned.has_value());
    EXPECT_EQ(misaligned.error().code, infra::ErrorCode::InvalidArgument);

    auto past_end = store.write_pages(1024, data);
    ASSERT_FALSE(past_end.has_value());
    EXPECT_EQ(past_end.error().code, infra::ErrorCode::InvalidArgument);

    EXPECT_FALSE(store.create_object(1000, {}).has_value());
}

TEST(LocalPageStoreTest, RecreateDiscardsPreviousPages)
{
    fixtures::TempDir dir;
    LocalPageStore store{dir.path(), "disk.img"};
    ASSERT_TRUE(store.create_object(1024, {}).has_value());
    ASSERT_TRUE(store.write_pages(0, fixtures::patterned_image(512)).has_value());
    ASSERT_TRUE(store.set_content_hash("abc").has_value());

    ASSERT_TRUE(store.create_object(2048, {{"k", "v"}}).has_value());
    auto props = store.get_properties();
    ASSERT_TRUE(props.has_value() && props->has_value());
    EXPECT_EQ((*props)->size, 2048u);
    EXPECT_FALSE((*props)->content_hash.has_value());

    auto existing = adapters::list_existing_ranges(store);
    ASSERT_TRUE(existing.has_value());
    EXPECT_TRUE(existing->empty());
}

TEST(LocalPageStoreTest, CorruptSidecarIsStorageError)
{
    fixtures::TempDir dir;
    LocalPageStore store{dir.path(), "disk.img"};
    {
        std::ofstream out(store.sidecar_path());
        out << "size: [not, a, number\n";
    }

    auto props = store.get_properties();
    ASSERT_FALSE(props.has_value());
    EXPECT_EQ(props.error().code, infra::ErrorCode::Storage);
}
