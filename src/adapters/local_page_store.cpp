#include "local_page_store.hpp"
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace pagesync::adapters {

LocalPageStore::LocalPageStore(std::filesystem::path directory,
                               std::string object_name,
                               std::uint64_t page_size,
                               std::size_t ranges_per_listing)
    : directory_(std::move(directory))
    , object_name_(std::move(object_name))
    , page_size_(page_size == 0 ? 512 : page_size)
    , ranges_per_listing_(ranges_per_listing == 0 ? 1 : ranges_per_listing)
{}

LocalPageStore::~LocalPageStore() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

auto LocalPageStore::load_locked_() -> infra::VoidResult {
    if (loaded_) {
        return {};
    }

    const auto sidecar = sidecar_path();
    if (!std::filesystem::exists(sidecar)) {
        loaded_ = true;
        state_.reset();
        return {};
    }

    try {
        YAML::Node node = YAML::LoadFile(sidecar.string());

        State state;
        state.size = node["size"].as<std::uint64_t>();
        if (node["metadata"]) {
            for (const auto& kv : node["metadata"]) {
                state.metadata[kv.first.as<std::string>()] = kv.second.as<std::string>();
            }
        }
        if (node["content_hash"]) {
            state.content_hash = node["content_hash"].as<std::string>();
        }
        if (node["pages"]) {
            for (const auto& page : node["pages"]) {
                state.written.insert(core::ByteRange{page[0].as<std::uint64_t>(),
                                                     page[1].as<std::uint64_t>()});
            }
        }

        state_ = std::move(state);
        loaded_ = true;
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Storage,
            fmt::format("Failed to parse {}: {}", sidecar.string(), e.what())));
    }
}

auto LocalPageStore::save_locked_() -> infra::VoidResult {
    YAML::Node node;
    node["size"] = state_->size;
    for (const auto& [key, value] : state_->metadata) {
        node["metadata"][key] = value;
    }
    if (state_->content_hash) {
        node["content_hash"] = *state_->content_hash;
    }
    for (const auto& r : state_->written.ranges()) {
        YAML::Node page;
        page.SetStyle(YAML::EmitterStyle::Flow);
        page.push_back(r.start());
        page.push_back(r.end());
        node["pages"].push_back(page);
    }

    // Пишем во временный файл и атомарно подменяем
    const auto sidecar = sidecar_path();
    auto tmp = sidecar;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Storage,
                fmt::format("Cannot write {}", tmp.string())));
        }
        ofs << node << '\n';
        if (!ofs.flush()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Storage,
                fmt::format("Write to {} failed", tmp.string())));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, sidecar, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Storage,
            fmt::format("Cannot replace {}: {}", sidecar.string(), ec.message())));
    }
    return {};
}

auto LocalPageStore::open_data_locked_(bool truncate) -> infra::VoidResult {
    if (fd_ != -1 && !truncate) {
        return {};
    }
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }

    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }
    fd_ = ::open(data_path().c_str(), flags, 0644);
    if (fd_ == -1) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::Storage,
            fmt::format("Cannot open {}", data_path().string()), errno));
    }
    return {};
}

auto LocalPageStore::get_properties() -> infra::Result<std::optional<ObjectProperties>> {
    std::lock_guard lock(mutex_);
    if (auto res = load_locked_(); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (!state_) {
        return std::optional<ObjectProperties>{};
    }
    return ObjectProperties{
        .size = state_->size,
        .metadata = state_->metadata,
        .content_hash = state_->content_hash
    };
}

auto LocalPageStore::create_object(std::uint64_t size, const ObjectMetadata& metadata)
    -> infra::VoidResult
{
    if (size % page_size_ != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Object size {} is not a multiple of the page size {}", size, page_size_)));
    }

    std::lock_guard lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Storage,
            fmt::format("Cannot create store directory {}: {}", directory_.string(), ec.message())));
    }

    if (auto res = open_data_locked_(true); !res) {
        return res;
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::Storage,
            fmt::format("Cannot size {} to {} bytes", data_path().string(), size), errno));
    }

    state_ = State{.size = size, .metadata = metadata, .content_hash = std::nullopt, .written = {}};
    loaded_ = true;
    spdlog::debug("Created object {} ({} bytes)", data_path().string(), size);
    return save_locked_();
}

auto LocalPageStore::list_page_ranges(std::string_view marker) -> infra::Result<PageRangeListing> {
    std::lock_guard lock(mutex_);
    if (auto res = load_locked_(); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (!state_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Storage,
            fmt::format("Object {} does not exist", object_name_)));
    }

    std::size_t first = 0;
    if (!marker.empty()) {
        auto [ptr, ec] = std::from_chars(marker.data(), marker.data() + marker.size(), first);
        if (ec != std::errc{} || ptr != marker.data() + marker.size()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("Invalid listing marker '{}'", marker)));
        }
    }

    const auto all = state_->written.ranges();
    PageRangeListing listing;
    const std::size_t last = std::min(all.size(), first + ranges_per_listing_);
    for (std::size_t i = first; i < last; ++i) {
        listing.ranges.push_back(all[i]);
    }
    if (last < all.size()) {
        listing.next_marker = std::to_string(last);
    }
    return listing;
}

auto LocalPageStore::write_pages(std::uint64_t offset, std::span<const std::byte> data)
    -> infra::VoidResult
{
    if (data.empty() || offset % page_size_ != 0 || data.size() % page_size_ != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Write of {} bytes at {} is not aligned to {}", data.size(), offset, page_size_)));
    }

    int fd = -1;
    {
        std::lock_guard lock(mutex_);
        if (auto res = load_locked_(); !res) {
            return res;
        }
        if (!state_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Storage,
                fmt::format("Object {} does not exist", object_name_)));
        }
        if (offset + data.size() > state_->size) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("Write [{}, {}) exceeds object size {}", offset, offset + data.size(), state_->size)));
        }
        if (auto res = open_data_locked_(false); !res) {
            return res;
        }
        fd = fd_;
    }

    std::size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::pwrite(fd, data.data() + done, data.size() - done,
                             static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_errno_error(infra::ErrorCode::Transfer,
                fmt::format("pwrite at {} failed", offset + done), errno));
        }
        done += static_cast<std::size_t>(n);
    }
    if (::fdatasync(fd) == -1) {
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::Transfer,
            fmt::format("fdatasync after write at {} failed", offset), errno));
    }

    std::lock_guard lock(mutex_);
    state_->written.insert(core::ByteRange::from_length(offset, data.size()));
    if (auto res = save_locked_(); !res) {
        // Данные записаны, но не учтены: для вызывающего это сбой попытки
        return std::unexpected(infra::make_error(infra::ErrorCode::Transfer, res.error().message));
    }
    return {};
}

auto LocalPageStore::set_content_hash(std::string_view hash) -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    if (auto res = load_locked_(); !res) {
        return res;
    }
    if (!state_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Storage,
            fmt::format("Object {} does not exist", object_name_)));
    }
    state_->content_hash = std::string(hash);
    return save_locked_();
}

} // namespace pagesync::adapters
