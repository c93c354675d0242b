#include "resumer.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace pagesync::extensions {

namespace {

auto create_fresh(adapters::StorageClient& storage, const ImageMetadata& local)
    -> infra::Result<SessionPlan>
{
    if (auto res = storage.create_object(local.size, local.to_map()); !res) {
        return std::unexpected(std::move(res.error()));
    }
    return SessionPlan{.resume = false, .skip = {}};
}

} // namespace

auto plan_session(adapters::StorageClient& storage,
                  const ImageMetadata& local,
                  bool overwrite)
    -> infra::Result<SessionPlan>
{
    auto props = storage.get_properties();
    if (!props) {
        return std::unexpected(std::move(props.error()));
    }

    if (!*props) {
        spdlog::debug("Destination object does not exist, creating it");
        return create_fresh(storage, local);
    }

    if (overwrite) {
        spdlog::info("Destination object exists, recreating it (--overwrite)");
        return create_fresh(storage, local);
    }

    const auto& existing = **props;
    if (existing.content_hash) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ObjectExists,
            fmt::format("Destination object '{}' is already complete. "
                        "If you want to upload again, use the --overwrite option.", local.file_name)));
    }

    auto remote = ImageMetadata::from_map(existing.metadata);
    if (!remote) {
        return std::unexpected(std::move(remote.error()));
    }
    if (!*remote) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PrecheckMismatch,
            "There is no upload metadata associated with the existing object, "
            "so the upload cannot be resumed; use the --overwrite option."));
    }

    spdlog::info("Destination object already exists, checking whether the upload can be resumed");
    auto mismatches = compare_metadata(**remote, local);
    if (!mismatches.empty()) {
        for (auto& e : mismatches) {
            (void)infra::log_and_return(std::move(e));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::PrecheckMismatch,
            "The local image does not match the one the existing object was created from; "
            "use the --overwrite option to start over."));
    }
    if (existing.size != local.size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PrecheckMismatch,
            fmt::format("Destination object is {} bytes, local image is {} bytes", existing.size, local.size)));
    }

    auto present = adapters::list_existing_ranges(storage);
    if (!present) {
        return std::unexpected(std::move(present.error()));
    }
    return SessionPlan{.resume = true, .skip = std::move(*present)};
}

} // namespace pagesync::extensions
