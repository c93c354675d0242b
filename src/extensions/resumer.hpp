#pragma once

#include "adapters/storage_client.hpp"
#include "core/range/range_set.hpp"
#include "infra/error_handler/error.hpp"
#include "metadata.hpp"

namespace pagesync::extensions {

struct SessionPlan {
    bool resume = false;
    core::RangeSet skip; // диапазоны, уже подтверждённые назначением
};

// Prepares the destination object and decides between a fresh and a
// resumed session. A fresh session (re)creates the object with the local
// metadata; a resumed one requires the object's metadata to match the
// local image and returns the ranges already present.
[[nodiscard]] auto plan_session(adapters::StorageClient& storage,
                                const ImageMetadata& local,
                                bool overwrite)
    -> infra::Result<SessionPlan>;

} // namespace pagesync::extensions
