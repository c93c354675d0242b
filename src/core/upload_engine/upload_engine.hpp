#pragma once

#include <string>
#include <vector>
#include <expected>
#include <cstdint>
#include "adapters/source_stream.hpp"
#include "adapters/storage_client.hpp"
#include "core/range/range_set.hpp"
#include "core/reconciler/reconciler.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace pagesync::core {

struct SessionResult {
    bool success = false;
    std::vector<std::string> failed_ranges; // id запросов, исчерпавших retry
    std::uint64_t effective_bytes = 0;      // запланировано к отправке
    std::uint64_t uploaded_bytes = 0;       // подтверждено назначением
    std::size_t requests = 0;
    std::string message;
};

class UploadEngine {
public:
    explicit UploadEngine(const infra::Config& config,
                          infra::ProgressRenderer& renderer);

    // Full session: reconcile against `skip`, then upload what is left.
    // Errors are session aborts (source read, bad parameters,
    // interruption); a session whose requests failed returns a result with
    // success == false.
    [[nodiscard]] auto run(adapters::SourceStream& stream,
                           const RangeSet& skip,
                           adapters::StorageClient& storage,
                           bool resume)
        -> std::expected<SessionResult, infra::Error>;

    // Uploads an already reconciled work list. `already_processed` bytes
    // count as done for progress purposes.
    [[nodiscard]] auto upload(adapters::SourceStream& stream,
                              const WorkList& ranges,
                              std::uint64_t already_processed,
                              adapters::StorageClient& storage,
                              bool resume)
        -> std::expected<SessionResult, infra::Error>;

private:
    const infra::Config& config_;
    infra::ProgressRenderer& renderer_;
};

} // namespace pagesync::core
