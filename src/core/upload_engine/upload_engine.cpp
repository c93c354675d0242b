#include "upload_engine.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "core/chunk_reader/chunk_reader.hpp"
#include "infra/channel/channel.hpp"
#include "infra/interrupt.hpp"
#include "infra/retry.hpp"
#include "infra/worker_pool/worker_pool.hpp"

namespace pagesync::core {

namespace {

constexpr double kMiB = 1024.0 * 1024.0;
constexpr std::chrono::milliseconds kInterruptPoll{100};

auto progress_options(const infra::Config& config) -> infra::ProgressEstimator::Options {
    infra::ProgressEstimator::Options options;
    if (config.progress_interval) options.interval = *config.progress_interval;
    if (config.progress_window) options.window = *config.progress_window;
    return options;
}

} // namespace

UploadEngine::UploadEngine(const infra::Config& config,
                           infra::ProgressRenderer& renderer)
    : config_(config), renderer_(renderer) {}

auto UploadEngine::run(adapters::SourceStream& stream,
                       const RangeSet& skip,
                       adapters::StorageClient& storage,
                       bool resume)
    -> std::expected<SessionResult, infra::Error>
{
    const ReconcileParams params{
        .image_size = stream.size(),
        .page_alignment = config_.page_size.value_or(infra::kDefaultPageSize),
        .chunk_granularity = config_.chunk_size.value_or(infra::kDefaultChunkSize)
    };

    auto report = reconcile(stream, params, skip);
    if (!report) {
        return std::unexpected(std::move(report.error()));
    }

    const std::uint64_t already_processed = params.image_size - report->effective_bytes();
    return upload(stream, report->ranges, already_processed, storage, resume);
}

auto UploadEngine::upload(adapters::SourceStream& stream,
                          const WorkList& ranges,
                          std::uint64_t already_processed,
                          adapters::StorageClient& storage,
                          bool resume)
    -> std::expected<SessionResult, infra::Error>
{
    const std::uint64_t effective = total_length(ranges);
    const std::uint32_t parallelism = config_.effective_parallelism();
    const infra::RetryPolicy retry = config_.retry_policy();

    spdlog::info("Effective upload size: {:.2f} MB (from {:.2f} MB originally)",
                 effective / kMiB, stream.size() / kMiB);

    // Порядок объявления важен: пул разрушается раньше канала запросов,
    // оценщик переживает воркеров, которые ему отчитываются
    infra::Channel<infra::Request> requests{config_.queue_capacity.value_or(0)};

    infra::ProgressEstimator estimator{progress_options(config_)};
    auto& records = estimator.start(parallelism, already_processed, already_processed + effective);

    infra::WorkerPool pool{parallelism};
    pool.init();
    auto channels = pool.run(requests);
    auto& errors = channels.errors;
    auto& done = channels.done;

    spdlog::info("{}", resume ? "Resuming upload..." : "Uploading the image...");
    std::jthread display([&records, this] {
        while (auto record = records.receive()) {
            renderer_.render(*record);
        }
    });

    std::jthread error_listener([&errors] {
        while (auto failure = errors.receive()) {
            spdlog::error("Range {} failed after {} attempt(s): {}",
                          failure->id, failure->attempts, failure->error.message);
        }
    });

    ChunkReader reader{stream, ranges};
    reader.start();

    // Остановка сессии по сигналу: будит все блокирующие ожидания
    std::stop_source session;
    std::jthread interrupt_watcher([&session, &reader, &pool](std::stop_token st) {
        while (infra::interruptible_sleep(kInterruptPoll, st)) {
            if (infra::is_interrupted()) {
                session.request_stop();
                reader.stop();
                pool.tear_down_workers();
                return;
            }
        }
    });

    std::optional<infra::Error> aborted;
    std::size_t dispatched = 0;

    for (;;) {
        if (infra::is_interrupted() || session.stop_requested()) {
            break;
        }

        auto chunk = reader.chunks().receive(session.get_token());
        if (!chunk) {
            // Поток чанков закрыт: либо всё прочитано, либо ошибка чтения
            if (auto err = reader.errors().try_receive()) {
                aborted = std::move(*err);
            }
            break;
        }

        auto owned = std::make_shared<Chunk>(std::move(*chunk));
        infra::Request request{
            .id = owned->range.to_string(),
            .work = [&storage, &estimator, owned]() -> infra::VoidResult {
                auto res = storage.write_pages(owned->range.start(), owned->data);
                if (res) {
                    // Только после подтверждения записи назначением
                    estimator.report_bytes_processed(owned->range.length());
                }
                return res;
            },
            .retry = retry
        };

        // Блокируется, пока воркеры заняты: единственный backpressure
        if (!requests.send(std::move(request), session.get_token())) {
            break;
        }
        ++dispatched;
    }

    requests.close();
    if (!aborted && (infra::is_interrupted() || session.stop_requested())) {
        aborted = infra::make_error(infra::ErrorCode::Interrupted, "Upload interrupted by signal");
    }
    if (aborted) {
        spdlog::warn("Aborting session: {}", aborted->message);
        reader.stop();
        pool.tear_down_workers();
    }

    auto summary = done.receive(session.get_token());
    if (!summary && session.stop_requested()) {
        // Воркеры уже остановлены: ждём только завершения текущих попыток
        summary = done.receive();
        if (!aborted) {
            aborted = infra::make_error(infra::ErrorCode::Interrupted, "Upload interrupted by signal");
            spdlog::warn("Aborting session: {}", aborted->message);
        }
    }
    interrupt_watcher.request_stop();
    interrupt_watcher.join();
    estimator.stop();
    display.join();
    error_listener.join();

    if (aborted) {
        return std::unexpected(std::move(*aborted));
    }

    const auto final_record = estimator.snapshot();

    SessionResult result;
    result.effective_bytes = effective;
    result.requests = dispatched;
    result.uploaded_bytes = final_record.bytes_processed - already_processed;
    if (summary) {
        for (const auto& f : summary->failures) {
            result.failed_ranges.push_back(f.id);
        }
    }

    result.success = result.failed_ranges.empty();
    if (result.success) {
        renderer_.finish(final_record);
        result.message = fmt::format("Upload completed: {} request(s), {:.2f} MB",
                                     dispatched, effective / kMiB);
    } else {
        result.message = fmt::format(
            "Upload incomplete: {} of {} range(s) failed to upload, rerun the command to upload those ranges",
            result.failed_ranges.size(), dispatched);
    }
    return result;
}

} // namespace pagesync::core
