#include <iostream>
#include <fmt/core.h>

#include "adapters/local_page_store.hpp"
#include "adapters/source_stream.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/upload_engine/upload_engine.hpp"
#include "extensions/metadata.hpp"
#include "extensions/resumer.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

using ARGS = pagesync::args_parser::CLIArgs;

constexpr auto load_from_cli = pagesync::infra::config_from_cli;
constexpr auto args_parser = pagesync::args_parser::parse_args;

static auto
__out_args_verse(const ARGS& args, const pagesync::infra::Config& config)
-> void {
    spdlog::debug("Source: {}", args.source);
    spdlog::debug("Store: {} (object '{}')", args.store, args.object);
    spdlog::debug("Parallelism: {}", config.effective_parallelism());
    spdlog::debug("Chunk size: {}", config.chunk_size.value_or(pagesync::infra::kDefaultChunkSize));
    spdlog::debug("Queue capacity: {}", config.queue_capacity.value_or(0));
    spdlog::debug("Max attempts: {}", config.retry_policy().max_attempts);
    spdlog::debug("Overwrite: {}", config.overwrite ? "yes" : "no");
}

static auto
__fail(pagesync::infra::Error&& err)
-> int {
    const int code = err.to_exit_code();
    (void)pagesync::infra::log_and_return(std::move(err));
    return code;
}

int main(int argc, char** argv)
{
    namespace ps = pagesync;

    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        ps::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (args.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        // 1. Загрузить из файла
        auto config_res = args.config_path
            ? ps::infra::load_config_from_file(*args.config_path)
            : ps::infra::load_config_from_file();
        if (!config_res) {
            return __fail(std::move(config_res.error()));
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        spdlog::debug("Merging CLI config with file config...");
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет
        __out_args_verse(args, config);

        auto local_meta = ps::extensions::compute_local_metadata(args.source);
        if (!local_meta) {
            return __fail(std::move(local_meta.error()));
        }

        auto stream = ps::adapters::FileSourceStream::open(args.source);
        if (!stream) {
            return __fail(std::move(stream.error()));
        }

        ps::adapters::LocalPageStore storage{
            args.store, args.object, config.page_size.value_or(ps::infra::kDefaultPageSize)};

        auto plan = ps::extensions::plan_session(storage, *local_meta, config.overwrite);
        if (!plan) {
            return __fail(std::move(plan.error()));
        }

        ps::infra::ProgressRenderer renderer{config.progress && !config.quiet};
        ps::core::UploadEngine engine(config, renderer);

        auto start_time = std::chrono::steady_clock::now();
        auto result = engine.run(**stream, plan->skip, storage, plan->resume);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            if (result.error().code == ps::infra::ErrorCode::Interrupted) {
                spdlog::warn("Interrupted; rerun the command to resume the upload");
            }
            return __fail(std::move(result.error()));
        }

        if (!result->success) {
            return __fail(ps::infra::make_error(ps::infra::ErrorCode::PartialSession, result->message));
        }

        // Объект полон: фиксируем хеш, дальнейший resume невозможен
        if (auto res = storage.set_content_hash(local_meta->content_hash); !res) {
            return __fail(std::move(res.error()));
        }

        spdlog::info("{}", result->message);
        spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
        if (result->uploaded_bytes > 0 && duration.count() > 0) {
            double speed_mbps = (result->uploaded_bytes / 1024.0 / 1024.0) / (duration.count() / 1000.0);
            spdlog::info("Average speed: {:.2f} MB/s", speed_mbps);
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
