#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cstdlib>
#include <thread>

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace pagesync::infra {

    void Config::merge_with(const Config& other) {
        if (other.parallelism) parallelism = other.parallelism;
        if (other.page_size) page_size = other.page_size;
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.queue_capacity) queue_capacity = other.queue_capacity;
        if (other.max_attempts) max_attempts = other.max_attempts;
        if (other.retry_initial_delay) retry_initial_delay = other.retry_initial_delay;
        if (other.retry_backoff_factor) retry_backoff_factor = other.retry_backoff_factor;
        if (other.retry_max_delay) retry_max_delay = other.retry_max_delay;
        if (other.progress_interval) progress_interval = other.progress_interval;
        if (other.progress_window) progress_window = other.progress_window;
        if (other.overwrite) overwrite = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
    }

    auto Config::effective_parallelism() const -> std::uint32_t {
        if (parallelism && *parallelism > 0) {
            return *parallelism;
        }
        // По умолчанию 8 * число ядер: воркеры в основном ждут сеть
        return 8 * std::max(1u, std::thread::hardware_concurrency());
    }

    auto Config::retry_policy() const -> RetryPolicy {
        RetryPolicy policy;
        if (max_attempts) policy.max_attempts = *max_attempts;
        if (retry_initial_delay) policy.initial_delay = *retry_initial_delay;
        if (retry_backoff_factor) policy.backoff_factor = *retry_backoff_factor;
        if (retry_max_delay) policy.max_delay = *retry_max_delay;
        return policy;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".pagesync.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "pagesync" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "pagesync" / "config.yaml");
            }
        }

        return paths;
    }

    static auto parse_config(const std::filesystem::path& path) -> Result<Config> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["parallelism"]) cfg.parallelism = config["parallelism"].as<std::uint32_t>();
            if (config["page_size"]) cfg.page_size = config["page_size"].as<std::uint64_t>();
            if (config["chunk_size"]) cfg.chunk_size = config["chunk_size"].as<std::uint64_t>();
            if (config["queue_capacity"]) cfg.queue_capacity = config["queue_capacity"].as<std::size_t>();

            if (const auto retry = config["retry"]) {
                if (retry["max_attempts"]) cfg.max_attempts = retry["max_attempts"].as<int>();
                if (retry["initial_delay_ms"])
                    cfg.retry_initial_delay = std::chrono::milliseconds(retry["initial_delay_ms"].as<long>());
                if (retry["backoff_factor"]) cfg.retry_backoff_factor = retry["backoff_factor"].as<double>();
                if (retry["max_delay_ms"])
                    cfg.retry_max_delay = std::chrono::milliseconds(retry["max_delay_ms"].as<long>());
            }

            if (const auto progress = config["progress"]) {
                if (progress.IsScalar()) {
                    cfg.progress = progress.as<bool>();
                } else {
                    if (progress["enabled"]) cfg.progress = progress["enabled"].as<bool>();
                    if (progress["interval_ms"])
                        cfg.progress_interval = std::chrono::milliseconds(progress["interval_ms"].as<long>());
                    if (progress["window"]) cfg.progress_window = progress["window"].as<std::size_t>();
                }
            }

            if (config["overwrite"]) cfg.overwrite = config["overwrite"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();

            if (cfg.max_attempts && *cfg.max_attempts < 0) {
                return std::unexpected(make_error(ErrorCode::Config,
                    fmt::format("{}: retry.max_attempts must not be negative", path.string())));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(make_error(ErrorCode::Config,
                fmt::format("Failed to parse {}: {}", path.string(), e.what())));
        }
    }

    auto load_config_from_file() -> Result<Config> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return parse_config(path);
        }

        // Файл не найден: пустой конфиг, не ошибка
        return Config{};
    }

    auto load_config_from_file(const std::filesystem::path& path) -> Result<Config> {
        if (!std::filesystem::exists(path)) {
            return std::unexpected(make_error(ErrorCode::Config,
                fmt::format("Config file {} does not exist", path.string())));
        }
        return parse_config(path);
    }

    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.parallelism = args.parallelism;
        cfg.chunk_size = args.chunk_size;
        cfg.max_attempts = args.max_attempts;
        cfg.overwrite = args.overwrite;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        return cfg;
    }

} // namespace pagesync::infra
