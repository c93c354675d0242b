#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "infra/error_handler/error.hpp"
#include "infra/retry.hpp"

namespace pagesync::args_parser {
    struct CLIArgs;
}

namespace pagesync::infra {

inline constexpr std::uint64_t kDefaultPageSize = 512;
inline constexpr std::uint64_t kDefaultChunkSize = 4 * 1024 * 1024;

struct Config {
    // Transfer
    std::optional<std::uint32_t> parallelism;
    std::optional<std::uint64_t> page_size;      // bytes
    std::optional<std::uint64_t> chunk_size;     // bytes
    std::optional<std::size_t> queue_capacity;   // 0 = синхронная передача

    // Retry
    std::optional<int> max_attempts;             // 0 = без ограничения
    std::optional<std::chrono::milliseconds> retry_initial_delay;
    std::optional<double> retry_backoff_factor;
    std::optional<std::chrono::milliseconds> retry_max_delay;

    // Progress
    std::optional<std::chrono::milliseconds> progress_interval;
    std::optional<std::size_t> progress_window;  // samples

    // Behavior
    bool overwrite = false;
    bool progress = true;
    bool quiet = false;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_parallelism() const -> std::uint32_t;
    [[nodiscard]] auto retry_policy() const -> RetryPolicy;
};

/// Loads the first configuration file found in:
///   1. ./.pagesync.yaml
///   2. $XDG_CONFIG_HOME/pagesync/config.yaml or ~/.config/pagesync/config.yaml
/// An absent file yields an empty Config; a broken one is ErrorCode::Config.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

/// Loads an explicit file (--config); the file must exist.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path) -> Result<Config>;

[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

} // namespace pagesync::infra
