#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "infra/channel/channel.hpp"

namespace pagesync::infra {

struct ProgressRecord {
    std::uint64_t bytes_processed = 0;
    std::uint64_t total_bytes = 0;
    double percent_complete = 0.0;
    double throughput_bytes_per_sec = 0.0;
    std::optional<std::chrono::seconds> remaining; // нет оценки при нулевой скорости

    [[nodiscard]] auto throughput_mb_per_sec() const -> double {
        return throughput_bytes_per_sec / (1024.0 * 1024.0);
    }
};

// Fixed-capacity ring buffer of (timestamp, cumulative bytes) samples.
class ThroughputWindow {
public:
    using Clock = std::chrono::steady_clock;

    explicit ThroughputWindow(std::size_t capacity);

    void add(Clock::time_point at, std::uint64_t cumulative_bytes);

    // Average rate between the oldest and newest sample; 0 with fewer than
    // two samples or no elapsed time.
    [[nodiscard]] auto bytes_per_second() const -> double;

    [[nodiscard]] auto size() const -> std::size_t { return count_; }
    [[nodiscard]] auto capacity() const -> std::size_t { return ring_.size(); }

private:
    struct Sample {
        Clock::time_point at{};
        std::uint64_t bytes = 0;
    };

    std::vector<Sample> ring_;
    std::size_t head_ = 0; // следующая позиция записи
    std::size_t count_ = 0;
};

// Accumulates confirmed bytes and publishes one ProgressRecord per tick.
class ProgressEstimator {
public:
    struct Options {
        std::chrono::milliseconds interval{1000};
        std::size_t window = 60;
        std::size_t record_capacity = 1;
    };

    ProgressEstimator();
    explicit ProgressEstimator(Options options);
    ~ProgressEstimator();

    ProgressEstimator(const ProgressEstimator&) = delete;
    ProgressEstimator& operator=(const ProgressEstimator&) = delete;

    // `total_bytes` is the whole amount the percentage is measured
    // against, including `already_processed`.
    auto start(std::size_t parallelism, std::uint64_t already_processed, std::uint64_t total_bytes)
        -> Channel<ProgressRecord>&;

    // Only for bytes the destination has acknowledged.
    void report_bytes_processed(std::uint64_t n);

    // Stops ticking and closes the record channel. Never waits for a consumer.
    void stop();

    [[nodiscard]] auto snapshot() const -> ProgressRecord;

private:
    void tick_loop_(std::stop_token st);
    [[nodiscard]] auto make_record_(std::uint64_t processed, double throughput) const -> ProgressRecord;

    const Options options_;
    std::uint64_t total_ = 0;
    std::atomic<std::uint64_t> processed_{0};

    mutable std::mutex window_mutex_;
    ThroughputWindow window_;

    Channel<ProgressRecord> records_;
    std::jthread ticker_;
};

// One console line per record, refreshed in place with '\r'.
class ProgressRenderer {
public:
    explicit ProgressRenderer(bool enabled = true);
    ProgressRenderer(std::ostream& out, bool enabled);

    void render(const ProgressRecord& record);
    void finish(const ProgressRecord& record);

    [[nodiscard]] static auto format_line(const ProgressRecord& record, char spinner) -> std::string;

private:
    std::ostream& out_;
    const bool enabled_;
    std::size_t frame_ = 0;
};

} // namespace pagesync::infra
