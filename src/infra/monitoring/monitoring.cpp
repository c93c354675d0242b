#include "monitoring.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <iostream>
#include "infra/retry.hpp"

namespace pagesync::infra {

namespace {

constexpr double kMiB = 1024.0 * 1024.0;
constexpr std::array<char, 4> kSpinner{'\\', '|', '/', '-'};

} // namespace

// =============== ThroughputWindow ===============

ThroughputWindow::ThroughputWindow(std::size_t capacity)
    : ring_(std::max<std::size_t>(capacity, 2))
{}

void ThroughputWindow::add(Clock::time_point at, std::uint64_t cumulative_bytes) {
    ring_[head_] = Sample{at, cumulative_bytes};
    head_ = (head_ + 1) % ring_.size();
    count_ = std::min(count_ + 1, ring_.size());
}

auto ThroughputWindow::bytes_per_second() const -> double {
    if (count_ < 2) {
        return 0.0;
    }
    const std::size_t cap = ring_.size();
    const auto& newest = ring_[(head_ + cap - 1) % cap];
    const auto& oldest = ring_[(head_ + cap - count_) % cap];

    const double elapsed = std::chrono::duration<double>(newest.at - oldest.at).count();
    if (elapsed <= 0.0 || newest.bytes < oldest.bytes) {
        return 0.0;
    }
    return static_cast<double>(newest.bytes - oldest.bytes) / elapsed;
}

// =============== ProgressEstimator ===============

ProgressEstimator::ProgressEstimator()
    : ProgressEstimator(Options{})
{}

ProgressEstimator::ProgressEstimator(Options options)
    : options_(options)
    , window_(options.window)
    , records_(options.record_capacity)
{}

ProgressEstimator::~ProgressEstimator() {
    stop();
}

auto ProgressEstimator::start(std::size_t parallelism, std::uint64_t already_processed,
                              std::uint64_t total_bytes)
    -> Channel<ProgressRecord>&
{
    total_ = total_bytes;
    processed_.store(already_processed);
    {
        // Несколько параллельных воркеров дают рваный поток завершений:
        // окно не меньше двух семплов на воркер
        std::lock_guard lock(window_mutex_);
        window_ = ThroughputWindow(std::max(options_.window, 2 * parallelism));
        window_.add(ThroughputWindow::Clock::now(), already_processed);
    }

    ticker_ = std::jthread([this](std::stop_token st) { tick_loop_(st); });
    return records_;
}

void ProgressEstimator::report_bytes_processed(std::uint64_t n) {
    processed_.fetch_add(n, std::memory_order_relaxed);
}

void ProgressEstimator::stop() {
    if (ticker_.joinable()) {
        ticker_.request_stop();
        ticker_.join();
    }
    records_.close();
}

auto ProgressEstimator::snapshot() const -> ProgressRecord {
    double throughput = 0.0;
    {
        std::lock_guard lock(window_mutex_);
        throughput = window_.bytes_per_second();
    }
    return make_record_(processed_.load(), throughput);
}

void ProgressEstimator::tick_loop_(std::stop_token st) {
    while (interruptible_sleep(options_.interval, st)) {
        const auto processed = processed_.load();
        double throughput = 0.0;
        {
            std::lock_guard lock(window_mutex_);
            window_.add(ThroughputWindow::Clock::now(), processed);
            throughput = window_.bytes_per_second();
        }

        if (!records_.send(make_record_(processed, throughput), st)) {
            break;
        }
    }
}

auto ProgressEstimator::make_record_(std::uint64_t processed, double throughput) const -> ProgressRecord {
    ProgressRecord record;
    record.bytes_processed = processed;
    record.total_bytes = total_;
    record.throughput_bytes_per_sec = throughput;

    if (total_ == 0) {
        record.percent_complete = 100.0;
    } else {
        record.percent_complete = std::min(100.0,
            static_cast<double>(processed) / static_cast<double>(total_) * 100.0);
    }

    if (throughput > 0.0) {
        const std::uint64_t left = total_ > processed ? total_ - processed : 0;
        record.remaining = std::chrono::seconds(
            static_cast<std::chrono::seconds::rep>(static_cast<double>(left) / throughput));
    }
    return record;
}

// =============== ProgressRenderer ===============

ProgressRenderer::ProgressRenderer(bool enabled)
    : ProgressRenderer(std::cout, enabled)
{}

ProgressRenderer::ProgressRenderer(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled)
{}

auto ProgressRenderer::format_line(const ProgressRecord& record, char spinner) -> std::string {
    const int bar_width = 20;
    const int filled = static_cast<int>(record.percent_complete / 100.0 * bar_width);

    std::string eta = "--:--:--";
    if (record.remaining) {
        const auto total = record.remaining->count();
        eta = fmt::format("{:02d}:{:02d}:{:02d}", total / 3600, (total % 3600) / 60, total % 60);
    }

    std::string bar = std::string(filled, '#') + std::string(bar_width - filled, '.');
    return fmt::format("[{}] {:3d}% [{:10.2f} MB] ETA: {} | {:.2f} MB/s {}",
                       bar,
                       static_cast<int>(record.percent_complete),
                       static_cast<double>(record.bytes_processed) / kMiB,
                       eta,
                       record.throughput_mb_per_sec(),
                       spinner);
}

void ProgressRenderer::render(const ProgressRecord& record) {
    if (!enabled_) return;
    // ANSI: очистить строку
    out_ << "\r\033[K" << format_line(record, kSpinner[frame_++ % kSpinner.size()]) << std::flush;
}

void ProgressRenderer::finish(const ProgressRecord& record) {
    if (!enabled_) return;
    out_ << "\r\033[K" << format_line(record, ' ') << '\n' << std::flush;
}

} // namespace pagesync::infra
