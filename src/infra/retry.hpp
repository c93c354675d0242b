#pragma once

#include "error_handler/error.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>

namespace pagesync::infra {
/*

auto res = infra::with_retry([&]() {
    return storage.write_pages(offset, bytes);
}, infra::RetryPolicy{ .max_attempts = 5 }, st);

*/
struct RetryPolicy {
    int max_attempts = 10; // 0 = без ограничения
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(200);
    double backoff_factor = 2.0; // exponential backoff
    std::chrono::milliseconds max_delay = std::chrono::milliseconds(30'000);

    // Решение по ошибке последней попытки
    std::function<bool(const Error&)> should_retry = [](const Error& e) { return e.is_transient(); };

    [[nodiscard]] auto delay_for(int attempt) const -> std::chrono::milliseconds {
        const double scaled = static_cast<double>(initial_delay.count()) *
                              std::pow(backoff_factor, attempt);
        const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds(static_cast<long long>(capped));
    }

    [[nodiscard]] auto exhausted(int attempts_made) const -> bool {
        return max_attempts > 0 && attempts_made >= max_attempts;
    }
};

// Sleeps for `d`; returns false if `st` asked to stop first.
inline bool interruptible_sleep(std::chrono::milliseconds d, std::stop_token st) {
    if (d.count() <= 0) {
        return !st.stop_requested();
    }
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    // Предикат всегда false: выходим по таймауту или по stop_token
    (void)cv.wait_for(lock, st, d, [] { return false; });
    return !st.stop_requested();
}

template<typename F, typename OnRetry>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy,
                              std::stop_token st, OnRetry&& on_retry)
    -> decltype(operation())
{
    for (int attempt = 0;; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result; // успех
        }

        const auto& err = result.error();
        const bool retryable = policy.should_retry ? policy.should_retry(err) : false;
        if (!retryable || policy.exhausted(attempt + 1) || st.stop_requested()) {
            return result; // фатальная ошибка, последняя попытка или teardown
        }

        const auto delay = policy.delay_for(attempt);
        on_retry(err, attempt + 1, delay);

        if (!interruptible_sleep(delay, st)) {
            return result;
        }
    }
}

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {},
                              std::stop_token st = {})
    -> decltype(operation())
{
    return with_retry(std::forward<F>(operation), policy, st,
                      [](const Error&, int, std::chrono::milliseconds) {});
}

} // namespace pagesync::infra
