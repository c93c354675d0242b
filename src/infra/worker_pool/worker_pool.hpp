#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "infra/channel/channel.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/retry.hpp"

namespace pagesync::infra {

// Unit of work for the pool. `work` must be idempotent: it may run several
// times for the same request.
struct Request {
    std::string id;
    std::function<VoidResult()> work;
    RetryPolicy retry;
};

struct RequestFailure {
    std::string id;
    Error error;
    int attempts = 0;
};

// Итог работы пула, отправляется в done-канал ровно один раз
struct PoolSummary {
    std::size_t succeeded = 0;
    std::vector<RequestFailure> failures;
    bool torn_down = false;

    [[nodiscard]] bool all_succeeded() const { return failures.empty() && !torn_down; }
};

// Load balancer: N workers pull requests from a shared channel. Failures the
// retry policy gives up on go to errors(); once every worker has exited the
// pool closes errors() and publishes a PoolSummary on done().
class WorkerPool {
public:
    explicit WorkerPool(std::size_t nworkers = std::jthread::hardware_concurrency());
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    struct Channels {
        Channel<RequestFailure>& errors;
        Channel<PoolSummary>& done;
    };

    // Запуск N воркеров; до run() они ждут канал запросов
    void init();

    // `requests` must outlive the pool. Closing it lets workers finish
    // their current request and exit.
    auto run(Channel<Request>& requests) -> Channels;

    // Forced shutdown: queued requests are left untouched, in-flight
    // attempts still complete but are not retried.
    void tear_down_workers();

    [[nodiscard]] auto size() const -> std::size_t { return nworkers_; }

private:
    void worker_loop_(std::stop_token st);
    void process_(Request& request, std::stop_token st);
    void on_worker_exit_();

    const std::size_t nworkers_;
    std::vector<std::jthread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    Channel<Request>* requests_ = nullptr;
    std::vector<RequestFailure> failures_;
    bool torn_down_ = false;

    std::atomic<std::size_t> succeeded_{0};
    std::atomic<std::size_t> live_workers_{0};

    Channel<RequestFailure> errors_;
    Channel<PoolSummary> done_{1};
};

// =============== Реализация ===============

inline WorkerPool::WorkerPool(std::size_t nworkers)
    : nworkers_(nworkers == 0 ? 1 : nworkers)
    , errors_(nworkers == 0 ? 1 : nworkers)
{}

inline WorkerPool::~WorkerPool() {
    tear_down_workers();
    // Слушателя ошибок уже может не быть: не даём воркерам зависнуть в send()
    errors_.close();
    // jthread автоматически вызовет request_stop и join
    workers_.clear();
}

inline void WorkerPool::init() {
    if (!workers_.empty()) {
        return;
    }
    live_workers_.store(nworkers_);
    workers_.reserve(nworkers_);
    for (std::size_t i = 0; i < nworkers_; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline auto WorkerPool::run(Channel<Request>& requests) -> Channels {
    {
        std::lock_guard lock(mutex_);
        requests_ = &requests;
    }
    cv_.notify_all();
    return Channels{errors_, done_};
}

inline void WorkerPool::tear_down_workers() {
    {
        std::lock_guard lock(mutex_);
        if (workers_.empty() || torn_down_) {
            return;
        }
        torn_down_ = true;
    }
    spdlog::debug("Tearing down {} worker(s)", workers_.size());
    for (auto& w : workers_) {
        w.request_stop();
    }
}

inline void WorkerPool::worker_loop_(std::stop_token st) {
    Channel<Request>* requests = nullptr;
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, st, [this] { return requests_ != nullptr; });
        requests = requests_;
    }

    while (requests && !st.stop_requested()) {
        auto request = requests->receive(st);
        if (!request) {
            break; // канал закрыт или teardown
        }
        process_(*request, st);
    }

    on_worker_exit_();
}

inline void WorkerPool::process_(Request& request, std::stop_token st) {
    int attempts = 0;
    auto result = with_retry(
        [&]() {
            ++attempts;
            return request.work();
        },
        request.retry, st,
        [&](const Error& err, int attempt, std::chrono::milliseconds delay) {
            spdlog::debug("Request {} attempt {} failed ({}), retrying in {} ms",
                          request.id, attempt, err.message, delay.count());
        });

    if (result) {
        succeeded_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    RequestFailure failure{request.id, std::move(result.error()), attempts};
    {
        std::lock_guard lock(mutex_);
        failures_.push_back(failure);
    }
    // Без stop_token: ошибку должен увидеть слушатель даже при teardown
    (void)errors_.send(std::move(failure));
}

inline void WorkerPool::on_worker_exit_() {
    if (live_workers_.fetch_sub(1) != 1) {
        return;
    }

    // Последний вышедший воркер публикует итог
    PoolSummary summary;
    {
        std::lock_guard lock(mutex_);
        summary.failures = failures_;
        summary.torn_down = torn_down_;
    }
    summary.succeeded = succeeded_.load();

    errors_.close();
    (void)done_.send(std::move(summary));
    done_.close();
}

} // namespace pagesync::infra
