#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace pagesync::infra {

/*

infra::Channel<int> ch{0};                 // capacity 0: синхронная передача
std::jthread producer([&] { ch.send(42); ch.close(); });
while (auto v = ch.receive()) { ... }

*/

// Bounded closable queue. With capacity 0 send() returns only after a
// receiver has taken the value. After close() receivers drain what is
// buffered and then get std::nullopt; senders get false.
template<typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // false если канал закрыт или запрошена остановка
    [[nodiscard]] bool send(T value, std::stop_token st = {});

    [[nodiscard]] auto receive(std::stop_token st = {}) -> std::optional<T>;
    [[nodiscard]] auto try_receive() -> std::optional<T>;

    void close();

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

private:
    struct Slot {
        std::uint64_t ticket;
        T value;
    };

    [[nodiscard]] bool has_room_() const {
        return queue_.size() < std::max<std::size_t>(capacity_, 1);
    }

    auto pop_locked_() -> T;

    const std::size_t capacity_;
    std::deque<Slot> queue_;
    std::uint64_t next_ticket_ = 0;
    std::uint64_t taken_ = 0; // все тикеты < taken_ покинули очередь
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

// =============== Реализация шаблонов ===============

template<typename T>
bool Channel<T>::send(T value, std::stop_token st) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, st, [this] { return closed_ || has_room_(); });
    if (closed_ || st.stop_requested()) {
        return false;
    }

    const auto ticket = next_ticket_++;
    queue_.push_back(Slot{ticket, std::move(value)});
    cv_.notify_all();

    if (capacity_ > 0) {
        return true;
    }

    // Rendezvous: ждём, пока получатель заберёт значение
    cv_.wait(lock, st, [this, ticket] { return taken_ > ticket || closed_; });
    if (taken_ > ticket) {
        return true;
    }

    // Никто не забрал: отзываем значение
    std::erase_if(queue_, [ticket](const Slot& s) { return s.ticket == ticket; });
    cv_.notify_all();
    return false;
}

template<typename T>
auto Channel<T>::receive(std::stop_token st) -> std::optional<T> {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, st, [this] { return closed_ || !queue_.empty(); });
    if (st.stop_requested() || queue_.empty()) {
        return std::nullopt;
    }
    return pop_locked_();
}

template<typename T>
auto Channel<T>::try_receive() -> std::optional<T> {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    return pop_locked_();
}

template<typename T>
void Channel<T>::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

template<typename T>
bool Channel<T>::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

template<typename T>
auto Channel<T>::pop_locked_() -> T {
    Slot slot = std::move(queue_.front());
    queue_.pop_front();
    taken_ = slot.ticket + 1;
    cv_.notify_all();
    return std::move(slot.value);
}

} // namespace pagesync::infra
