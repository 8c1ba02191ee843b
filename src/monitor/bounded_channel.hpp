/**
 * @file bounded_channel.hpp
 * @brief Ограниченный канал между фоновым производителем и циклом монитора
 *
 * send() блокируется, пока в канале нет места, try_receive() никогда
 * не блокируется. close() будит всех ожидающих: после закрытия send()
 * возвращает false, а try_receive() отдаёт оставшиеся сообщения.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace axectl::monitor {

template<typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Запрещаем копирование
    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Отправить сообщение, ожидая свободного места
     *
     * @return false если канал закрыт
     */
    bool send(T value) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        return true;
    }

    /**
     * @brief Забрать сообщение без ожидания
     */
    [[nodiscard]] std::optional<T> try_receive() {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    /**
     * @brief Закрыть канал и разбудить заблокированных отправителей
     */
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace axectl::monitor
