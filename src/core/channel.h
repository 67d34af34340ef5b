#ifndef STRATA_CORE_CHANNEL_H_
#define STRATA_CORE_CHANNEL_H_

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace strata {

/**
 * Zero-capacity channel: a value is handed directly from one thread to another.
 *
 * Send() blocks until a receiver has taken the value. Receive() blocks until a
 * value is offered. Close() wakes everyone; afterwards Send() throws and Receive()
 * returns an empty optional once nothing is left in the slot.
 */
template <typename T>
class RendezvousChannel {
  public:
    RendezvousChannel() = default;
    RendezvousChannel(const RendezvousChannel&) = delete;
    RendezvousChannel& operator=(const RendezvousChannel&) = delete;

    void Send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !slot_.has_value(); });
        if (closed_) {
            throw std::runtime_error("worker channel closed");
        }

        slot_ = std::move(value);
        const uint64_t ticket = ++offered_;
        cv_.notify_all();

        cv_.wait(lock, [this, ticket] { return closed_ || taken_ >= ticket; });
        if (taken_ < ticket) {
            // Closed before anyone picked it up
            slot_.reset();
            throw std::runtime_error("worker channel closed");
        }
    }

    std::optional<T> Receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || slot_.has_value(); });
        if (!slot_.has_value()) {
            return std::nullopt;
        }

        std::optional<T> value = std::move(slot_);
        slot_.reset();
        ++taken_;
        cv_.notify_all();
        return value;
    }

    void Close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> slot_;
    uint64_t offered_ = 0;
    uint64_t taken_ = 0;
    bool closed_ = false;
};

}  // namespace strata

#endif  // STRATA_CORE_CHANNEL_H_
