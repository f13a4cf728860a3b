#ifndef LOCKSTEP_TICK_CHANNEL_H_
#define LOCKSTEP_TICK_CHANNEL_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include "folly/MPMCQueue.h"

namespace Lockstep {

enum class RecvStatus {
    OK,
    TIMEOUT,
    CLOSED
};

/**
 * Bounded channel on top of folly::MPMCQueue with a close flag.
 *
 * The queue itself has no notion of a disconnected peer, so the owner of the
 * receiving side calls Close() when it goes away. Senders then fail instead of
 * blocking on a queue nobody drains, and receivers stop waiting once the queue
 * is empty.
 */
template<typename T>
class Channel {
public:
    using Clock = std::chrono::steady_clock;

    explicit Channel(size_t capacity) : queue_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * Blocking send. Retries in short slices while the queue is full.
     * @return false once the channel is closed
     */
    bool Send(T item) {
        while (!closed_.load(std::memory_order_acquire)) {
            if (queue_.tryWriteUntil(Clock::now() + kSendSlice, std::move(item))) {
                return true;
            }
        }
        return false;
    }

    /**
     * Non-blocking send.
     * @return false if the channel is closed or full
     */
    bool TrySend(T item) {
        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }
        return queue_.write(std::move(item));
    }

    bool TryRecv(T& out) {
        return queue_.read(out);
    }

    // Items queued before Close() are still handed out.
    RecvStatus RecvUntil(Clock::time_point deadline, T& out) {
        if (queue_.read(out)) {
            return RecvStatus::OK;
        }
        if (closed_.load(std::memory_order_acquire)) {
            return RecvStatus::CLOSED;
        }
        if (queue_.tryReadUntil(deadline, out)) {
            return RecvStatus::OK;
        }
        return closed_.load(std::memory_order_acquire) ? RecvStatus::CLOSED : RecvStatus::TIMEOUT;
    }

    template<typename Rep, typename Period>
    RecvStatus RecvFor(std::chrono::duration<Rep, Period> timeout, T& out) {
        return RecvUntil(Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout), out);
    }

    // Sequentially consistent: a sender that wrote before seeing the flag and
    // re-checks IsClosed() after the write can't miss a concurrent Close()
    void Close() { closed_.store(true); }
    bool IsClosed() const { return closed_.load(); }

    size_t capacity() const { return queue_.capacity(); }

private:
    static constexpr std::chrono::milliseconds kSendSlice{10};

    folly::MPMCQueue<T> queue_;
    std::atomic<bool> closed_{false};
};

} // namespace Lockstep

#endif // LOCKSTEP_TICK_CHANNEL_H_
