#ifndef JCX_DIVAN_IO_ASYNC_MUTEX_H
#define JCX_DIVAN_IO_ASYNC_MUTEX_H

#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>

namespace jcailloux::divan::io {

// AsyncMutex — coroutine mutex that suspends instead of blocking the thread.
//
// Waiters are queued FIFO. unlock() hands ownership directly to the oldest
// waiter and resumes it on the unlocking thread, so the lock is never observed
// free while someone is queued. The waiter queue itself is protected by a
// std::mutex: lock()/unlock() may be called from any thread.
//
// Hand-offs do not nest: an unlock() issued while this thread is already
// resuming a waiter only queues the next one, and the outermost unlock()
// resumes them in a loop. Stack depth stays constant however many
// coroutines are queued.
//
// Usage (same shape as a command lock around a connection):
//   co_await mutex.lock();
//   try { ... co_await ...; } catch (...) { mutex.unlock(); throw; }
//   mutex.unlock();

class AsyncMutex {
public:
    AsyncMutex() = default;
    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    struct LockAwaiter {
        AsyncMutex* self;

        [[nodiscard]] bool await_ready() const noexcept { return false; }

        bool await_suspend(std::coroutine_handle<> h) {
            std::lock_guard guard(self->mutex_);
            if (!self->locked_) {
                self->locked_ = true;
                return false;
            }
            self->waiters_.push_back(h);
            return true;
        }

        void await_resume() noexcept {}
    };

    [[nodiscard]] LockAwaiter lock() noexcept { return {this}; }

    [[nodiscard]] bool tryLock() {
        std::lock_guard guard(mutex_);
        if (locked_) return false;
        locked_ = true;
        return true;
    }

    void unlock() {
        std::coroutine_handle<> next;
        {
            std::lock_guard guard(mutex_);
            if (waiters_.empty()) {
                locked_ = false;
                return;
            }
            next = waiters_.front();
            waiters_.pop_front();
        }

        auto& drain = handoffs();
        if (drain.active) {
            drain.pending.push_back(next);
            return;
        }

        drain.active = true;
        next.resume();
        while (!drain.pending.empty()) {
            auto h = drain.pending.front();
            drain.pending.pop_front();
            h.resume();
        }
        drain.active = false;
    }

    [[nodiscard]] bool locked() const {
        std::lock_guard guard(mutex_);
        return locked_;
    }

    [[nodiscard]] size_t waiting() const {
        std::lock_guard guard(mutex_);
        return waiters_.size();
    }

private:
    // Per-thread, shared by every AsyncMutex: a waiter handed off by one
    // mutex may unlock another while it runs.
    struct Handoffs {
        bool active = false;
        std::deque<std::coroutine_handle<>> pending;
    };

    static Handoffs& handoffs() noexcept {
        thread_local Handoffs h;
        return h;
    }

    mutable std::mutex mutex_;
    bool locked_ = false;
    std::deque<std::coroutine_handle<>> waiters_;
};

} // namespace jcailloux::divan::io

#endif // JCX_DIVAN_IO_ASYNC_MUTEX_H
