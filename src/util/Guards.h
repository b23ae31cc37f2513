/**
 * SMiner - Lock Guards and Thread Helpers
 *
 * Lock aliases shared by all modules, plus a thread wrapper that can be
 * joined with a deadline.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sminer {

// Standard mutex aliases
using Mutex = std::mutex;
using Guard = std::lock_guard<std::mutex>;
using UniqueGuard = std::unique_lock<std::mutex>;

/**
 * TimedThread - std::thread with a bounded join
 *
 * std::thread::join() cannot time out. TimedThread signals completion
 * through a shared flag so the owner can wait with a deadline and, if the
 * thread does not finish in time, detach it and move on. Everything the
 * thread body touches must therefore be kept alive by the body itself
 * (shared_ptr captures), not by the owner.
 */
class TimedThread {
public:
    TimedThread() = default;

    ~TimedThread() {
        if (m_thread.joinable()) {
            m_thread.detach();
        }
    }

    TimedThread(const TimedThread&) = delete;
    TimedThread& operator=(const TimedThread&) = delete;

    /**
     * Start the thread
     *
     * @param body Function to run
     */
    template <typename Fn>
    void start(Fn body) {
        if (m_thread.joinable()) {
            m_thread.detach();
        }

        m_state = std::make_shared<State>();
        auto state = m_state;

        m_thread = std::thread([state, body = std::move(body)]() mutable {
            body();
            Guard lock(state->mutex);
            state->finished = true;
            state->cv.notify_all();
        });
    }

    /**
     * Wait for the thread to finish
     *
     * @param timeout Maximum time to wait
     * @return true if the thread finished and was joined, false if it was
     *         still running at the deadline (it is detached in that case)
     */
    bool joinFor(std::chrono::milliseconds timeout) {
        if (!m_thread.joinable()) {
            return true;
        }

        bool finished;
        {
            UniqueGuard lock(m_state->mutex);
            finished = m_state->cv.wait_for(lock, timeout, [this]() {
                return m_state->finished;
            });
        }

        if (finished) {
            m_thread.join();
        } else {
            m_thread.detach();
        }
        return finished;
    }

    /**
     * Check if the thread was started and has not been joined/detached
     */
    bool joinable() const { return m_thread.joinable(); }

    /**
     * Check if the calling thread is this thread
     */
    bool isCurrent() const { return m_thread.get_id() == std::this_thread::get_id(); }

private:
    struct State {
        Mutex mutex;
        std::condition_variable cv;
        bool finished{false};
    };

    std::thread m_thread;
    std::shared_ptr<State> m_state;
};

/**
 * Convert seconds (double) to a chrono duration for waits
 */
inline std::chrono::milliseconds toMillis(double seconds) {
    if (seconds <= 0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0 + 0.5));
}

}  // namespace sminer
