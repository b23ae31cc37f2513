/**
 * SMiner - Worker Coordination State
 *
 * State shared by a worker's dispatcher and listener for one dispatch
 * cycle: the current/next job slots, the error box, the validation flag
 * and the throughput figures. A fresh instance is created for every cycle
 * and discarded on restart.
 *
 * Every field is guarded by one mutex which also backs the wakeup
 * condition, so each transition below mutates and notifies atomically.
 */

#pragma once

#include "Job.h"
#include "WorkerError.h"
#include <condition_variable>
#include <memory>
#include <optional>

namespace sminer {

class Coordination {
public:
    /**
     * Snapshot of the current job slot
     */
    struct CurrentJob {
        JobPtr job;
        std::optional<TimePoint> startTime;
    };

    Coordination() = default;

    // Non-copyable
    Coordination(const Coordination&) = delete;
    Coordination& operator=(const Coordination&) = delete;

    // ---- Dispatcher side ----

    /**
     * Place a job in the next slot and hand it to the device
     *
     * The send runs under the lock so that an acknowledgement cannot be
     * processed before the slot is filled. Clears any pending wakeup.
     *
     * @param job Job to dispatch
     * @param send Writes the job to the device (may throw)
     */
    template <typename SendFn>
    void dispatch(const JobPtr& job, SendFn send) {
        UniqueGuard lock(m_mutex);
        if (m_nextJob && m_nextJob != job) {
            m_nextJob->destroy();
        }
        m_nextJob = job;
        m_woken = false;
        send();
    }

    /**
     * Wait until the next slot is emptied by an acknowledgement
     *
     * @return true if acknowledged (false on timeout, fault or stop)
     */
    bool awaitAck(double timeoutSeconds);

    /**
     * Wait until the validation job's nonce was confirmed
     *
     * @return true if confirmed
     */
    bool awaitValidation(double timeoutSeconds);

    /**
     * Wait for a wakeup (cancellation, exhaustion, fault or stop)
     *
     * A wakeup raised before the call is not lost. The wakeup is consumed.
     *
     * @return true if woken before the timeout
     */
    bool awaitWake(double timeoutSeconds);

    /**
     * Rethrow the error box content as WorkerError
     */
    void throwIfFaulted() const;

    /**
     * Check if the next slot is still occupied
     */
    bool hasNextJob() const;

    /**
     * Check if the current job was canceled
     *
     * @return true if there is no current job or it was canceled
     */
    bool currentJobGone() const;

    /**
     * End the cycle: finalize the current job, drop the next one and
     * zero the throughput
     */
    void finish(TimePoint now);

    // ---- Listener side ----

    /**
     * Move the next job to the current slot
     *
     * Finalizes the previous current job, stamps the new job's start time
     * and wakes the dispatcher.
     *
     * @return false if no job was waiting for acknowledgement
     */
    bool acknowledge(TimePoint now);

    /**
     * Snapshot the current job and its start time
     */
    CurrentJob current() const;

    /**
     * Finalize the current job (device exhausted it) and wake the dispatcher
     *
     * @return The finalized job, or nullptr if there was none
     */
    JobPtr endCurrentJob(TimePoint now);

    /**
     * Mark the validation job as confirmed and wake the dispatcher
     */
    void confirmValidation();

    // ---- Both sides ----

    /**
     * Store a fault (first one wins) and wake the dispatcher
     *
     * @return true if this fault was stored
     */
    bool fail(const WorkerFault& fault);

    /**
     * Content of the error box
     */
    std::optional<WorkerFault> fault() const;

    /**
     * Ask both actors to wind down
     */
    void requestStop();

    bool stopRequested() const;

    /**
     * Wake the dispatcher if the job is in the current or next slot
     *
     * @return true if a wakeup was raised
     */
    bool wakeIfActive(const Job* job);

    // Throughput figures
    void setMhps(double mhps);
    double getMhps() const;
    void setJobInterval(double seconds);
    double getJobInterval() const;

    bool checkSuccess() const;
    bool hasJob() const;

    /**
     * Count a nonce reported by the device
     */
    void recordNonce();

    uint64_t noncesReported() const;

    /**
     * Number of regular jobs finalized in this cycle
     */
    uint64_t jobsEnded() const;

    /**
     * Number of wakeups raised so far
     */
    uint64_t wakeCount() const;

private:
    // Finalize accounting of the current job and destroy it (lock held)
    void endCurrentLocked(TimePoint now);

    // Raise a wakeup (lock held)
    void wakeLocked();

    mutable Mutex m_mutex;
    std::condition_variable m_cv;

    JobPtr m_job;
    JobPtr m_nextJob;
    std::optional<WorkerFault> m_error;
    bool m_checkSuccess{false};
    double m_mhps{0};
    double m_jobInterval{0};

    bool m_woken{false};
    bool m_stop{false};
    uint64_t m_wakeCount{0};
    uint64_t m_noncesReported{0};
    uint64_t m_jobsEnded{0};
};

using CoordinationPtr = std::shared_ptr<Coordination>;

}  // namespace sminer
