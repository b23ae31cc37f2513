/**
 * SMiner - Job
 *
 * One unit of dispatchable proof-of-work: a header template with its
 * midstate and share target, plus the solve-tracking fields the worker
 * updates while the job runs on the device.
 */

#pragma once

#include "Types.h"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace sminer {

class WorkSource;

/**
 * Job
 *
 * Identity is the object itself: two JobPtr refer to the same job only
 * if they point to the same Job.
 *
 * Thread safety: the canceled flag may be flipped from any thread. The
 * start time is only touched while the owning worker's coordination lock
 * is held.
 */
class Job {
public:
    /**
     * Constructor
     *
     * @param source Work source receiving results (may be null)
     * @param id Identifier for logs
     * @param header 80-byte header template in getwork order
     * @param target Share target (big-endian)
     * @param expiry Time after which the job is no longer worth working on
     */
    Job(WorkSource* source, std::string id, const HeaderData& header,
        const Hash256& target, TimePoint expiry);

    virtual ~Job();

    // Non-copyable
    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const std::string& getId() const { return m_id; }
    const HeaderData& getHeader() const { return m_header; }
    const Midstate& getMidstate() const { return m_midstate; }
    const Hash256& getTarget() const { return m_target; }
    TimePoint getExpiry() const { return m_expiry; }
    WorkSource* getSource() const { return m_source; }

    /**
     * Seconds until the job expires (negative if already expired)
     */
    double secondsToExpiry() const { return secondsBetween(Clock::now(), m_expiry); }

    /**
     * Invalidate the job (a new block arrived). Idempotent, never blocks.
     */
    void markCanceled() { m_canceled = true; }

    bool isCanceled() const { return m_canceled; }

    /**
     * Account work performed on this job
     *
     * @param count Number of hashes the device computed
     */
    void recordHashesProcessed(double count);

    /**
     * Forward a nonce candidate to the work source
     */
    void notifyNonceFound(Nonce nonce);

    /**
     * Finalize the job and unregister it from cancellation tracking
     *
     * Only the first call has any effect.
     *
     * @return false if the job had already been destroyed
     */
    bool destroy();

    bool isDestroyed() const { return m_destroyed; }

    // Device start time (coordination lock held)
    const std::optional<TimePoint>& getStartTime() const { return m_startTime; }
    void setStartTime(TimePoint t) { m_startTime = t; }
    void clearStartTime() { m_startTime.reset(); }

    /**
     * Check if this job carries a pre-known solution
     */
    bool isValidationJob() const { return m_expectedNonce.has_value(); }

    /**
     * Known correct nonce of a validation job
     */
    const std::optional<Nonce>& expectedNonce() const { return m_expectedNonce; }

protected:
    std::optional<Nonce> m_expectedNonce;

private:
    WorkSource* m_source;
    std::string m_id;
    HeaderData m_header;
    Midstate m_midstate;
    Hash256 m_target;
    TimePoint m_expiry;

    std::atomic<bool> m_canceled{false};
    std::atomic<bool> m_destroyed{false};
    std::optional<TimePoint> m_startTime;
};

using JobPtr = std::shared_ptr<Job>;

/**
 * ValidationJob
 *
 * A job whose header already contains a valid difficulty-1 nonce. Sent
 * once per dispatch cycle to check the device and measure its speed.
 */
class ValidationJob : public Job {
public:
    /**
     * Construct with the built-in validation header
     */
    ValidationJob();

    /**
     * Construct from a getwork-order header whose nonce field holds the
     * expected solution
     */
    explicit ValidationJob(const HeaderData& header);

    /**
     * The built-in validation header (getwork order)
     */
    static const HeaderData& defaultHeader();
};

}  // namespace sminer
