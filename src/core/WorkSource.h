/**
 * SMiner - Work Source Interface
 *
 * Supplies jobs to workers and receives their results. Implemented by the
 * pool client and the benchmark source.
 */

#pragma once

#include "Job.h"
#include "util/Log.h"
#include <string>

namespace sminer {

class Worker;

/**
 * Display hints for worker log lines
 */
namespace LogFlags {
    constexpr unsigned None = 0;
    constexpr unsigned Bold = 1u << 0;
    constexpr unsigned Highlight = 1u << 1;
}

/**
 * WorkSource
 *
 * Lock order: a work source must never hold its own lock while calling
 * Worker::notifyCanceled().
 */
class WorkSource {
public:
    virtual ~WorkSource() = default;

    /**
     * Get a job for a worker
     *
     * Blocks until work valid for at least minValiditySeconds is available.
     *
     * @param worker Requesting worker
     * @param minValiditySeconds Minimum remaining validity of the job
     * @return New job, or nullptr if the worker or the source is stopping
     */
    virtual JobPtr fetchJob(Worker& worker, double minValiditySeconds) = 0;

    /**
     * The worker's measured hash rate changed
     *
     * @param worker Reporting worker
     * @param hashesPerSecond New rate
     */
    virtual void reportRateChanged(Worker& worker, double hashesPerSecond);

    /**
     * Telemetry event
     */
    virtual void reportEvent(LogLevel severity, const std::string& category,
                             const std::string& message, Worker& worker);

    /**
     * Log line originating from a worker
     */
    virtual void reportLog(Worker& worker, const std::string& message,
                           LogLevel level, unsigned flags = LogFlags::None);

    // Job hooks, invoked through Job

    /**
     * A device reported a nonce candidate for the job
     */
    virtual void nonceFound(Job& job, Nonce nonce) = 0;

    /**
     * A device finished some amount of work on the job
     */
    virtual void hashesProcessed(Job& job, double count) = 0;

    /**
     * The job ended; drop it from cancellation tracking
     */
    virtual void jobDestroyed(Job& job) = 0;
};

}  // namespace sminer
