/**
 * SMiner - Job Registry
 *
 * Tracks the jobs a work source has handed out and which worker holds
 * each one, so that a new block can cancel all of them at once.
 */

#pragma once

#include "core/Job.h"
#include "util/Guards.h"
#include <map>
#include <memory>

namespace sminer {

class Worker;

class JobRegistry {
public:
    /**
     * Track a job handed to a worker
     */
    void add(const JobPtr& job, Worker& worker);

    /**
     * Stop tracking a job (called when the job is destroyed)
     */
    void remove(const Job& job);

    /**
     * Cancel every tracked job
     *
     * Flags are set under the registry lock; workers are notified after it
     * has been released.
     *
     * @param graceful Passed through to the workers
     * @return Number of jobs canceled
     */
    size_t cancelAll(bool graceful);

    /**
     * Number of tracked jobs
     */
    size_t size() const;

private:
    struct Entry {
        std::weak_ptr<Job> job;
        Worker* worker;
    };

    mutable Mutex m_mutex;
    std::map<const Job*, Entry> m_jobs;
};

}  // namespace sminer
