/**
 * SMiner - Job Registry Implementation
 */

#include "JobRegistry.h"
#include "core/Worker.h"
#include <utility>
#include <vector>

namespace sminer {

void JobRegistry::add(const JobPtr& job, Worker& worker) {
    Guard lock(m_mutex);
    m_jobs[job.get()] = Entry{job, &worker};
}

void JobRegistry::remove(const Job& job) {
    Guard lock(m_mutex);
    m_jobs.erase(&job);
}

size_t JobRegistry::cancelAll(bool graceful) {
    std::vector<std::pair<JobPtr, Worker*>> canceled;
    {
        Guard lock(m_mutex);
        for (auto& [key, entry] : m_jobs) {
            JobPtr job = entry.job.lock();
            if (!job) {
                continue;
            }
            job->markCanceled();
            canceled.emplace_back(std::move(job), entry.worker);
        }
    }

    // Workers take their own locks; never call them with ours held
    for (auto& [job, worker] : canceled) {
        worker->notifyCanceled(*job, graceful);
    }
    return canceled.size();
}

size_t JobRegistry::size() const {
    Guard lock(m_mutex);
    return m_jobs.size();
}

}  // namespace sminer
