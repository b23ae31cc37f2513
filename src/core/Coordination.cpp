/**
 * SMiner - Worker Coordination State Implementation
 */

#include "Coordination.h"

namespace sminer {

bool Coordination::awaitAck(double timeoutSeconds) {
    UniqueGuard lock(m_mutex);
    m_cv.wait_for(lock, toMillis(timeoutSeconds), [this]() {
        return !m_nextJob || m_error || m_stop;
    });
    return !m_nextJob && !m_error && !m_stop;
}

bool Coordination::awaitValidation(double timeoutSeconds) {
    UniqueGuard lock(m_mutex);
    m_cv.wait_for(lock, toMillis(timeoutSeconds), [this]() {
        return m_checkSuccess || m_error || m_stop;
    });
    return m_checkSuccess && !m_error && !m_stop;
}

bool Coordination::awaitWake(double timeoutSeconds) {
    UniqueGuard lock(m_mutex);
    bool woken = m_cv.wait_for(lock, toMillis(timeoutSeconds), [this]() {
        return m_woken || m_error || m_stop;
    });
    m_woken = false;
    return woken;
}

void Coordination::throwIfFaulted() const {
    Guard lock(m_mutex);
    if (m_error) {
        throw WorkerError(*m_error);
    }
}

bool Coordination::hasNextJob() const {
    Guard lock(m_mutex);
    return m_nextJob != nullptr;
}

bool Coordination::currentJobGone() const {
    Guard lock(m_mutex);
    return !m_job || m_job->isCanceled();
}

void Coordination::finish(TimePoint now) {
    Guard lock(m_mutex);
    endCurrentLocked(now);
    if (m_nextJob) {
        m_nextJob->destroy();
        m_nextJob.reset();
    }
    m_mhps = 0;
}

bool Coordination::acknowledge(TimePoint now) {
    Guard lock(m_mutex);
    if (!m_nextJob) {
        return false;
    }

    endCurrentLocked(now);

    m_job = std::move(m_nextJob);
    m_nextJob.reset();
    m_job->setStartTime(now);
    m_cv.notify_all();
    return true;
}

Coordination::CurrentJob Coordination::current() const {
    Guard lock(m_mutex);
    CurrentJob snapshot;
    snapshot.job = m_job;
    if (m_job) {
        snapshot.startTime = m_job->getStartTime();
    }
    return snapshot;
}

JobPtr Coordination::endCurrentJob(TimePoint now) {
    Guard lock(m_mutex);
    JobPtr ended = m_job;
    endCurrentLocked(now);
    wakeLocked();
    return ended;
}

void Coordination::confirmValidation() {
    Guard lock(m_mutex);
    m_checkSuccess = true;
    m_cv.notify_all();
}

bool Coordination::fail(const WorkerFault& fault) {
    Guard lock(m_mutex);
    bool stored = !m_error;
    if (stored) {
        m_error = fault;
    }
    wakeLocked();
    return stored;
}

std::optional<WorkerFault> Coordination::fault() const {
    Guard lock(m_mutex);
    return m_error;
}

void Coordination::requestStop() {
    Guard lock(m_mutex);
    m_stop = true;
    wakeLocked();
}

bool Coordination::stopRequested() const {
    Guard lock(m_mutex);
    return m_stop;
}

bool Coordination::wakeIfActive(const Job* job) {
    Guard lock(m_mutex);
    if (!job || (m_job.get() != job && m_nextJob.get() != job)) {
        return false;
    }
    if (m_woken) {
        return false;  // Already pending
    }
    wakeLocked();
    return true;
}

void Coordination::setMhps(double mhps) {
    Guard lock(m_mutex);
    m_mhps = mhps;
}

double Coordination::getMhps() const {
    Guard lock(m_mutex);
    return m_mhps;
}

void Coordination::setJobInterval(double seconds) {
    Guard lock(m_mutex);
    m_jobInterval = seconds;
}

double Coordination::getJobInterval() const {
    Guard lock(m_mutex);
    return m_jobInterval;
}

bool Coordination::checkSuccess() const {
    Guard lock(m_mutex);
    return m_checkSuccess;
}

bool Coordination::hasJob() const {
    Guard lock(m_mutex);
    return m_job != nullptr;
}

void Coordination::recordNonce() {
    Guard lock(m_mutex);
    ++m_noncesReported;
}

uint64_t Coordination::noncesReported() const {
    Guard lock(m_mutex);
    return m_noncesReported;
}

uint64_t Coordination::jobsEnded() const {
    Guard lock(m_mutex);
    return m_jobsEnded;
}

uint64_t Coordination::wakeCount() const {
    Guard lock(m_mutex);
    return m_wakeCount;
}

void Coordination::endCurrentLocked(TimePoint now) {
    if (!m_job) {
        return;
    }

    const auto& start = m_job->getStartTime();
    if (start) {
        double elapsed = secondsBetween(*start, now);
        if (elapsed > 0) {
            m_job->recordHashesProcessed(elapsed * m_mhps * 1e6);
        }
        m_job->clearStartTime();
    }

    if (!m_job->isValidationJob()) {
        ++m_jobsEnded;
    }
    m_job->destroy();
    m_job.reset();
}

void Coordination::wakeLocked() {
    m_woken = true;
    ++m_wakeCount;
    m_cv.notify_all();
}

}  // namespace sminer
