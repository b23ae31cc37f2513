/**
 * SMiner - Worker Implementation
 */

#include "Worker.h"
#include "Listener.h"
#include "device/Protocol.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sminer {

double computeJobInterval(double mhps, const WorkerSettings& settings) {
    double interval = settings.keyspaceCeiling;
    if (mhps > 0) {
        interval = std::min(settings.keyspaceCeiling, KEYSPACE_SIZE / 1e6 / mhps);
    }
    return std::min(settings.jobInterval,
                    std::max(settings.minJobInterval, interval * 0.8 - 1));
}

const char* workerPhaseName(WorkerPhase phase) {
    switch (phase) {
        case WorkerPhase::Init:                  return "init";
        case WorkerPhase::AwaitValidationAck:    return "awaiting validation ack";
        case WorkerPhase::AwaitValidationResult: return "validating";
        case WorkerPhase::Running:               return "running";
        case WorkerPhase::ShuttingDown:          return "shutting down";
        case WorkerPhase::Faulted:               return "faulted";
        default:                                 return "unknown";
    }
}

Worker::Worker(WorkSource& source, const WorkerSettings& settings, ChannelFactory factory)
    : m_source(source)
    , m_factory(std::move(factory))
    , m_name(settings.name)
    , m_settings(settings)
    , m_active(settings)
{
}

Worker::~Worker() {
    stop();
}

void Worker::start() {
    Guard lock(m_lifecycleMutex);
    startLocked();
}

void Worker::stop() {
    Guard lock(m_lifecycleMutex);
    stopLocked();
}

void Worker::applySettings(const WorkerSettings& settings) {
    Guard lock(m_lifecycleMutex);

    // Port and baud rate cannot change on the fly
    bool restart = m_running &&
        (settings.port != m_active.port || settings.baudrate != m_active.baudrate);

    m_settings = settings;
    m_settings.name = m_name;

    if (restart) {
        Log::info(m_name + ": transport settings changed, restarting");
        stopLocked();
        startLocked();
    }
}

void Worker::startLocked() {
    if (m_running) {
        return;
    }

    // Cached copy, not affected by later settings changes
    m_active = m_settings;

    // Assume the configured interval until the device has been measured
    m_jobsPerSecond = 1.0 / m_active.jobInterval;

    m_shutdown = false;
    m_running = true;
    setPhase(WorkerPhase::Init);

    m_thread.start([this]() { dispatcherLoop(); });
}

void Worker::stopLocked() {
    CoordinationPtr coord;
    {
        Guard lock(m_coordMutex);
        m_shutdown = true;
        coord = m_coord;
        m_cv.notify_all();
    }

    if (coord) {
        coord->requestStop();
    }

    if (m_thread.joinable() && !m_thread.isCurrent()) {
        if (!m_thread.joinFor(toMillis(m_active.shutdownJoinTimeout))) {
            Log::warning(m_name + ": dispatcher did not stop in time");
        }
    }

    m_running = false;
}

void Worker::notifyCanceled(const Job& job, bool graceful) {
    (void)graceful;

    CoordinationPtr coord;
    {
        Guard lock(m_coordMutex);
        coord = m_coord;
    }

    if (coord) {
        coord->wakeIfActive(&job);
    }
}

WorkerStats Worker::getStats() const {
    WorkerStats stats;

    CoordinationPtr coord;
    {
        Guard lock(m_coordMutex);
        coord = m_coord;
    }

    stats.cycles = m_cycles;
    stats.faults = m_faults;
    stats.failureCount = m_failureCount;
    stats.lastBackoff = m_lastBackoff;
    stats.noncesReported = m_noncesReported;
    stats.jobsCompleted = m_jobsCompleted;

    if (coord) {
        stats.mhps = coord->getMhps();
        stats.jobInterval = coord->getJobInterval();
        stats.noncesReported += coord->noncesReported();
        stats.jobsCompleted += coord->jobsEnded();
    }
    return stats;
}

void Worker::log(const std::string& message, LogLevel level, unsigned flags) {
    m_source.reportLog(*this, message, level, flags);
}

void Worker::event(LogLevel severity, const std::string& category, const std::string& message) {
    m_source.reportEvent(severity, category, message, *this);
}

void Worker::dispatcherLoop() {
    while (!m_shutdown) {
        // Cycle start, used to decide whether failures come in a row
        TimePoint cycleStart = Clock::now();

        auto coord = std::make_shared<Coordination>();
        {
            Guard lock(m_coordMutex);
            if (m_shutdown) {
                break;
            }
            m_coord = coord;
        }
        ++m_cycles;
        setPhase(WorkerPhase::Init);

        DeviceChannelPtr channel;
        TimedThread listenerThread;
        bool faulted = false;

        try {
            channel = m_factory(m_active);
            channel->open();
            log("Opened " + channel->describe(), LogLevel::Debug);

            auto listener = std::make_shared<Listener>(coord, channel, *this, m_active.nonceGuard);
            listenerThread.start([listener]() { listener->run(); });

            runCycle(*coord, *channel);
        } catch (const WorkerError& e) {
            faulted = true;
            coord->fail(e.fault());
            reportFault(e.fault());
        } catch (const std::exception& e) {
            faulted = true;
            WorkerFault fault(FaultKind::Transport, e.what());
            coord->fail(fault);
            reportFault(fault);
        }

        // Not doing productive work any more
        if (faulted) {
            setPhase(WorkerPhase::Faulted);
        }
        coord->finish(Clock::now());
        coord->requestStop();

        // Unblocks a listener stuck in a read; the port must be closed
        // before it can be reopened anyway
        if (channel) {
            try {
                channel->close();
            } catch (const std::exception& e) {
                Log::debug(m_name + ": close failed: " + e.what());
            }
        }

        if (listenerThread.joinable() &&
            !listenerThread.joinFor(toMillis(m_active.listenerJoinTimeout))) {
            Log::debug(m_name + ": listener did not terminate in time");
        }

        {
            Guard lock(m_coordMutex);
            m_noncesReported += coord->noncesReported();
            m_jobsCompleted += coord->jobsEnded();
            m_coord.reset();
        }
        m_jobsPerSecond = 1.0 / m_active.jobInterval;

        if (m_shutdown) {
            break;
        }

        // Back off harder if the cycles keep failing quickly
        if (secondsBetween(cycleStart, Clock::now()) >= m_active.failureWindow) {
            m_failureCount = 0;
        }
        ++m_failureCount;

        double delay = m_failureCount > m_active.maxQuickRetries
            ? m_active.backoffDelay
            : m_active.retryDelay;
        m_lastBackoff = delay;

        std::ostringstream ss;
        ss << "Restarting in " << delay << " s (failure " << m_failureCount << ")";
        log(ss.str(), LogLevel::Info);

        backoff(delay);
    }

    setPhase(WorkerPhase::ShuttingDown);
}

void Worker::runCycle(Coordination& coord, DeviceChannel& channel) {
    // Check the device with a job whose solution is known
    setPhase(WorkerPhase::AwaitValidationAck);
    auto validation = std::make_shared<ValidationJob>();
    dispatchJob(coord, channel, validation);
    if (m_shutdown) {
        return;
    }

    // Large enough for devices down to ~30 MH/s at the default timeout
    setPhase(WorkerPhase::AwaitValidationResult);
    bool validated = coord.awaitValidation(m_active.validationTimeout);
    coord.throwIfFaulted();
    if (m_shutdown) {
        return;
    }
    if (!validated) {
        throw WorkerError(FaultKind::Timeout, "Timeout waiting for validation job to finish");
    }

    double mhps = coord.getMhps();
    if (mhps <= 0) {
        throw WorkerError(FaultKind::DeviceCorrectness,
                          "Validation job finished without a throughput sample");
    }

    std::ostringstream rate;
    rate << "Running at " << std::fixed << std::setprecision(6) << mhps << " MH/s";
    log(rate.str(), LogLevel::Info, LogFlags::Bold);

    double interval = computeJobInterval(mhps, m_active);
    coord.setJobInterval(interval);

    std::ostringstream ji;
    ji << "Job interval: " << std::fixed << std::setprecision(6) << interval << " seconds";
    log(ji.str(), LogLevel::Info, LogFlags::Bold);

    m_jobsPerSecond = 1.0 / interval;
    m_source.reportRateChanged(*this, mhps * 1e6);

    setPhase(WorkerPhase::Running);

    while (!m_shutdown) {
        // May block for a long time; no coordination lock is held here
        JobPtr job = m_source.fetchJob(*this, interval + m_active.validityMargin);
        if (!job) {
            if (m_shutdown) {
                break;
            }
            coord.awaitWake(m_active.retryDelay);
            coord.throwIfFaulted();
            continue;
        }

        // A new block arrived while we were fetching
        if (job->isCanceled()) {
            job->destroy();
            continue;
        }

        if (coord.fault()) {
            job->destroy();
            coord.throwIfFaulted();
        }

        dispatchJob(coord, channel, job);
        if (m_shutdown) {
            break;
        }

        // Canceled during upload: fetch fresh work right away. Checked only
        // after the acknowledgement so we agree with the device on which
        // job is current.
        if (coord.currentJobGone()) {
            continue;
        }

        // Woken early by cancellation or exhaustion
        coord.awaitWake(interval);
        coord.throwIfFaulted();
    }
}

void Worker::dispatchJob(Coordination& coord, DeviceChannel& channel, const JobPtr& job) {
    Bytes message = protocol::encodeJob(*job);
    coord.dispatch(job, [&]() { channel.write(message); });

    bool acked = coord.awaitAck(m_active.ackTimeout);
    coord.throwIfFaulted();
    if (m_shutdown) {
        return;
    }
    if (!acked && coord.hasNextJob()) {
        throw WorkerError(FaultKind::Timeout, "Timeout waiting for job ACK");
    }
}

void Worker::reportFault(const WorkerFault& fault) {
    ++m_faults;

    LogLevel level = fault.kind == FaultKind::DeviceCorrectness
        ? LogLevel::Error
        : LogLevel::Warning;
    log(fault.describe(), level, LogFlags::Bold | LogFlags::Highlight);
}

void Worker::backoff(double seconds) {
    UniqueGuard lock(m_coordMutex);
    m_cv.wait_for(lock, toMillis(seconds), [this]() { return m_shutdown.load(); });
}

}  // namespace sminer
