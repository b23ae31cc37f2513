/**
 * SMiner - Worker
 *
 * Drives one hashing device. The dispatcher thread validates the device,
 * calibrates the job interval from the measured throughput and then keeps
 * exactly one job running (plus one being uploaded). Every fault tears the
 * whole dispatch cycle down and rebuilds it after an escalating backoff.
 */

#pragma once

#include "Coordination.h"
#include "WorkSource.h"
#include "WorkerSettings.h"
#include "device/DeviceChannel.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <string>

namespace sminer {

/**
 * Dispatcher state
 */
enum class WorkerPhase {
    Init,
    AwaitValidationAck,
    AwaitValidationResult,
    Running,
    ShuttingDown,
    Faulted
};

const char* workerPhaseName(WorkerPhase phase);

/**
 * Worker statistics snapshot
 */
struct WorkerStats {
    double mhps{0};             // Measured throughput (0 until calibrated)
    double jobInterval{0};      // Current re-dispatch interval in seconds
    uint64_t cycles{0};         // Dispatch cycles started
    uint64_t faults{0};         // Cycles that ended in a fault
    unsigned failureCount{0};   // Failures in a row (backoff counter)
    double lastBackoff{0};      // Last backoff delay in seconds
    uint64_t noncesReported{0};
    uint64_t jobsCompleted{0};
};

/**
 * Creates the device channel for a dispatch cycle
 */
using ChannelFactory = std::function<DeviceChannelPtr(const WorkerSettings&)>;

class Worker {
public:
    /**
     * Constructor
     *
     * @param source Work source supplying jobs (must outlive the worker)
     * @param settings Initial settings
     * @param factory Channel factory, called once per dispatch cycle
     */
    Worker(WorkSource& source, const WorkerSettings& settings, ChannelFactory factory);

    /**
     * Destructor (stops the worker)
     */
    ~Worker();

    // Non-copyable
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * Start the dispatcher thread
     *
     * Settings are copied here; later changes to transport parameters take
     * effect on the next start.
     */
    void start();

    /**
     * Stop the worker
     *
     * Idempotent, safe to call concurrently with normal operation. Waits
     * for the dispatcher at most shutdownJoinTimeout seconds.
     */
    void stop();

    /**
     * Replace the settings
     *
     * A running worker is restarted if the port or baud rate changed.
     */
    void applySettings(const WorkerSettings& settings);

    /**
     * A work source invalidated a job
     *
     * Never blocks for long and never fetches work. If the job is current
     * or being uploaded, the dispatcher wakes and fetches fresh work.
     *
     * @param job Canceled job
     * @param graceful Ignored (job upload is cheap)
     */
    void notifyCanceled(const Job& job, bool graceful);

    const std::string& getName() const { return m_name; }
    WorkSource& getSource() { return m_source; }

    bool isRunning() const { return m_running; }
    bool isShuttingDown() const { return m_shutdown; }

    WorkerPhase getPhase() const { return m_phase; }
    WorkerStats getStats() const;

    /**
     * Expected job consumption rate
     */
    double getJobsPerSecond() const { return m_jobsPerSecond; }

    /**
     * Number of jobs processed at once
     */
    unsigned getParallelJobs() const { return 1; }

    /**
     * Log through the work source
     */
    void log(const std::string& message, LogLevel level, unsigned flags = LogFlags::None);

    /**
     * Telemetry through the work source
     */
    void event(LogLevel severity, const std::string& category, const std::string& message);

private:
    void startLocked();
    void stopLocked();

    // Dispatcher thread body
    void dispatcherLoop();

    // One dispatch cycle up to a fault or shutdown
    void runCycle(Coordination& coord, DeviceChannel& channel);

    // Send a job and wait for its acknowledgement
    void dispatchJob(Coordination& coord, DeviceChannel& channel, const JobPtr& job);

    // Log a fault and count it
    void reportFault(const WorkerFault& fault);

    // Sleep before the next cycle; returns early on stop
    void backoff(double seconds);

    void setPhase(WorkerPhase phase) { m_phase = phase; }

    WorkSource& m_source;
    ChannelFactory m_factory;
    std::string m_name;

    // Settings as configured / as used by the running cycle
    WorkerSettings m_settings;
    WorkerSettings m_active;

    // Serializes start/stop/applySettings
    Mutex m_lifecycleMutex;
    TimedThread m_thread;

    // Guards m_coord and backs the backoff sleep
    mutable Mutex m_coordMutex;
    std::condition_variable m_cv;
    CoordinationPtr m_coord;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_shutdown{false};
    std::atomic<WorkerPhase> m_phase{WorkerPhase::Init};
    std::atomic<double> m_jobsPerSecond{0};

    // Statistics
    std::atomic<uint64_t> m_cycles{0};
    std::atomic<uint64_t> m_faults{0};
    std::atomic<unsigned> m_failureCount{0};
    std::atomic<double> m_lastBackoff{0};
    std::atomic<uint64_t> m_noncesReported{0};
    std::atomic<uint64_t> m_jobsCompleted{0};
};

}  // namespace sminer
