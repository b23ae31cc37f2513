/**
 * SMiner - Worker Settings
 *
 * Configuration surface consumed by the dispatcher/listener. All times
 * are in seconds.
 */

#pragma once

#include <cstdint>
#include <string>

namespace sminer {

/**
 * Device transport selection
 */
enum class DeviceKind {
    Serial,     // Physical device on a serial port
    Software    // In-process software hasher
};

struct WorkerSettings {
    // Worker name (logs, thread names)
    std::string name = "sminer0";

    // Transport
    DeviceKind device = DeviceKind::Serial;
    std::string port = "/dev/ttyS0";
    unsigned baudrate = 115200;
    unsigned threads = 0;           // Software device hashing threads (0 = all cores)

    // Desired job interval; upper bound of the adaptive interval
    double jobInterval = 60;

    // Protocol timing
    double ackTimeout = 1;
    double validationTimeout = 60;
    double keyspaceCeiling = 60;
    double minJobInterval = 0.5;
    double validityMargin = 2;

    // Teardown
    double listenerJoinTimeout = 5;
    double shutdownJoinTimeout = 10;

    // Restart backoff
    double failureWindow = 300;
    unsigned maxQuickRetries = 5;
    double retryDelay = 1;
    double backoffDelay = 30;

    // Nonces below this give too noisy a throughput sample
    uint32_t nonceGuard = 0x02000000;
};

/**
 * Derive the re-dispatch interval from measured throughput
 *
 * The device needs 2^32 / (mhps * 1e6) seconds to exhaust a job. That time
 * is capped at keyspaceCeiling so slow devices still talk to us regularly,
 * reduced to 80% minus one second, floored at minJobInterval and finally
 * capped by the configured jobInterval.
 *
 * @param mhps Measured throughput in MH/s
 * @param settings Worker settings
 * @return Job interval in seconds
 */
double computeJobInterval(double mhps, const WorkerSettings& settings);

}  // namespace sminer
