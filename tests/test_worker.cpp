/**
 * SMiner - Worker Tests
 *
 * End-to-end dispatcher/listener scenarios against a scripted device with
 * all protocol timings scaled down to tens of milliseconds.
 */

#include "TestSupport.h"
#include <cmath>

using namespace sminer;
using namespace sminer::test;

namespace {

double secondsSince(TimePoint start) {
    return secondsBetween(start, Clock::now());
}

// Healthy device that also reports a low nonce for every normal job
ScriptedChannel::Responder reportingDevice() {
    return [](ScriptedChannel& channel, const Bytes& message) {
        channel.push(ackResponse());
        if (message == validationMessage()) {
            channel.push(solutionResponse(validationNonce()), 0.02);
        } else {
            channel.push(solutionResponse(0x00000100), 0.005);
        }
    };
}

void testHappyPath(Results& results) {
    std::cout << "=== Normal Operation ===" << std::endl << std::endl;

    RecordingSource source;
    auto channel = std::make_shared<ScriptedChannel>(reportingDevice());
    WorkerSettings settings = fastSettings();
    Worker worker(source, settings, factoryFor(channel));

    results.check(worker.getPhase() == WorkerPhase::Init && !worker.isRunning(), "idle before start");
    results.check(worker.getParallelJobs() == 1, "one job at a time");

    worker.start();
    results.check(waitFor([&]() { return worker.getPhase() == WorkerPhase::Running; }, 2.0),
                  "validation passes and worker runs");

    auto writes = channel->writes();
    results.check(!writes.empty() && writes[0] == validationMessage(), "validation job sent first");

    WorkerStats stats = worker.getStats();
    results.check(stats.mhps > 0, "throughput calibrated");
    results.check(std::fabs(stats.jobInterval - computeJobInterval(stats.mhps, settings)) < 1e-9,
                  "job interval derived from throughput");
    results.check(std::fabs(worker.getJobsPerSecond() - 1.0 / stats.jobInterval) < 1e-9,
                  "jobs per second follows the interval");

    auto rates = source.rates();
    results.check(rates.size() == 1 && std::fabs(rates[0] - stats.mhps * 1e6) < 1e-3,
                  "rate reported to the work source in H/s");

    results.check(waitFor([&]() { return source.issued() >= 4; }, 2.0), "jobs re-dispatched every interval");
    results.check(std::fabs(source.lastMinValidity() - (stats.jobInterval + settings.validityMargin)) < 1e-9,
                  "fetch asks for interval plus margin validity");
    results.check(waitFor([&]() { return worker.getStats().jobsCompleted >= 2; }, 2.0),
                  "replaced jobs counted as completed");
    results.check(waitFor([&]() { return worker.getStats().noncesReported >= 2; }, 2.0),
                  "device nonces reported");

    auto nonces = source.nonces();
    bool forwarded = !nonces.empty();
    for (const auto& [id, nonce] : nonces) {
        forwarded &= id.rfind("job-", 0) == 0 && (nonce == 0x100 || nonce == validationNonce());
    }
    results.check(forwarded, "nonces forwarded with their jobs");
    results.check(worker.getStats().faults == 0, "no faults on a healthy device");

    auto start = Clock::now();
    worker.stop();
    results.check(secondsSince(start) < 1.0, "stop is prompt");
    results.check(!worker.isRunning() && worker.getPhase() == WorkerPhase::ShuttingDown,
                  "worker shut down");
    results.check(source.outstanding() == 0, "every fetched job destroyed");

    bool once = true;
    for (const auto& [id, count] : source.destroyed()) {
        once &= count == 1;
    }
    results.check(once && source.destroyed().size() == source.issued(), "each job destroyed exactly once");
    results.check(channel->closes() >= 1, "device channel closed");

    worker.stop();
    results.check(!worker.isRunning(), "stop is idempotent");
}

void testWrongValidationNonce(Results& results) {
    std::cout << std::endl << "=== Faulty Device ===" << std::endl << std::endl;

    RecordingSource source;
    auto channel = std::make_shared<ScriptedChannel>([](ScriptedChannel& ch, const Bytes&) {
        ch.push(ackResponse());
        ch.push(solutionResponse(0x12345678), 0.01);
    });
    WorkerSettings settings = fastSettings();
    Worker worker(source, settings, factoryFor(channel));
    worker.start();

    results.check(waitFor([&]() { return worker.getStats().cycles >= 2; }, 2.0),
                  "cycle restarted after wrong validation nonce");
    results.check(source.logged(LogLevel::Error, "Mining device is not working correctly"),
                  "correctness fault logged at error level");

    WorkerStats stats = worker.getStats();
    results.check(stats.faults >= 1 && stats.failureCount >= 1, "fault counted");
    results.check(stats.lastBackoff == settings.retryDelay, "short backoff after first failures");
    results.check(source.rates().empty() && source.issued() == 0, "no work fetched from a faulty device");

    worker.stop();
}

void testTimeouts(Results& results) {
    std::cout << std::endl << "=== Timeouts ===" << std::endl << std::endl;
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>();
        Worker worker(source, fastSettings(), factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return worker.getStats().faults >= 1; }, 2.0),
                      "missing ack faults the cycle");
        results.check(source.logged(LogLevel::Warning, "Timeout waiting for job ACK"), "ack timeout logged");
        results.check(waitFor([&]() { return channel->opens() >= 2; }, 2.0), "device reopened");
        worker.stop();
    }
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>([](ScriptedChannel& ch, const Bytes&) {
            ch.push(ackResponse());
        });
        Worker worker(source, fastSettings(), factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return worker.getPhase() == WorkerPhase::AwaitValidationResult; }, 1.0),
                      "waiting for the validation result");
        results.check(waitFor([&]() { return worker.getStats().faults >= 1; }, 2.0),
                      "missing validation result faults the cycle");
        results.check(source.logged(LogLevel::Warning, "Timeout waiting for validation job to finish"),
                      "validation timeout logged");
        worker.stop();
    }
}

void testSpuriousAck(Results& results) {
    std::cout << std::endl << "=== Protocol Faults ===" << std::endl << std::endl;

    RecordingSource source;
    auto channel = std::make_shared<ScriptedChannel>([](ScriptedChannel& ch, const Bytes& message) {
        ch.push(ackResponse());
        if (message == validationMessage()) {
            ch.push(solutionResponse(validationNonce()), 0.02);
        } else {
            ch.push(ackResponse(), 0.005);
        }
    });
    Worker worker(source, fastSettings(), factoryFor(channel));
    worker.start();

    results.check(waitFor([&]() { return worker.getStats().faults >= 1; }, 2.0),
                  "spurious ack faults the cycle");
    results.check(source.logged(LogLevel::Warning, "spurious job ACK"), "spurious ack logged");
    results.check(waitFor([&]() { return worker.getStats().cycles >= 2; }, 2.0), "worker restarted");

    worker.stop();
    results.check(source.outstanding() == 0, "jobs of faulted cycles destroyed");
}

void testEarlyWakeups(Results& results) {
    std::cout << std::endl << "=== Early Wakeups ===" << std::endl << std::endl;

    // Long interval: anything faster than 5 s is an early wakeup
    WorkerSettings settings = fastSettings();
    settings.jobInterval = 5;
    settings.minJobInterval = 5;
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>([](ScriptedChannel& ch, const Bytes& message) {
            ch.push(ackResponse());
            if (message == validationMessage()) {
                ch.push(solutionResponse(validationNonce()), 0.02);
            } else {
                ch.push(exhaustedResponse(), 0.02);
            }
        });
        Worker worker(source, settings, factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return source.issued() >= 3; }, 1.5),
                      "keyspace exhaustion fetches new work immediately");
        results.check(waitFor([&]() { return worker.getStats().jobsCompleted >= 2; }, 1.0),
                      "exhausted jobs completed");
        results.check(worker.getStats().faults == 0, "exhaustion is not a fault");
        worker.stop();
    }
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>(healthyDevice());
        Worker worker(source, settings, factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return source.issued() == 1 && channel->writeCount() == 2; }, 2.0),
                      "first job running");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        results.check(source.cancelAll() == 1, "running job canceled");
        results.check(waitFor([&]() { return source.issued() >= 2; }, 1.0),
                      "cancellation fetches new work before the interval");
        results.check(waitFor([&]() { return source.destroyed()["job-1"] == 1; }, 1.0),
                      "canceled job destroyed");

        source.cancelAll();
        source.cancelAll();
        results.check(waitFor([&]() { return source.issued() >= 3; }, 1.0) && worker.getStats().faults == 0,
                      "repeated cancellation is harmless");

        auto start = Clock::now();
        worker.stop();
        results.check(secondsSince(start) < 1.0, "stop interrupts a long interval");
    }
}

void testNoWork(Results& results) {
    std::cout << std::endl << "=== No Work Available ===" << std::endl << std::endl;

    RecordingSource source;
    source.setAvailable(false);
    auto channel = std::make_shared<ScriptedChannel>(healthyDevice());
    Worker worker(source, fastSettings(), factoryFor(channel));
    worker.start();

    results.check(waitFor([&]() { return source.fetches() >= 5; }, 2.0), "fetch retried after no work");
    results.check(worker.getPhase() == WorkerPhase::Running && worker.getStats().faults == 0,
                  "no work is not a fault");

    source.setAvailable(true);
    results.check(waitFor([&]() { return source.issued() >= 1; }, 1.0), "work picked up when available");

    worker.stop();
}

void testBackoff(Results& results) {
    std::cout << std::endl << "=== Restart Backoff ===" << std::endl << std::endl;
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>(healthyDevice());
        channel->setFailOpen(true);

        WorkerSettings settings = fastSettings();
        settings.maxQuickRetries = 2;
        Worker worker(source, settings, factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return worker.getStats().failureCount >= 3; }, 2.0),
                      "failures counted in a row");
        results.check(waitFor([&]() { return worker.getStats().lastBackoff == settings.backoffDelay; }, 1.0),
                      "long backoff after repeated quick failures");
        results.check(source.logged(LogLevel::Warning, "transport fault"), "open failure is a transport fault");

        auto start = Clock::now();
        worker.stop();
        results.check(secondsSince(start) < 0.25, "stop interrupts the backoff");
    }
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>(healthyDevice());
        channel->setFailOpen(true);

        // Every cycle counts as long-lived: the counter never grows
        WorkerSettings settings = fastSettings();
        settings.failureWindow = 0;
        settings.maxQuickRetries = 1;
        Worker worker(source, settings, factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return worker.getStats().cycles >= 4; }, 2.0), "cycles keep restarting");
        WorkerStats stats = worker.getStats();
        results.check(stats.failureCount == 1 && stats.lastBackoff == settings.retryDelay,
                      "long-lived cycle resets the failure counter");
        worker.stop();
    }
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>(healthyDevice());
        channel->setFailOpen(true);
        Worker worker(source, fastSettings(), factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return worker.getStats().faults >= 2; }, 2.0), "device missing");
        channel->setFailOpen(false);
        results.check(waitFor([&]() { return worker.getPhase() == WorkerPhase::Running; }, 2.0),
                      "worker recovers once the device is back");
        worker.stop();
    }
}

void testLifecycle(Results& results) {
    std::cout << std::endl << "=== Lifecycle ===" << std::endl << std::endl;
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>([](ScriptedChannel& ch, const Bytes&) {
            ch.push(ackResponse());
        });
        WorkerSettings settings = fastSettings();
        settings.validationTimeout = 5;
        Worker worker(source, settings, factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return worker.getPhase() == WorkerPhase::AwaitValidationResult; }, 1.0),
                      "validating");
        auto start = Clock::now();
        worker.stop();
        results.check(secondsSince(start) < 1.0, "stop during validation is prompt");
        results.check(worker.getStats().faults == 0, "shutdown is not a fault");
    }
    {
        RecordingSource source;
        auto channel = std::make_shared<ScriptedChannel>(healthyDevice());
        WorkerSettings settings = fastSettings();
        Worker worker(source, settings, factoryFor(channel));
        worker.start();
        results.check(waitFor([&]() { return worker.getPhase() == WorkerPhase::Running; }, 2.0), "running");

        WorkerSettings changed = settings;
        changed.jobInterval = 0.2;
        changed.name = "renamed";
        worker.applySettings(changed);
        results.check(channel->opens() == 1 && worker.isRunning(), "timing change does not restart");
        results.check(worker.getName() == "test0", "worker name is fixed");

        changed.port = "/dev/ttyUSB1";
        worker.applySettings(changed);
        results.check(waitFor([&]() { return channel->opens() == 2; }, 2.0) && worker.isRunning(),
                      "port change restarts the worker");
        results.check(waitFor([&]() { return worker.getPhase() == WorkerPhase::Running; }, 2.0),
                      "restarted worker validates again");
        worker.stop();
    }
}

}  // namespace

int main() {
    Results results;

    testHappyPath(results);
    testWrongValidationNonce(results);
    testTimeouts(results);
    testSpuriousAck(results);
    testEarlyWakeups(results);
    testNoWork(results);
    testBackoff(results);
    testLifecycle(results);

    return results.finish();
}
