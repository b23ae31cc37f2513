/**
 * SMiner - Listener Tests
 *
 * Drives the listener with a scripted device and checks how each device
 * response changes the coordination state.
 */

#include "TestSupport.h"
#include "core/Listener.h"

using namespace sminer;
using namespace sminer::test;

namespace {

/**
 * Listener running on its own thread against a scripted channel
 */
struct Harness {
    RecordingSource source;
    std::shared_ptr<ScriptedChannel> channel = std::make_shared<ScriptedChannel>();
    Worker worker{source, fastSettings(), factoryFor(channel)};
    CoordinationPtr coord = std::make_shared<Coordination>();
    std::thread thread;

    explicit Harness(uint32_t nonceGuard = 0x02000000) {
        channel->open();
        auto listener = std::make_shared<Listener>(coord, channel, worker, nonceGuard);
        thread = std::thread([listener]() { listener->run(); });
    }

    ~Harness() {
        coord->requestStop();
        channel->close();
        thread.join();
        coord->finish(Clock::now());
    }

    // Dispatch a job and let the device acknowledge it
    bool start(const JobPtr& job) {
        coord->dispatch(job, []() {});
        channel->push(ackResponse());
        return coord->awaitAck(1.0);
    }

    bool faultIs(FaultKind kind) {
        return waitFor([this]() { return coord->fault().has_value(); }, 2.0) &&
               coord->fault()->kind == kind;
    }
};

JobPtr makeJob(WorkSource& source, const std::string& id) {
    Hash256 target;
    difficultyToTarget(1.0, target);
    return std::make_shared<Job>(&source, id, ValidationJob::defaultHeader(), target,
                                 Clock::now() + std::chrono::hours(1));
}

}  // namespace

int main() {
    Results results;

    std::cout << "=== Acknowledgements ===" << std::endl << std::endl;
    {
        Harness h;
        results.check(h.start(makeJob(h.source, "a")), "ack promotes the uploaded job");
        h.channel->push(ackResponse());
        results.check(h.faultIs(FaultKind::Protocol), "spurious ack is a protocol fault");
        results.check(h.coord->fault()->message.find("spurious") != std::string::npos,
                      "spurious ack message");
    }

    std::cout << std::endl << "=== Validation ===" << std::endl << std::endl;
    {
        Harness h;
        h.start(std::make_shared<ValidationJob>());
        h.channel->push(solutionResponse(validationNonce()), 0.02);
        results.check(h.coord->awaitValidation(1.0), "expected nonce confirms the device");
        results.check(h.coord->getMhps() > 0, "throughput measured from the validation nonce");
        results.check(!h.coord->fault(), "no fault on a healthy device");
    }
    {
        Harness h;
        h.start(std::make_shared<ValidationJob>());
        h.channel->push(solutionResponse(0x12345678));
        results.check(h.faultIs(FaultKind::DeviceCorrectness), "wrong nonce is a correctness fault");
        results.check(h.coord->fault()->message.find("returned 12345678 instead of 5eb01f04") !=
                      std::string::npos, "correctness fault names both nonces");
        results.check(!h.coord->checkSuccess(), "device not confirmed");
    }
    {
        Harness h;
        h.start(std::make_shared<ValidationJob>());
        h.channel->push(exhaustedResponse());
        results.check(h.faultIs(FaultKind::DeviceCorrectness), "exhausted validation job is a fault");
        results.check(h.coord->fault()->message.find("without finding a share") != std::string::npos,
                      "exhausted validation message");
    }

    std::cout << std::endl << "=== Solutions ===" << std::endl << std::endl;
    {
        Harness h;
        JobPtr job = makeJob(h.source, "s1");
        h.start(job);
        h.coord->setMhps(5);

        h.channel->push(solutionResponse(0x00001000));
        results.check(waitFor([&]() { return h.coord->noncesReported() == 1; }, 1.0),
                      "solution reported");
        auto nonces = h.source.nonces();
        results.check(nonces.size() == 1 && nonces[0].first == "s1" && nonces[0].second == 0x1000,
                      "nonce forwarded to the work source");
        results.check(h.coord->getMhps() == 5, "nonce below guard gives no throughput sample");

        h.channel->push(solutionResponse(0x40000000), 0.01);
        results.check(waitFor([&]() { return h.coord->noncesReported() == 2; }, 1.0) &&
                      h.coord->getMhps() != 5, "nonce above guard updates throughput");
        results.check(!h.source.events().empty() &&
                      h.source.events().back().find("speed") == 0, "speed telemetry event");
        results.check(!h.coord->checkSuccess(), "normal job does not confirm validation");
    }
    {
        Harness h;
        h.channel->push(solutionResponse(0x40000000));
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        results.check(h.coord->noncesReported() == 0 && !h.coord->fault() && h.source.nonces().empty(),
                      "solution without a current job is dropped");
    }

    std::cout << std::endl << "=== Exhaustion ===" << std::endl << std::endl;
    {
        Harness h;
        JobPtr job = makeJob(h.source, "e1");
        h.start(job);
        h.coord->setMhps(10);
        uint64_t wakes = h.coord->wakeCount();

        h.channel->push(exhaustedResponse(), 0.02);
        results.check(waitFor([&]() { return job->isDestroyed(); }, 1.0), "exhausted job ended");
        results.check(!h.coord->hasJob() && h.coord->wakeCount() > wakes, "dispatcher woken");
        results.check(h.source.hashes() > 0, "hashes accounted until exhaustion");
        results.check(h.source.logged(LogLevel::Warning, "Exhausted keyspace"), "exhaustion logged");
        results.check(!h.coord->fault(), "exhaustion of a normal job is not a fault");
    }

    std::cout << std::endl << "=== Malformed Responses ===" << std::endl << std::endl;
    {
        Harness h;
        h.channel->push(Bytes(1, 7));
        results.check(h.faultIs(FaultKind::Protocol), "unknown tag is a protocol fault");
        results.check(h.coord->fault()->message.find("bad message from mining device: 7") !=
                      std::string::npos, "unknown tag message");
    }
    {
        Harness h;
        h.start(makeJob(h.source, "t1"));
        h.channel->push(Bytes{static_cast<uint8_t>(protocol::TAG_SOLUTION), 0x01, 0x02});
        results.check(h.faultIs(FaultKind::Protocol), "truncated solution is a protocol fault");
    }

    std::cout << std::endl << "=== Channel Loss ===" << std::endl << std::endl;
    {
        Harness h;
        h.channel->close();
        results.check(h.faultIs(FaultKind::Transport), "unexpected close is a transport fault");
    }
    {
        Harness h;
        h.coord->requestStop();
        h.channel->close();
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        results.check(!h.coord->fault(), "close during shutdown is not a fault");
    }

    return results.finish();
}
