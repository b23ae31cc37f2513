/**
 * SMiner - Job Registry Tests
 */

#include "TestSupport.h"

using namespace sminer;
using namespace sminer::test;

namespace {

JobPtr makeJob(const std::string& id) {
    Hash256 target;
    difficultyToTarget(1.0, target);
    return std::make_shared<Job>(nullptr, id, ValidationJob::defaultHeader(), target,
                                 Clock::now() + std::chrono::hours(1));
}

}  // namespace

int main() {
    Results results;
    RecordingSource source;
    Worker worker(source, fastSettings(), factoryFor(std::make_shared<ScriptedChannel>()));

    std::cout << "=== Job Registry ===" << std::endl << std::endl;

    JobRegistry registry;
    JobPtr a = makeJob("a");
    JobPtr b = makeJob("b");
    JobPtr c = makeJob("c");

    registry.add(a, worker);
    registry.add(b, worker);
    registry.add(c, worker);
    results.check(registry.size() == 3, "jobs registered");

    registry.remove(*b);
    results.check(registry.size() == 2, "job removed");
    registry.remove(*b);
    results.check(registry.size() == 2, "removing twice is harmless");

    results.check(registry.cancelAll(false) == 2, "outstanding jobs canceled");
    results.check(a->isCanceled() && c->isCanceled() && !b->isCanceled(), "only registered jobs marked");

    // A job nobody holds any more cannot be canceled
    JobPtr d = makeJob("d");
    registry.add(d, worker);
    d.reset();
    results.check(registry.cancelAll(true) == 2, "expired job skipped");

    std::cout << std::endl << "=== Cancellation Of A Stopped Worker ===" << std::endl << std::endl;

    // Worker not running: notification is a no-op and must not block
    auto start = Clock::now();
    registry.cancelAll(false);
    results.check(secondsBetween(start, Clock::now()) < 0.1, "notifying an idle worker does not block");

    return results.finish();
}
