/**
 * SMiner - Benchmark Work Source Tests
 */

#include "TestSupport.h"
#include "work/BenchmarkSource.h"

using namespace sminer;
using namespace sminer::test;

int main() {
    Results results;

    std::cout << "=== Job Generation ===" << std::endl << std::endl;
    {
        BenchmarkSource bench;
        auto channel = std::make_shared<ScriptedChannel>();
        Worker worker(bench, fastSettings(), factoryFor(channel));

        JobPtr first = bench.fetchJob(worker, 10);
        JobPtr second = bench.fetchJob(worker, 10);
        results.check(first && second, "jobs generated");
        results.check(first->getId() == "bench-1" && second->getId() == "bench-2", "job ids");
        results.check(first->getHeader() != second->getHeader(), "every job has its own header");
        results.check(first->getMidstate() != second->getMidstate(), "every job has its own midstate");
        results.check(first->secondsToExpiry() > 10, "job valid long enough");

        Hash256 target;
        difficultyToTarget(1.0, target);
        results.check(first->getTarget() == target, "difficulty-1 target");
        results.check(bench.getOutstandingJobs() == 2 && bench.getJobsIssued() == 2, "jobs tracked");

        bench.newBlock();
        results.check(first->isCanceled() && second->isCanceled() && bench.getBlocks() == 1,
                      "new block cancels outstanding jobs");

        first->destroy();
        second->destroy();
        results.check(bench.getOutstandingJobs() == 0, "destroyed jobs untracked");

        JobPtr third = bench.fetchJob(worker, 10);
        results.check(!third->isCanceled(), "jobs after a new block are live");
        third->destroy();
    }

    std::cout << std::endl << "=== Nonce Verification ===" << std::endl << std::endl;
    {
        BenchmarkSource bench;
        Hash256 target;
        difficultyToTarget(1.0, target);
        Job job(&bench, "known", ValidationJob::defaultHeader(), target,
                Clock::now() + std::chrono::minutes(1));

        job.notifyNonceFound(0x5eb01f04);
        results.check(bench.getValidNonces() == 1 && bench.getInvalidNonces() == 0, "valid share counted");

        job.notifyNonceFound(0x00000001);
        results.check(bench.getInvalidNonces() == 1, "invalid share counted");

        job.recordHashesProcessed(1000);
        job.recordHashesProcessed(500);
        results.check(bench.getHashesProcessed() == 1500, "hashes accumulated");
    }

    std::cout << std::endl << "=== Block Simulation ===" << std::endl << std::endl;
    {
        BenchmarkSource bench(0.05);
        bench.start();
        results.check(waitFor([&]() { return bench.getBlocks() >= 2; }, 2.0), "blocks simulated");
        auto start = Clock::now();
        bench.stop();
        results.check(secondsBetween(start, Clock::now()) < 0.5, "stop is prompt");
    }

    std::cout << std::endl << "=== With A Worker ===" << std::endl << std::endl;
    {
        BenchmarkSource bench(0.1);
        bench.start();
        auto channel = std::make_shared<ScriptedChannel>(healthyDevice());
        Worker worker(bench, fastSettings(), factoryFor(channel));
        worker.start();

        results.check(waitFor([&]() { return bench.getJobsIssued() >= 5; }, 3.0), "worker consumes benchmark jobs");
        results.check(waitFor([&]() { return bench.getBlocks() >= 2; }, 2.0), "blocks advance while mining");
        results.check(worker.getStats().faults == 0, "no faults");

        worker.stop();
        results.check(bench.fetchJob(worker, 1) == nullptr, "no work for a stopped worker");
        results.check(bench.getOutstandingJobs() == 0, "all jobs returned");
        results.check(bench.getHashesProcessed() > 0, "hashes accounted");
        bench.stop();
    }

    return results.finish();
}
