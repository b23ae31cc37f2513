/**
 * SMiner - Benchmark Work Source
 *
 * Local work for measuring and checking a device without a pool: synthetic
 * block headers at difficulty 1, optional simulated new blocks, and
 * verification of every nonce the device reports.
 */

#pragma once

#include "JobRegistry.h"
#include "core/WorkSource.h"
#include <atomic>
#include <condition_variable>
#include <thread>

namespace sminer {

class BenchmarkSource : public WorkSource {
public:
    /**
     * Constructor
     *
     * @param blockInterval Seconds between simulated new blocks (0 = never)
     */
    explicit BenchmarkSource(double blockInterval = 0);
    ~BenchmarkSource() override;

    /**
     * Start the block simulation (no-op without a block interval)
     */
    void start();

    /**
     * Stop the block simulation and release blocked fetches
     */
    void stop();

    /**
     * Simulate a new block: every outstanding job is canceled
     */
    void newBlock();

    JobPtr fetchJob(Worker& worker, double minValiditySeconds) override;
    void nonceFound(Job& job, Nonce nonce) override;
    void hashesProcessed(Job& job, double count) override;
    void jobDestroyed(Job& job) override;

    uint64_t getValidNonces() const { return m_validNonces; }
    uint64_t getInvalidNonces() const { return m_invalidNonces; }
    uint64_t getJobsIssued() const { return m_jobsIssued; }
    double getHashesProcessed() const;
    uint64_t getBlocks() const { return m_block; }
    size_t getOutstandingJobs() const { return m_registry.size(); }

    /**
     * Lifetime of generated jobs in seconds
     */
    static constexpr double JOB_LIFETIME = 600;

private:
    // Synthetic header for the current block and job counter
    HeaderData buildHeader(uint64_t block, uint64_t counter) const;

    void blockLoop();

    double m_blockInterval;
    JobRegistry m_registry;

    std::atomic<uint64_t> m_block{0};
    std::atomic<uint64_t> m_jobsIssued{0};
    std::atomic<uint64_t> m_validNonces{0};
    std::atomic<uint64_t> m_invalidNonces{0};

    mutable Mutex m_statsMutex;
    double m_hashes{0};

    Mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    bool m_running{false};
};

}  // namespace sminer
