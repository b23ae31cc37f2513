/**
 * SMiner - Benchmark Work Source Implementation
 */

#include "BenchmarkSource.h"
#include "core/Worker.h"
#include "crypto/Sha256.h"
#include <cstring>
#include <ctime>

namespace sminer {

BenchmarkSource::BenchmarkSource(double blockInterval)
    : m_blockInterval(blockInterval)
{
}

BenchmarkSource::~BenchmarkSource() {
    stop();
}

void BenchmarkSource::start() {
    Guard lock(m_mutex);
    if (m_running) {
        return;
    }
    m_running = true;

    if (m_blockInterval > 0) {
        m_thread = std::thread(&BenchmarkSource::blockLoop, this);
    }
}

void BenchmarkSource::stop() {
    {
        Guard lock(m_mutex);
        m_running = false;
        m_cv.notify_all();
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void BenchmarkSource::newBlock() {
    uint64_t block = ++m_block;
    size_t canceled = m_registry.cancelAll(false);
    Log::info("Benchmark: new block " + std::to_string(block) + " (" +
              std::to_string(canceled) + " job(s) canceled)");
}

JobPtr BenchmarkSource::fetchJob(Worker& worker, double minValiditySeconds) {
    if (worker.isShuttingDown()) {
        return nullptr;
    }
    if (minValiditySeconds > JOB_LIFETIME) {
        Log::warning("Benchmark: requested validity " + std::to_string(minValiditySeconds) +
                     "s exceeds job lifetime");
    }

    uint64_t counter = ++m_jobsIssued;
    HeaderData header = buildHeader(m_block, counter);

    Hash256 target;
    difficultyToTarget(1.0, target);

    auto job = std::make_shared<Job>(this, "bench-" + std::to_string(counter), header, target,
                                     Clock::now() + toMillis(JOB_LIFETIME));
    m_registry.add(job, worker);
    return job;
}

void BenchmarkSource::nonceFound(Job& job, Nonce nonce) {
    Hash256 hash = hashHeader(job.getHeader(), nonce);

    if (isDifficultyOne(hash)) {
        ++m_validNonces;
        Log::debug("Benchmark: valid nonce " + nonceToHex(nonce) + " on " + job.getId());
    } else {
        ++m_invalidNonces;
        Log::warning("Benchmark: invalid nonce " + nonceToHex(nonce) + " on " + job.getId());
    }
}

void BenchmarkSource::hashesProcessed(Job& job, double count) {
    (void)job;
    Guard lock(m_statsMutex);
    m_hashes += count;
}

void BenchmarkSource::jobDestroyed(Job& job) {
    m_registry.remove(job);
}

double BenchmarkSource::getHashesProcessed() const {
    Guard lock(m_statsMutex);
    return m_hashes;
}

HeaderData BenchmarkSource::buildHeader(uint64_t block, uint64_t counter) const {
    uint8_t seed[16];
    std::memcpy(seed, &block, 8);
    std::memcpy(seed + 8, &counter, 8);

    HeaderData serialized{};
    writeLE32(serialized.data(), 2);                              // version

    Hash256 prev = sha256(seed, 8);                               // previous block
    std::memcpy(serialized.data() + 4, prev.data(), prev.size());

    Hash256 merkle = sha256d(seed, sizeof(seed));                 // merkle root
    std::memcpy(serialized.data() + 36, merkle.data(), merkle.size());

    writeLE32(serialized.data() + 68, static_cast<uint32_t>(std::time(nullptr)));
    writeLE32(serialized.data() + 72, 0x1d00ffff);                // nbits
    writeLE32(serialized.data() + 76, 0);                         // nonce

    return headerToGetwork(serialized.data());
}

void BenchmarkSource::blockLoop() {
    UniqueGuard lock(m_mutex);
    while (m_running) {
        if (m_cv.wait_for(lock, toMillis(m_blockInterval), [this]() { return !m_running; })) {
            break;
        }
        lock.unlock();
        newBlock();
        lock.lock();
    }
}

}  // namespace sminer
