/**
 * SMiner - Software Device
 *
 * In-process hasher that speaks the device wire protocol, so a worker can
 * run without hardware. Jobs written to it are acknowledged at once and
 * scanned from nonce 0 upward on a set of hashing threads.
 */

#pragma once

#include "DeviceChannel.h"
#include "Protocol.h"
#include "util/Guards.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <thread>
#include <vector>

namespace sminer {

/**
 * Decides whether a nonce is a solution for the work
 */
using HashFunction = std::function<bool(const protocol::DeviceWork&, Nonce)>;

class SoftwareDevice : public DeviceChannel {
public:
    /**
     * Constructor
     *
     * @param threads Hashing threads (0 = one per core)
     * @param hash Solution check; empty selects double SHA-256 with a
     *             difficulty-1 share check
     * @param lastNonce Last nonce scanned before reporting exhaustion
     */
    explicit SoftwareDevice(unsigned threads = 0, HashFunction hash = nullptr,
                            Nonce lastNonce = 0xFFFFFFFF);
    ~SoftwareDevice() override;

    void open() override;
    size_t read(uint8_t* buffer, size_t len, double timeoutSeconds) override;
    void write(const Bytes& data) override;
    void close() override;

    double transferDelay() const override { return 0.0; }
    std::string describe() const override;

    unsigned getThreadCount() const { return m_threadCount; }

private:
    // Hashing thread body; seen is the last job generation already handled
    void scanLoop(unsigned index, uint64_t seen);

    // Queue response bytes for read() (lock held)
    void pushLocked(const Bytes& data);

    unsigned m_threadCount;
    HashFunction m_hash;
    Nonce m_lastNonce;

    Mutex m_mutex;
    std::condition_variable m_workCv;      // Hashing threads wait for work
    std::condition_variable m_responseCv;  // read() waits for responses

    std::deque<uint8_t> m_responses;
    protocol::DeviceWork m_work{};
    uint64_t m_generation{0};              // Bumped for every job written
    std::atomic<uint64_t> m_currentGeneration{0};
    unsigned m_finished{0};                // Threads done with the current job

    std::vector<std::thread> m_threads;
    bool m_open{false};
    std::atomic<bool> m_closed{false};

    // Nonces between checks for a newer job
    static constexpr uint64_t BATCH_SIZE = 1024;
};

}  // namespace sminer
