/**
 * SMiner - Software Device Implementation
 */

#include "SoftwareDevice.h"
#include "crypto/Sha256.h"
#include "util/Log.h"
#include <optional>

namespace sminer {

SoftwareDevice::SoftwareDevice(unsigned threads, HashFunction hash, Nonce lastNonce)
    : m_threadCount(threads)
    , m_hash(std::move(hash))
    , m_lastNonce(lastNonce)
{
    if (m_threadCount == 0) {
        m_threadCount = std::thread::hardware_concurrency();
        if (m_threadCount == 0) {
            m_threadCount = 1;  // Fallback to 1 thread
        }
    }
}

SoftwareDevice::~SoftwareDevice() {
    close();
}

void SoftwareDevice::open() {
    Guard lock(m_mutex);
    if (m_open) {
        return;
    }

    m_open = true;
    m_closed = false;
    m_responses.clear();

    for (unsigned i = 0; i < m_threadCount; ++i) {
        m_threads.emplace_back(&SoftwareDevice::scanLoop, this, i, m_generation);
    }
}

size_t SoftwareDevice::read(uint8_t* buffer, size_t len, double timeoutSeconds) {
    UniqueGuard lock(m_mutex);
    m_responseCv.wait_for(lock, toMillis(timeoutSeconds), [this]() {
        return !m_responses.empty() || m_closed;
    });

    if (m_closed) {
        throw ChannelClosed("software device closed");
    }

    size_t n = 0;
    while (n < len && !m_responses.empty()) {
        buffer[n++] = m_responses.front();
        m_responses.pop_front();
    }
    return n;
}

void SoftwareDevice::write(const Bytes& data) {
    auto work = protocol::decodeJob(data.data(), data.size());

    Guard lock(m_mutex);
    if (m_closed || !m_open) {
        throw ChannelClosed("software device closed");
    }
    if (!work) {
        // A real device would ignore garbage as well
        Log::debug("Software device: ignoring malformed job message");
        return;
    }

    m_work = *work;
    ++m_generation;
    m_currentGeneration = m_generation;
    m_finished = 0;

    pushLocked(Bytes(1, protocol::TAG_ACK));
    m_workCv.notify_all();
}

void SoftwareDevice::close() {
    std::vector<std::thread> threads;
    {
        Guard lock(m_mutex);
        m_closed = true;
        m_open = false;
        threads.swap(m_threads);
        m_workCv.notify_all();
        m_responseCv.notify_all();
    }

    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

std::string SoftwareDevice::describe() const {
    return "software device (" + std::to_string(m_threadCount) + " threads)";
}

void SoftwareDevice::scanLoop(unsigned index, uint64_t seen) {
    while (true) {
        protocol::DeviceWork work;
        uint64_t generation;
        {
            UniqueGuard lock(m_mutex);
            m_workCv.wait(lock, [&]() { return m_closed || m_generation != seen; });
            if (m_closed) {
                return;
            }
            work = m_work;
            generation = m_generation;
            seen = generation;
        }

        std::optional<MidstateHasher> hasher;
        if (!m_hash) {
            hasher.emplace(work.midstate, work.tail);
        }

        bool aborted = false;
        uint64_t checked = 0;

        for (uint64_t nonce = index; nonce <= m_lastNonce; nonce += m_threadCount) {
            if (++checked % BATCH_SIZE == 0 &&
                (m_closed || m_currentGeneration != generation)) {
                aborted = true;
                break;
            }

            Nonce n = static_cast<Nonce>(nonce);
            bool hit = hasher ? hasher->isShare(n) : m_hash(work, n);
            if (!hit) {
                continue;
            }

            Guard lock(m_mutex);
            if (m_generation != generation) {
                aborted = true;
                break;
            }
            pushLocked(protocol::encodeSolution(n));
        }

        if (aborted) {
            continue;
        }

        // Last thread through the keyspace reports exhaustion
        Guard lock(m_mutex);
        if (m_generation == generation && ++m_finished == m_threadCount) {
            pushLocked(Bytes(1, protocol::TAG_EXHAUSTED));
        }
    }
}

void SoftwareDevice::pushLocked(const Bytes& data) {
    m_responses.insert(m_responses.end(), data.begin(), data.end());
    m_responseCv.notify_all();
}

}  // namespace sminer
