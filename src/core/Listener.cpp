/**
 * SMiner - Device Response Listener Implementation
 */

#include "Listener.h"
#include "Worker.h"
#include "device/Protocol.h"
#include <iomanip>
#include <sstream>

namespace sminer {

namespace {

// Poll slice; bounds how long a fault raised by the dispatcher goes unnoticed
constexpr double READ_SLICE = 0.1;

// Time allowed for the payload of a solution response
constexpr double PAYLOAD_TIMEOUT = 1.0;

}  // namespace

Listener::Listener(CoordinationPtr coord, DeviceChannelPtr channel, Worker& worker,
                   uint32_t nonceGuard)
    : m_coord(std::move(coord))
    , m_channel(std::move(channel))
    , m_worker(worker)
    , m_nonceGuard(nonceGuard)
    , m_transferDelay(m_channel->transferDelay())
{
}

void Listener::run() {
    try {
        while (true) {
            // If the dispatcher has a problem, die before it restarts
            if (m_coord->fault() || m_coord->stopRequested()) {
                break;
            }

            uint8_t tag = 0;
            if (m_channel->read(&tag, 1, READ_SLICE) == 0) {
                continue;
            }

            handleResponse(tag);
        }
    } catch (const WorkerError& e) {
        m_worker.log("Listener: " + e.fault().describe(), LogLevel::Warning, LogFlags::Bold);
        m_coord->fail(e.fault());
    } catch (const ChannelClosed& e) {
        // Expected when the dispatcher tears the cycle down
        if (!m_coord->fault() && !m_coord->stopRequested()) {
            m_coord->fail(WorkerFault(FaultKind::Transport, e.what()));
        }
    } catch (const std::exception& e) {
        m_worker.log(std::string("Listener: read failed: ") + e.what(),
                     LogLevel::Warning, LogFlags::Bold);
        m_coord->fail(WorkerFault(FaultKind::Transport, e.what()));
    }
}

void Listener::handleResponse(uint8_t tag) {
    switch (tag) {
        case protocol::TAG_ACK:
            handleAck();
            break;

        case protocol::TAG_SOLUTION:
            handleSolution();
            break;

        case protocol::TAG_EXHAUSTED:
            handleExhausted();
            break;

        default:
            throw WorkerError(FaultKind::Protocol,
                              "Got bad message from mining device: " + std::to_string(tag));
    }
}

void Listener::handleAck() {
    if (!m_coord->acknowledge(Clock::now())) {
        throw WorkerError(FaultKind::Protocol, "Got spurious job ACK from mining device");
    }
}

void Listener::handleSolution() {
    uint8_t payload[protocol::NONCE_SIZE];
    readExact(payload, sizeof(payload), PAYLOAD_TIMEOUT);
    Nonce nonce = protocol::decodeNonce(payload);

    auto now = Clock::now();
    auto current = m_coord->current();

    // Leftover from a previous job or a repeated keyspace pass
    if (!current.job) {
        return;
    }

    // Latency critical, goes before the bookkeeping
    current.job->notifyNonceFound(nonce);
    m_coord->recordNonce();

    if (nonce >= m_nonceGuard && current.startTime) {
        double delta = secondsBetween(*current.startTime, now) - m_transferDelay;
        if (delta > 0) {
            double mhps = nonce / delta / 1e6;
            m_coord->setMhps(mhps);

            std::ostringstream ss;
            ss << std::fixed << std::setprecision(6) << mhps << " MH/s";
            m_worker.event(LogLevel::Debug, "speed", ss.str());
        }
    }

    if (current.job->isValidationJob()) {
        Nonce expected = *current.job->expectedNonce();
        if (nonce != expected) {
            throw WorkerError(FaultKind::DeviceCorrectness,
                              "Mining device is not working correctly (returned " +
                              nonceToHex(nonce) + " instead of " + nonceToHex(expected) + ")");
        }
        m_coord->confirmValidation();
    }
}

void Listener::handleExhausted() {
    m_worker.log("Exhausted keyspace!", LogLevel::Warning);

    auto current = m_coord->current();
    if (current.job && current.job->isValidationJob()) {
        throw WorkerError(FaultKind::DeviceCorrectness,
                          "Validation job terminated without finding a share");
    }

    // The device is repeating work now; stop accounting and ask for more
    m_coord->endCurrentJob(Clock::now());
}

void Listener::readExact(uint8_t* buffer, size_t len, double timeoutSeconds) {
    auto deadline = Clock::now() + toMillis(timeoutSeconds);
    size_t got = 0;

    while (got < len) {
        double remaining = secondsBetween(Clock::now(), deadline);
        if (remaining <= 0) {
            throw WorkerError(FaultKind::Protocol, "Truncated response from mining device");
        }
        got += m_channel->read(buffer + got, len - got, remaining);
    }
}

}  // namespace sminer
