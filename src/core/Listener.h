/**
 * SMiner - Device Response Listener
 *
 * Consumes device responses for one dispatch cycle: acknowledgements move
 * the next job to the current slot, solutions are forwarded to the work
 * source and sampled for throughput, exhaustion ends the current job.
 * Faults only ever land in the coordination error box; the dispatcher
 * decides what happens next.
 */

#pragma once

#include "Coordination.h"
#include "device/DeviceChannel.h"
#include <cstdint>
#include <memory>

namespace sminer {

class Worker;

class Listener {
public:
    /**
     * Constructor
     *
     * @param coord Coordination state of the current cycle
     * @param channel Device channel to read from
     * @param worker Owning worker (name, log and telemetry routing)
     * @param nonceGuard Nonces below this are not used as throughput samples
     */
    Listener(CoordinationPtr coord, DeviceChannelPtr channel, Worker& worker,
             uint32_t nonceGuard);

    /**
     * Thread body; returns when the cycle ends or a fault was stored
     */
    void run();

private:
    // Handle one response tag
    void handleResponse(uint8_t tag);

    void handleAck();
    void handleSolution();
    void handleExhausted();

    // Read exactly len bytes or raise a protocol fault
    void readExact(uint8_t* buffer, size_t len, double timeoutSeconds);

    CoordinationPtr m_coord;
    DeviceChannelPtr m_channel;
    Worker& m_worker;
    uint32_t m_nonceGuard;
    double m_transferDelay;
};

}  // namespace sminer
