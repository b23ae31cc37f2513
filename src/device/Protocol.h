/**
 * SMiner - Device Wire Protocol
 *
 * Device to host: one tag byte per response
 *   1  job acknowledged (device switched to the last job sent)
 *   2  solution found, followed by the nonce (4 bytes, little-endian)
 *   3  keyspace exhausted
 *
 * Host to device: one 45-byte job message
 *   0x01 | midstate (32 bytes, reversed) | header[64..76) (reversed)
 */

#pragma once

#include "core/Types.h"
#include <optional>

namespace sminer {

class Job;

namespace protocol {

enum Tag : uint8_t {
    TAG_ACK = 1,
    TAG_SOLUTION = 2,
    TAG_EXHAUSTED = 3
};

constexpr uint8_t JOB_MESSAGE_TAG = 1;
constexpr size_t HEADER_SLICE_BEGIN = 64;
constexpr size_t HEADER_SLICE_SIZE = 12;
constexpr size_t JOB_MESSAGE_SIZE = 1 + MIDSTATE_SIZE + HEADER_SLICE_SIZE;
constexpr size_t NONCE_SIZE = 4;

/**
 * Job contents as seen by a device
 */
struct DeviceWork {
    Midstate midstate;          // Words little-endian
    uint8_t tail[HEADER_SLICE_SIZE];  // Serialized header bytes 64..75
};

/**
 * Encode a job message
 */
Bytes encodeJob(const Midstate& midstate, const HeaderData& header);

/**
 * Encode a job message for a job
 */
Bytes encodeJob(const Job& job);

/**
 * Decode a job message (device side)
 *
 * @return Work, or nullopt if the message is malformed
 */
std::optional<DeviceWork> decodeJob(const uint8_t* data, size_t len);

/**
 * Encode a solution response
 */
Bytes encodeSolution(Nonce nonce);

/**
 * Decode the nonce payload of a solution response
 */
inline Nonce decodeNonce(const uint8_t* payload) {
    return readLE32(payload);
}

}  // namespace protocol
}  // namespace sminer
