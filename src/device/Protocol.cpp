/**
 * SMiner - Device Wire Protocol Implementation
 */

#include "Protocol.h"
#include "core/Job.h"
#include <algorithm>
#include <iterator>
#include <cstring>

namespace sminer {
namespace protocol {

Bytes encodeJob(const Midstate& midstate, const HeaderData& header) {
    Bytes msg;
    msg.reserve(JOB_MESSAGE_SIZE);
    msg.push_back(JOB_MESSAGE_TAG);
    msg.insert(msg.end(), midstate.rbegin(), midstate.rend());

    auto sliceBegin = header.begin() + HEADER_SLICE_BEGIN;
    auto sliceEnd = sliceBegin + HEADER_SLICE_SIZE;
    msg.insert(msg.end(), std::make_reverse_iterator(sliceEnd),
               std::make_reverse_iterator(sliceBegin));
    return msg;
}

Bytes encodeJob(const Job& job) {
    return encodeJob(job.getMidstate(), job.getHeader());
}

std::optional<DeviceWork> decodeJob(const uint8_t* data, size_t len) {
    if (len != JOB_MESSAGE_SIZE || data[0] != JOB_MESSAGE_TAG) {
        return std::nullopt;
    }

    DeviceWork work;
    const uint8_t* p = data + 1;
    std::reverse_copy(p, p + MIDSTATE_SIZE, work.midstate.begin());
    p += MIDSTATE_SIZE;

    // Back to getwork order, then to serialized order
    std::reverse_copy(p, p + HEADER_SLICE_SIZE, work.tail);
    swapWords(work.tail, HEADER_SLICE_SIZE);
    return work;
}

Bytes encodeSolution(Nonce nonce) {
    Bytes msg(1 + NONCE_SIZE);
    msg[0] = TAG_SOLUTION;
    writeLE32(msg.data() + 1, nonce);
    return msg;
}

}  // namespace protocol
}  // namespace sminer
