/**
 * SMiner - Job Implementation
 */

#include "Job.h"
#include "WorkSource.h"
#include "crypto/Sha256.h"
#include <cstring>
#include <stdexcept>

namespace sminer {

namespace {

// Header with a known difficulty-1 nonce (0x5eb01f04), getwork order
const char* VALIDATION_HEADER_HEX =
    "00000001c3bf95208a646ee98a58cf97c3a0c4b7bf5de4c89ca04495000005200000000024d1"
    "fff8d5d73ae11140e4e48032cd88ee01d48c67147f9a09cd41fdec2e25824f5c038d1a0b350c"
    "5eb01f04";

Hash256 difficultyOneTarget() {
    Hash256 target;
    difficultyToTarget(1.0, target);
    return target;
}

}  // namespace

Job::Job(WorkSource* source, std::string id, const HeaderData& header,
         const Hash256& target, TimePoint expiry)
    : m_source(source)
    , m_id(std::move(id))
    , m_header(header)
    , m_target(target)
    , m_expiry(expiry)
{
    HeaderData serialized = getworkToHeader(header);
    m_midstate = computeMidstate(serialized.data());
}

Job::~Job() = default;

void Job::recordHashesProcessed(double count) {
    if (m_source && count > 0) {
        m_source->hashesProcessed(*this, count);
    }
}

void Job::notifyNonceFound(Nonce nonce) {
    if (m_source) {
        m_source->nonceFound(*this, nonce);
    }
}

bool Job::destroy() {
    if (m_destroyed.exchange(true)) {
        return false;
    }
    if (m_source) {
        m_source->jobDestroyed(*this);
    }
    return true;
}

const HeaderData& ValidationJob::defaultHeader() {
    static const HeaderData header = []() {
        Bytes bytes;
        if (!fromHex(VALIDATION_HEADER_HEX, bytes) || bytes.size() != HEADER_SIZE) {
            throw std::logic_error("Malformed validation header");
        }
        HeaderData data;
        std::memcpy(data.data(), bytes.data(), HEADER_SIZE);
        return data;
    }();
    return header;
}

ValidationJob::ValidationJob()
    : ValidationJob(defaultHeader())
{
}

ValidationJob::ValidationJob(const HeaderData& header)
    : Job(nullptr, "validation", header, difficultyOneTarget(),
          Clock::now() + std::chrono::hours(1))
{
    // The nonce word is stored big-endian in getwork order
    m_expectedNonce = readBE32(header.data() + 76);
}

}  // namespace sminer
