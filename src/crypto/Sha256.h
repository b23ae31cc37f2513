/**
 * SMiner - SHA-256 Helpers
 *
 * Bitcoin-style double SHA-256, header midstates and target checks,
 * built on OpenSSL's SHA-256.
 */

#pragma once

#include "core/Types.h"
#include <openssl/sha.h>

namespace sminer {

/**
 * Single SHA-256
 */
Hash256 sha256(const uint8_t* data, size_t len);

/**
 * Double SHA-256 (digest byte order, i.e. little-endian as a number)
 */
Hash256 sha256d(const uint8_t* data, size_t len);

inline Hash256 sha256d(const Bytes& data) {
    return sha256d(data.data(), data.size());
}

/**
 * Compute the midstate of a serialized block header
 *
 * @param header First 64 bytes of the serialized header
 * @return SHA-256 state words, each stored little-endian
 */
Midstate computeMidstate(const uint8_t* header);

/**
 * Convert a serialized 80-byte header to getwork word order
 */
HeaderData headerToGetwork(const uint8_t* serialized);

/**
 * Convert a getwork-order header template back to serialized form
 */
HeaderData getworkToHeader(const HeaderData& getwork);

/**
 * Double SHA-256 of a header resumed from its midstate
 *
 * Hashes only the last 16 header bytes (12 tail bytes + nonce), so the
 * per-nonce cost is two compressions instead of three.
 */
class MidstateHasher {
public:
    /**
     * Constructor
     *
     * @param midstate Midstate (words little-endian)
     * @param tail Serialized header bytes 64..75
     */
    MidstateHasher(const Midstate& midstate, const uint8_t* tail);

    /**
     * Hash the header with the given nonce
     */
    Hash256 hash(Nonce nonce) const;

    /**
     * Check if the nonce yields a difficulty-1 share
     */
    bool isShare(Nonce nonce) const;

private:
    SHA256_CTX m_base;
    uint8_t m_tail[16];
};

/**
 * Hash a getwork-order header template with the given nonce
 */
Hash256 hashHeader(const HeaderData& getwork, Nonce nonce);

/**
 * Check hash (digest byte order) against a big-endian target
 *
 * @return true if hash <= target
 */
bool meetsTarget(const Hash256& hash, const Hash256& target);

/**
 * Check if the top 32 bits of the hash are zero (difficulty-1 share)
 */
inline bool isDifficultyOne(const Hash256& hash) {
    return hash[28] == 0 && hash[29] == 0 && hash[30] == 0 && hash[31] == 0;
}

/**
 * Convert pool difficulty to a big-endian 256-bit target
 *
 * target = 0x00000000FFFF0000...00 / difficulty
 */
void difficultyToTarget(double difficulty, Hash256& target);

}  // namespace sminer
