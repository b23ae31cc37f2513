/**
 * SMiner - SHA-256 Helpers Implementation
 */

// Midstate resumption needs the low-level SHA256_CTX API
#define OPENSSL_SUPPRESS_DEPRECATED

#include "Sha256.h"
#include <cmath>
#include <cstring>

namespace sminer {

Hash256 sha256(const uint8_t* data, size_t len) {
    Hash256 out;
    SHA256(data, len, out.data());
    return out;
}

Hash256 sha256d(const uint8_t* data, size_t len) {
    Hash256 first = sha256(data, len);
    return sha256(first.data(), first.size());
}

Midstate computeMidstate(const uint8_t* header) {
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, header, 64);

    Midstate midstate;
    for (int i = 0; i < 8; ++i) {
        writeLE32(midstate.data() + i * 4, ctx.h[i]);
    }
    return midstate;
}

HeaderData headerToGetwork(const uint8_t* serialized) {
    HeaderData out;
    std::memcpy(out.data(), serialized, HEADER_SIZE);
    swapWords(out.data(), HEADER_SIZE);
    return out;
}

HeaderData getworkToHeader(const HeaderData& getwork) {
    HeaderData out = getwork;
    swapWords(out.data(), HEADER_SIZE);
    return out;
}

MidstateHasher::MidstateHasher(const Midstate& midstate, const uint8_t* tail) {
    SHA256_Init(&m_base);
    for (int i = 0; i < 8; ++i) {
        m_base.h[i] = readLE32(midstate.data() + i * 4);
    }
    // One 64-byte block already consumed
    m_base.Nl = 512;
    m_base.Nh = 0;
    m_base.num = 0;

    std::memcpy(m_tail, tail, 12);
    std::memset(m_tail + 12, 0, 4);
}

Hash256 MidstateHasher::hash(Nonce nonce) const {
    uint8_t tail[16];
    std::memcpy(tail, m_tail, 12);
    writeLE32(tail + 12, nonce);

    SHA256_CTX ctx = m_base;
    Hash256 first;
    SHA256_Update(&ctx, tail, sizeof(tail));
    SHA256_Final(first.data(), &ctx);

    return sha256(first.data(), first.size());
}

bool MidstateHasher::isShare(Nonce nonce) const {
    return isDifficultyOne(hash(nonce));
}

Hash256 hashHeader(const HeaderData& getwork, Nonce nonce) {
    HeaderData serialized = getworkToHeader(getwork);
    writeLE32(serialized.data() + 76, nonce);
    return sha256d(serialized.data(), serialized.size());
}

bool meetsTarget(const Hash256& hash, const Hash256& target) {
    // hash is little-endian, target big-endian
    for (int i = 0; i < 32; ++i) {
        uint8_t h = hash[31 - i];
        if (h < target[i]) return true;
        if (h > target[i]) return false;
    }
    return true;  // Equal
}

void difficultyToTarget(double difficulty, Hash256& target) {
    // Known pdiff vectors:
    // - difficulty 1:     0x00000000FFFF0000...00
    // - difficulty 1.5:   0x00000000AAAA0000...00
    // - difficulty 2:     0x000000007FFF8000...00
    // - difficulty 256:   0x0000000000FFFF00...00

    target.fill(0);

    if (difficulty <= 0) {
        target.fill(0xFF);
        return;
    }

    if (difficulty < 1.0) {
        // Pools may hand out sub-1 difficulty; devices only report
        // difficulty-1 shares, so the base target is the loosest useful one
        target[4] = 0xFF;
        target[5] = 0xFF;
        return;
    }

    constexpr double MAX_SAFE_DIFFICULTY = 1e15;
    if (difficulty > MAX_SAFE_DIFFICULTY) {
        difficulty = MAX_SAFE_DIFFICULTY;
    }

#if defined(__SIZEOF_INT128__)
    // Long division of (0xFFFF << 208) * 2^32 by difficulty * 2^32, one
    // dividend byte at a time; the 2^32 scaling keeps fractional difficulty
    // and shifts the quotient by 4 bytes.
    __uint128_t diffScaled = static_cast<__uint128_t>(difficulty * 4294967296.0);
    if (diffScaled == 0) diffScaled = 1;

    __uint128_t remainder = 0;

    for (int i = 0; i < 36; i++) {
        uint8_t dividendByte = (i == 4 || i == 5) ? 0xFF : 0;

        remainder = (remainder << 8) | dividendByte;

        __uint128_t q = remainder / diffScaled;

        int outputPos = i - 4;
        if (outputPos >= 0 && outputPos < 32) {
            target[outputPos] = (q > 255) ? 255 : static_cast<uint8_t>(q);
        }

        remainder = remainder % diffScaled;
    }
#else
    double quotient = 65535.0 / difficulty;

    for (int i = 4; i < 32; i++) {
        int bitShift = 8 * i - 40;
        double scaled = (bitShift >= 0) ? quotient * std::pow(2.0, bitShift)
                                        : quotient / std::pow(2.0, -bitShift);

        double byteVal = std::fmod(std::floor(scaled), 256.0);
        if (byteVal < 0) byteVal = 0;
        if (byteVal > 255) byteVal = 255;
        target[i] = static_cast<uint8_t>(byteVal);
    }
#endif

    bool allZero = true;
    for (uint8_t b : target) {
        if (b != 0) {
            allZero = false;
            break;
        }
    }
    if (allZero) {
        target[31] = 1;  // Minimum target
    }
}

}  // namespace sminer
