/**
 * SMiner - Core Types
 */

#pragma once

#include "util/Guards.h"
#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sminer {

// Hash types
using Hash256 = std::array<uint8_t, 32>;
using Bytes = std::vector<uint8_t>;

// Block header template (80 bytes, getwork word order)
constexpr size_t HEADER_SIZE = 80;
using HeaderData = std::array<uint8_t, HEADER_SIZE>;

// SHA-256 state after the first 64 header bytes, words little-endian
constexpr size_t MIDSTATE_SIZE = 32;
using Midstate = std::array<uint8_t, MIDSTATE_SIZE>;

// Nonce type (32-bit header nonce)
using Nonce = uint32_t;

// Size of the nonce keyspace a device scans per job
constexpr double KEYSPACE_SIZE = 4294967296.0;

// Monotonic clock used for all job timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Seconds between two time points
inline double secondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

// Convert bytes to hex string
inline std::string toHex(const uint8_t* data, size_t len) {
    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex[data[i] >> 4]);
        result.push_back(hex[data[i] & 0x0f]);
    }
    return result;
}

template <size_t N>
inline std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}

inline std::string toHex(const Bytes& data) {
    return toHex(data.data(), data.size());
}

// Decode one hex digit, -1 if invalid
inline int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * Convert hex string to bytes
 *
 * @return false on odd length or invalid characters (out untouched)
 */
inline bool fromHex(const std::string& hex, Bytes& out) {
    if (hex.length() % 2 != 0) {
        return false;
    }

    Bytes result;
    result.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        int hi = hexDigit(hex[i]);
        int lo = hexDigit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    out = std::move(result);
    return true;
}

// Read/write 32-bit little-endian / big-endian words
inline uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void writeLE32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

inline uint32_t readBE32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline void writeBE32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

// Byte-swap every 32-bit word (serialized header <-> getwork order)
inline void swapWords(uint8_t* data, size_t len) {
    for (size_t i = 0; i + 4 <= len; i += 4) {
        std::swap(data[i], data[i + 3]);
        std::swap(data[i + 1], data[i + 2]);
    }
}

// Format a nonce as 8 hex digits (big-endian, as Stratum expects)
inline std::string nonceToHex(Nonce nonce) {
    uint8_t be[4];
    writeBE32(be, nonce);
    return toHex(be, 4);
}

}  // namespace sminer
