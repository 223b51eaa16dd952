/**
 * @file wire.hpp
 * @brief Canonical byte encodings for signed tuples
 *
 * GNS Core - Identity, Envelope and Trajectory Proofs
 *
 * All integers are big-endian; doubles are their IEEE-754 bit pattern,
 * big-endian. These encodings are part of the wire format.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace gns {
namespace wire {

inline void append_u32_be(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

inline void append_u64_be(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

inline void append_f64_be(std::vector<uint8_t>& out, double value) {
    static_assert(sizeof(double) == sizeof(uint64_t), "IEEE-754 double required");
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    append_u64_be(out, bits);
}

template <size_t N>
inline void append_bytes(std::vector<uint8_t>& out, const std::array<uint8_t, N>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void append_bytes(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void append_string(std::vector<uint8_t>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
}

/// u32be(length) || bytes
inline void append_length_prefixed(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    append_u32_be(out, static_cast<uint32_t>(bytes.size()));
    append_bytes(out, bytes);
}

inline void append_length_prefixed(std::vector<uint8_t>& out, const std::string& text) {
    append_u32_be(out, static_cast<uint32_t>(text.size()));
    append_string(out, text);
}

} // namespace wire
} // namespace gns
