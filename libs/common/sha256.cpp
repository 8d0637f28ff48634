/**
 * @file sha256.cpp
 * @brief SHA-256 digests for identity hashing (standalone, no external dependency)
 */

#include "objfmt/common.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstring>
#include <format>

namespace objfmt::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {{
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
}};

[[nodiscard]] constexpr std::uint32_t load_be32(const std::uint8_t* p) noexcept
{
    return (static_cast<std::uint32_t>(p[0]) << 24U) | (static_cast<std::uint32_t>(p[1]) << 16U)
         | (static_cast<std::uint32_t>(p[2]) << 8U) | static_cast<std::uint32_t>(p[3]);
}

[[nodiscard]] std::string to_hex(const Sha256Digest& digest)
{
    std::string result;
    result.reserve(digest.size() * 2);
    for (std::uint8_t b : digest) {
        result += std::format("{:02x}", b);
    }
    return result;
}

}  // namespace

Sha256::Sha256() noexcept
    : m_state(kInitialState)
{}

void Sha256::update(std::string_view data) noexcept
{
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(data.data());
    std::size_t remaining = data.size();
    m_total_bytes += remaining;

    while (remaining > 0) {
        const std::size_t take = std::min(remaining, m_buffer.size() - m_buffered);
        std::memcpy(m_buffer.data() + m_buffered, bytes, take);
        m_buffered += take;
        bytes += take;
        remaining -= take;
        if (m_buffered == m_buffer.size()) {
            compress(m_buffer.data());
            m_buffered = 0;
        }
    }
}

Sha256Digest Sha256::finish() noexcept
{
    const std::uint64_t total_bits = m_total_bytes * 8U;

    m_buffer[m_buffered++] = 0x80;
    if (m_buffered > 56) {
        std::fill(m_buffer.begin() + static_cast<std::ptrdiff_t>(m_buffered), m_buffer.end(), 0);
        compress(m_buffer.data());
        m_buffered = 0;
    }
    std::fill(m_buffer.begin() + static_cast<std::ptrdiff_t>(m_buffered), m_buffer.begin() + 56, 0);
    for (std::size_t i = 0; i < 8; ++i) {
        m_buffer[56 + i] = static_cast<std::uint8_t>(total_bits >> ((7 - i) * 8U));
    }
    compress(m_buffer.data());

    Sha256Digest digest{};
    for (std::size_t i = 0; i < m_state.size(); ++i) {
        digest[i * 4 + 0] = static_cast<std::uint8_t>(m_state[i] >> 24U);
        digest[i * 4 + 1] = static_cast<std::uint8_t>(m_state[i] >> 16U);
        digest[i * 4 + 2] = static_cast<std::uint8_t>(m_state[i] >> 8U);
        digest[i * 4 + 3] = static_cast<std::uint8_t>(m_state[i]);
    }
    return digest;
}

void Sha256::compress(const std::uint8_t* block) noexcept
{
    std::array<std::uint32_t, 64> w{};
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = load_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        const std::uint32_t s0 = std::rotr(w[i - 15], 7) ^ std::rotr(w[i - 15], 18) ^ (w[i - 15] >> 3U);
        const std::uint32_t s1 = std::rotr(w[i - 2], 17) ^ std::rotr(w[i - 2], 19) ^ (w[i - 2] >> 10U);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    auto v = m_state;
    for (std::size_t i = 0; i < 64; ++i) {
        const std::uint32_t s1 = std::rotr(v[4], 6) ^ std::rotr(v[4], 11) ^ std::rotr(v[4], 25);
        const std::uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
        const std::uint32_t t1 = v[7] + s1 + ch + kRoundConstants[i] + w[i];
        const std::uint32_t s0 = std::rotr(v[0], 2) ^ std::rotr(v[0], 13) ^ std::rotr(v[0], 22);
        const std::uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        const std::uint32_t t2 = s0 + maj;

        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + t1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = t1 + t2;
    }

    for (std::size_t i = 0; i < m_state.size(); ++i) {
        m_state[i] += v[i];
    }
}

std::string sha256(std::string_view data)
{
    Sha256 hasher;
    hasher.update(data);
    return to_hex(hasher.finish());
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

std::int64_t sha256_int64(std::string_view data)
{
    Sha256 hasher;
    hasher.update(data);
    const Sha256Digest digest = hasher.finish();

    std::uint64_t folded = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        folded = (folded << 8U) | digest[i];
    }
    return std::bit_cast<std::int64_t>(folded);
}

}  // namespace objfmt::common
