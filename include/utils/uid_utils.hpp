#pragma once
/**
 * @file uid_utils.hpp
 * @brief Generation and validation of record identifiers (RFC 4122 version 4 UUIDs).
 *
 * ## Format
 *
 *   xxxxxxxx-xxxx-4xxx-Yxxx-xxxxxxxxxxxx   (lowercase hex, 36 chars)
 *
 * where Y is one of 8, 9, a, b (the RFC 4122 variant). Random bits come from a
 * per-thread Mersenne Twister seeded from std::random_device and the clock.
 *
 * Validation accepts upper- or lowercase hex but requires the version nibble 4
 * and the RFC variant, so that hand-edited profile files with arbitrary ids are
 * reported as malformed instead of silently accepted.
 */

#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <string_view>

namespace elworkbench::uid
{

namespace detail
{

/// Returns a 32-bit random value from a per-thread engine seeded with
/// std::random_device mixed with the high-resolution clock.
inline uint32_t random_u32()
{
    static thread_local std::mt19937 engine = [] {
        std::random_device rd;
        const auto ns = static_cast<uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
        std::seed_seq seq{rd(), rd(), rd(), rd(), static_cast<uint32_t>(ns),
                          static_cast<uint32_t>(ns >> 32U)};
        return std::mt19937(seq);
    }();
    return static_cast<uint32_t>(engine());
}

inline bool is_hex(char c) noexcept
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace detail

/**
 * @brief Generate a random version 4 UUID, e.g. "3f2b1c9e-7a4d-4e21-9b0c-5d6e7f801a2b".
 */
inline std::string generate_uuid_v4()
{
    std::array<uint32_t, 4> w{detail::random_u32(), detail::random_u32(), detail::random_u32(),
                              detail::random_u32()};
    w[1] = (w[1] & 0xFFFF0FFFu) | 0x00004000u; // version 4
    w[2] = (w[2] & 0x3FFFFFFFu) | 0x80000000u; // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%04x%08x", w[0], w[1] >> 16,
                  w[1] & 0xFFFFu, w[2] >> 16, w[2] & 0xFFFFu, w[3]);
    return std::string(buf, 36);
}

/// True if @p text is a canonical version 4 UUID.
inline bool is_uuid_v4(std::string_view text) noexcept
{
    if (text.size() != 36)
        return false;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const bool dash_pos = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_pos ? text[i] != '-' : !detail::is_hex(text[i]))
            return false;
    }
    if (text[14] != '4')
        return false;
    const char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(text[19])));
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace elworkbench::uid
