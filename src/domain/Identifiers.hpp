/**
 * @file Identifiers.hpp
 * @brief Name-based UUID generation for engine output.
 */

#pragma once
#include <string>
#include <cstdint>
#include <cstdio>

namespace metriclens::domain {

/**
 * @brief Derives a stable UUID string (RFC 4122 layout, version 8) from a name.
 *
 * Same name, same id: reruns over the same data produce identical output.
 */
inline std::string NameBasedUuid(const std::string& name) {
    // Two FNV-1a passes with different offset bases give 128 bits.
    auto fnv1a = [&name](std::uint64_t hash) {
        for (unsigned char c : name) {
            hash ^= c;
            hash *= 0x100000001b3ULL;
        }
        return hash;
    };
    std::uint64_t hi = fnv1a(0xcbf29ce484222325ULL);
    std::uint64_t lo = fnv1a(0x84222325cbf29ce4ULL ^ hi);

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000008000ULL; // version 8
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace metriclens::domain
