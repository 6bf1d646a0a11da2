#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace procgeo {

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint64_t hashString(std::uint64_t h, std::string_view s) {
    h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
    // Length terminator keeps "ab"+"c" distinct from "a"+"bc".
    return hashU32(h, static_cast<std::uint32_t>(s.size()));
}

} // namespace procgeo
