#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace CampusSim {

// FNV-1a 64-bit. A zero hash starts from the offset basis so calls can be chained
// from 0.
inline uint64_t fnv1aAppendBytes(uint64_t hash, const std::byte* data, size_t len)
{
    constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
    constexpr uint64_t kPrime = 1099511628211ull;

    if (hash == 0) {
        hash = kOffsetBasis;
    }

    for (size_t i = 0; i < len; ++i) {
        hash ^= static_cast<uint64_t>(data[i]);
        hash *= kPrime;
    }

    return hash;
}

inline uint64_t fnv1aAppendString(uint64_t hash, std::string_view text)
{
    return fnv1aAppendBytes(
        hash, reinterpret_cast<const std::byte*>(text.data()), text.size() * sizeof(char));
}

} // namespace CampusSim
