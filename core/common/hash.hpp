#pragma once

#include <cstdint>
#include <string>

namespace arbor {

/// FNV-1a 64-bit. Stable across runs and platforms, used for origin
/// seeds and observer seeding.
inline uint64_t fnv1a64(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace arbor
