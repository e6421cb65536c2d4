#ifndef ISOVOXEL_CORE_UTIL_H
#define ISOVOXEL_CORE_UTIL_H

#include <cstdint>
#include <cstddef>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now().time_since_epoch()).count();
}
#endif

namespace isovoxel {

// Milliseconds; monotonic within a session. Only used for snapshot stamps and timings.
inline double nowMs() {
    return emscripten_get_now();
}

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

} // namespace isovoxel

#endif // ISOVOXEL_CORE_UTIL_H
