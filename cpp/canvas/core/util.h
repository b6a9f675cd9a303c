#ifndef ARTCHIVE_CANVAS_CORE_UTIL_H
#define ARTCHIVE_CANVAS_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
#endif

namespace canvas {

// Monotonic milliseconds. Browser builds use the page clock.
inline double canvasNowMs() {
#ifdef EMSCRIPTEN
    return emscripten_get_now();
#else
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
#endif
}

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void appendU32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    const std::size_t offset = out.size();
    out.resize(offset + sizeof(v));
    std::memcpy(out.data() + offset, &v, sizeof(v));
}

static inline void appendF32(std::vector<std::uint8_t>& out, float v) {
    const std::size_t offset = out.size();
    out.resize(offset + sizeof(v));
    std::memcpy(out.data() + offset, &v, sizeof(v));
}

} // namespace canvas

#endif // ARTCHIVE_CANVAS_CORE_UTIL_H
