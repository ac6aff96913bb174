#ifndef KOI_PIXEL_HPP_
#define KOI_PIXEL_HPP_

#include <cstddef>
#include <cstdint>

namespace koi {

// ============================================================================
// Pixel
// ============================================================================

/**
 * A single RGBA color. Streams with three channels always carry a = 255.
 */
struct pixel {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    [[nodiscard]] constexpr bool is_gray() const noexcept {
        return r == g && g == b;
    }

    [[nodiscard]] constexpr bool same_rgb(const pixel& other) const noexcept {
        return r == other.r && g == other.g && b == other.b;
    }

    friend constexpr bool operator==(const pixel&, const pixel&) noexcept = default;
};

// Previous-pixel value at the start of every session
inline constexpr pixel START_PIXEL{0, 0, 0, 255};

// ============================================================================
// Wraparound Arithmetic
// ============================================================================

/**
 * Signed per-channel difference between two pixels, each channel
 * reduced modulo 256 into [-128, 127].
 */
struct pixel_delta {
    int r = 0;
    int g = 0;
    int b = 0;
    int a = 0;
};

[[nodiscard]] constexpr int wrap_diff(std::uint8_t curr, std::uint8_t prev) noexcept {
    return static_cast<int>(static_cast<std::int8_t>(static_cast<std::uint8_t>(curr - prev)));
}

[[nodiscard]] constexpr std::uint8_t wrap_add(std::uint8_t base, int delta) noexcept {
    return static_cast<std::uint8_t>(base + delta);
}

/**
 * Difference curr - prev on every channel.
 */
[[nodiscard]] constexpr pixel_delta diff(const pixel& curr, const pixel& prev) noexcept {
    return {wrap_diff(curr.r, prev.r), wrap_diff(curr.g, prev.g),
            wrap_diff(curr.b, prev.b), wrap_diff(curr.a, prev.a)};
}

/**
 * Inverse of diff(): apply(prev, diff(curr, prev)) == curr.
 */
[[nodiscard]] constexpr pixel apply(const pixel& prev, const pixel_delta& d) noexcept {
    return {wrap_add(prev.r, d.r), wrap_add(prev.g, d.g),
            wrap_add(prev.b, d.b), wrap_add(prev.a, d.a)};
}

// ============================================================================
// Color Hash
// ============================================================================

constexpr std::size_t CACHE_SIZE = 64;

[[nodiscard]] constexpr std::uint8_t pixel_hash(const pixel& px) noexcept {
    return static_cast<std::uint8_t>(
        (static_cast<unsigned>(px.r) * 3 + static_cast<unsigned>(px.g) * 5 +
         static_cast<unsigned>(px.b) * 7 + static_cast<unsigned>(px.a) * 11) %
        CACHE_SIZE);
}

} // namespace koi

#endif // KOI_PIXEL_HPP_
