#ifndef KOI_OPS_HPP_
#define KOI_OPS_HPP_

#include <koi/koi_export.h>
#include <koi/pixel.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace koi {

// ============================================================================
// Op-code Table
// ============================================================================
//
// Every leading byte belongs to exactly one row:
//
//   0x00-0x3F  index        00xxxxxx                cache slot
//   0x40-0x7F  diff         01rrggbb                dr,dg,db in [-2, 1]
//   0x80-0xBF  luma         10gggggg rrrrbbbb       dg in [-32, 31], dr-dg,db-dg in [-8, 7]
//   0xC0-0xCF  run          1100xxxx                reserved, never emitted
//   0xD0-0xEF  alpha diff   0xD0 + (da + 16)        da in [-16, 15], da != 0
//   0xF0-0xFB  unassigned
//   0xFC       gray         v
//   0xFD       gray alpha   v a
//   0xFE       rgb          r g b
//   0xFF       rgba         r g b a

constexpr std::uint8_t OP_INDEX = 0x00;
constexpr std::uint8_t OP_INDEX_END = 0x3F;
constexpr std::uint8_t OP_DIFF = 0x40;
constexpr std::uint8_t OP_DIFF_END = 0x7F;
constexpr std::uint8_t OP_LUMA = 0x80;
constexpr std::uint8_t OP_LUMA_END = 0xBF;
constexpr std::uint8_t OP_RUN = 0xC0;
constexpr std::uint8_t OP_RUN_END = 0xCF;
constexpr std::uint8_t OP_ALPHA = 0xD0;
constexpr std::uint8_t OP_ALPHA_END = 0xEF;
constexpr std::uint8_t OP_GRAY = 0xFC;
constexpr std::uint8_t OP_GRAY_ALPHA = 0xFD;
constexpr std::uint8_t OP_RGB = 0xFE;
constexpr std::uint8_t OP_RGBA = 0xFF;

constexpr std::uint8_t MASK_6 = 0x3F;
constexpr std::uint8_t MASK_5 = 0x1F;

constexpr int DIFF_BIAS = 2;
constexpr int LUMA_GREEN_BIAS = 32;
constexpr int LUMA_RB_BIAS = 8;
constexpr int ALPHA_BIAS = 16;

constexpr std::size_t END_MARKER_SIZE = 8;
inline constexpr std::array<std::uint8_t, END_MARKER_SIZE> END_MARKER = {0, 0, 0, 0, 0, 0, 0, 1};

enum class op_kind : std::uint8_t {
    index,
    diff,
    luma,
    run,
    alpha_diff,
    gray,
    gray_alpha,
    rgb,
    rgba,
    unassigned
};

constexpr std::size_t OP_KIND_COUNT = 10;

/**
 * Map a leading byte to the rule that owns it.
 * This is the only place the byte ranges are interpreted.
 */
[[nodiscard]] constexpr op_kind classify(std::uint8_t b1) noexcept {
    if (b1 <= OP_INDEX_END) return op_kind::index;
    if (b1 <= OP_DIFF_END) return op_kind::diff;
    if (b1 <= OP_LUMA_END) return op_kind::luma;
    if (b1 <= OP_RUN_END) return op_kind::run;
    if (b1 <= OP_ALPHA_END) return op_kind::alpha_diff;
    switch (b1) {
        case OP_GRAY:       return op_kind::gray;
        case OP_GRAY_ALPHA: return op_kind::gray_alpha;
        case OP_RGB:        return op_kind::rgb;
        case OP_RGBA:       return op_kind::rgba;
        default:            return op_kind::unassigned;
    }
}

/**
 * Number of bytes that follow the leading byte for an op.
 */
[[nodiscard]] constexpr std::size_t payload_size(op_kind kind) noexcept {
    switch (kind) {
        case op_kind::luma:       return 1;
        case op_kind::gray:       return 1;
        case op_kind::gray_alpha: return 2;
        case op_kind::rgb:        return 3;
        case op_kind::rgba:       return 4;
        default:                  return 0;
    }
}

[[nodiscard]] KOI_EXPORT const char* to_string(op_kind kind) noexcept;

// ============================================================================
// Difference Encodings
// ============================================================================

/**
 * Coarse difference: all three color deltas in [-2, 1], alpha unchanged.
 */
[[nodiscard]] constexpr std::optional<std::uint8_t> encode_diff(const pixel_delta& d) noexcept {
    auto fits = [](int v) { return v >= -DIFF_BIAS && v < DIFF_BIAS; };
    if (d.a != 0 || !fits(d.r) || !fits(d.g) || !fits(d.b)) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(OP_DIFF | ((d.r + DIFF_BIAS) << 4) |
                                     ((d.g + DIFF_BIAS) << 2) | (d.b + DIFF_BIAS));
}

[[nodiscard]] constexpr pixel apply_diff(const pixel& prev, std::uint8_t b1) noexcept {
    return apply(prev, {((b1 >> 4) & 0x03) - DIFF_BIAS,
                        ((b1 >> 2) & 0x03) - DIFF_BIAS,
                        (b1 & 0x03) - DIFF_BIAS,
                        0});
}

/**
 * Luma difference: green delta in [-32, 31], red and blue deltas relative
 * to the green delta in [-8, 7], alpha unchanged.
 */
[[nodiscard]] constexpr std::optional<std::array<std::uint8_t, 2>> encode_luma(const pixel_delta& d) noexcept {
    if (d.a != 0 || d.g < -LUMA_GREEN_BIAS || d.g >= LUMA_GREEN_BIAS) {
        return std::nullopt;
    }
    const int dr_dg = d.r - d.g;
    const int db_dg = d.b - d.g;
    if (dr_dg < -LUMA_RB_BIAS || dr_dg >= LUMA_RB_BIAS ||
        db_dg < -LUMA_RB_BIAS || db_dg >= LUMA_RB_BIAS) {
        return std::nullopt;
    }
    return std::array<std::uint8_t, 2>{
        static_cast<std::uint8_t>(OP_LUMA | (d.g + LUMA_GREEN_BIAS)),
        static_cast<std::uint8_t>(((dr_dg + LUMA_RB_BIAS) << 4) | (db_dg + LUMA_RB_BIAS))};
}

[[nodiscard]] constexpr pixel apply_luma(const pixel& prev, std::uint8_t b1, std::uint8_t b2) noexcept {
    const int dg = (b1 & MASK_6) - LUMA_GREEN_BIAS;
    return apply(prev, {dg + ((b2 >> 4) & 0x0F) - LUMA_RB_BIAS,
                        dg,
                        dg + (b2 & 0x0F) - LUMA_RB_BIAS,
                        0});
}

/**
 * Alpha-only difference: RGB unchanged, alpha moved by a non-zero delta
 * in [-16, 15].
 */
[[nodiscard]] constexpr std::optional<std::uint8_t> encode_alpha_diff(const pixel& curr,
                                                                      const pixel& prev) noexcept {
    if (!curr.same_rgb(prev)) {
        return std::nullopt;
    }
    const int da = wrap_diff(curr.a, prev.a);
    if (da == 0 || da < -ALPHA_BIAS || da >= ALPHA_BIAS) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(OP_ALPHA + (da + ALPHA_BIAS));
}

[[nodiscard]] constexpr pixel apply_alpha_diff(const pixel& prev, std::uint8_t b1) noexcept {
    pixel px = prev;
    px.a = wrap_add(prev.a, ((b1 - OP_ALPHA) & MASK_5) - ALPHA_BIAS);
    return px;
}

} // namespace koi

#endif // KOI_OPS_HPP_
