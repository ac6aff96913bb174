#ifndef KOI_TYPES_HPP_
#define KOI_TYPES_HPP_

#include <koi/koi_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace koi {

// ============================================================================
// Channel Layout
// ============================================================================

enum class channels : std::uint8_t {
    rgb = 3,    // 24-bit, alpha implied as 255
    rgba = 4    // 32-bit, explicit alpha
};

[[nodiscard]] constexpr std::size_t channel_count(channels ch) noexcept {
    switch (ch) {
        case channels::rgb:  return 3;
        case channels::rgba: return 4;
    }
    return 0;
}

// ============================================================================
// Stream Backends
// ============================================================================

enum class backend {
    raw,    // op-code bytes go straight to the sink
    lz4     // op-code bytes are wrapped in an LZ4 frame
};

[[nodiscard]] KOI_EXPORT const char* to_string(backend b) noexcept;

// ============================================================================
// Codec Errors
// ============================================================================

enum class codec_error {
    none,
    invalid_argument,
    alpha_mismatch,
    channel_mismatch,
    session_finished,
    invalid_op,
    invalid_end_marker,
    truncated_data,
    limit_exceeded,
    io_error,
    compression_error,
    internal_error
};

[[nodiscard]] KOI_EXPORT const char* to_string(codec_error err) noexcept;

// ============================================================================
// Codec Result
// ============================================================================

struct codec_result {
    bool ok = false;
    codec_error error = codec_error::none;
    std::string message;

    [[nodiscard]] static codec_result success() {
        return {true, codec_error::none, {}};
    }

    [[nodiscard]] static codec_result failure(codec_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Options
// ============================================================================

struct stream_options {
    backend kind = backend::raw;

    // LZ4 only: 0 selects the fast default, 3..12 selects the HC compressor
    int compression_level = 0;

    // LZ4 only: uncompressed bytes accumulated before a block is emitted
    std::size_t block_size = 64 * 1024;
};

struct decode_options {
    // Maximum accepted pixel count (0 = unlimited)
    std::uint64_t max_pixels = 400000000ULL;
};

} // namespace koi

#endif // KOI_TYPES_HPP_
