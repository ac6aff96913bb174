#ifndef KOI_CODEC_HPP_
#define KOI_CODEC_HPP_

#include <koi/koi_export.h>
#include <koi/types.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace koi {

// ============================================================================
// Convenience Functions
// ============================================================================

struct encode_output {
    codec_result result;
    std::vector<std::uint8_t> data;
};

struct decode_output {
    codec_result result;
    std::vector<std::uint8_t> pixels;
};

/**
 * Encode a complete pixel buffer in one call.
 * @param pixels Interleaved channel bytes; the pixel count is pixels.size() / channels
 * @param ch Channel layout of pixels
 * @param options Stream backend selection
 * @return Encoded stream, or the failure that stopped it
 */
[[nodiscard]] KOI_EXPORT encode_output encode(std::span<const std::uint8_t> pixels,
                                              channels ch,
                                              const stream_options& options = {});

/**
 * Decode a complete stream in one call.
 * @param data Encoded stream
 * @param pixel_count Number of pixels the stream carries
 * @param ch Channel layout of the output
 * @param kind Backend the stream was written with
 * @param options Decode limits
 * @return Decoded pixels, or the failure that stopped decoding
 */
[[nodiscard]] KOI_EXPORT decode_output decode(std::span<const std::uint8_t> data,
                                              std::uint64_t pixel_count,
                                              channels ch,
                                              backend kind = backend::raw,
                                              const decode_options& options = {});

} // namespace koi

#endif // KOI_CODEC_HPP_
