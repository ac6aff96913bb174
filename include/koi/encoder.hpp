#ifndef KOI_ENCODER_HPP_
#define KOI_ENCODER_HPP_

#include <koi/koi_export.h>
#include <koi/cache.hpp>
#include <koi/io.hpp>
#include <koi/ops.hpp>
#include <koi/pixel.hpp>
#include <koi/stream.hpp>
#include <koi/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace koi {

// ============================================================================
// Pixel Encoder
// ============================================================================

/**
 * Streaming encoder for one image.
 *
 * Raw channel bytes are accepted in any chunking. Every time a full pixel
 * has been collected it is classified and emitted through the stream
 * backend. After the declared number of pixels the end marker is written
 * and the backend is finished; any further pixel data is rejected.
 *
 * A failed call leaves the encoder in a failed state: every later call
 * returns the same failure and nothing more is written.
 */
class KOI_EXPORT pixel_encoder {
public:
    /**
     * @param out Destination of the encoded stream (must outlive the encoder)
     * @param pixel_count Number of pixels the caller will supply
     * @param ch Channel layout of the raw input
     * @param options Stream backend selection
     */
    pixel_encoder(sink& out, std::uint64_t pixel_count, channels ch,
                  const stream_options& options = {});
    ~pixel_encoder();

    pixel_encoder(const pixel_encoder&) = delete;
    pixel_encoder& operator=(const pixel_encoder&) = delete;

    /**
     * Feed raw channel bytes (R, G, B[, A] interleaved).
     */
    codec_result write(std::span<const std::uint8_t> data);

    /**
     * Feed one complete pixel. For three-channel streams px.a must be 255.
     */
    codec_result write_pixel(const pixel& px);

    /**
     * Pump a whole source through write(), then flush(). Fails with
     * truncated_data if the source ends before pixel_count() pixels.
     */
    codec_result encode(source& in);

    /**
     * Flush the backend. Fails with channel_mismatch if the bytes written so
     * far do not end on a pixel boundary.
     *
     * May be called mid-image. The stream carries its end marker only once
     * finished() is true.
     */
    codec_result flush();

    [[nodiscard]] std::uint64_t pixel_count() const noexcept { return pixel_count_; }
    [[nodiscard]] std::uint64_t pixels_encoded() const noexcept { return pixels_in_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] channels channel_layout() const noexcept { return channels_; }
    [[nodiscard]] const color_cache& cache() const noexcept { return cache_; }
    [[nodiscard]] const codec_result& status() const noexcept { return status_; }

    // Number of times each op was emitted
    [[nodiscard]] std::uint64_t op_count(op_kind kind) const noexcept {
        return op_counts_[static_cast<std::size_t>(kind)];
    }

private:
    codec_result encode_pixel(const pixel& px);
    codec_result emit(op_kind kind, std::span<const std::uint8_t> bytes);
    codec_result finish_stream();
    codec_result fail(codec_result result);

    std::unique_ptr<stream_writer> writer_;
    channels channels_;
    std::uint64_t pixel_count_;
    std::uint64_t pixels_in_ = 0;

    color_cache cache_;
    pixel prev_ = START_PIXEL;

    std::array<std::uint8_t, 4> buffer_{};
    std::size_t buffered_ = 0;

    std::array<std::uint64_t, OP_KIND_COUNT> op_counts_{};
    codec_result status_;
    bool finished_ = false;
};

} // namespace koi

#endif // KOI_ENCODER_HPP_
