#ifndef KOI_DECODER_HPP_
#define KOI_DECODER_HPP_

#include <koi/koi_export.h>
#include <koi/cache.hpp>
#include <koi/io.hpp>
#include <koi/pixel.hpp>
#include <koi/stream.hpp>
#include <koi/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace koi {

// ============================================================================
// Pixel Decoder
// ============================================================================

/**
 * Streaming decoder for one image.
 *
 * Each step reads one op-code unit, rebuilds the pixel and replays the
 * encoder's cache update. Once the declared number of pixels has been
 * produced, the next step verifies the end marker and reports end of
 * stream.
 */
class KOI_EXPORT pixel_decoder {
public:
    /**
     * @param in Source of the encoded stream (must outlive the decoder)
     * @param pixel_count Number of pixels the stream carries
     * @param ch Channel layout of the decoded output
     * @param kind Backend the stream was written with
     */
    pixel_decoder(source& in, std::uint64_t pixel_count, channels ch,
                  backend kind = backend::raw);
    ~pixel_decoder();

    pixel_decoder(const pixel_decoder&) = delete;
    pixel_decoder& operator=(const pixel_decoder&) = delete;

    /**
     * Decode the next pixel.
     * @param px Receives the pixel (untouched at end of stream)
     * @param end_of_stream Set when the end marker has been verified
     * @return Result of the step
     */
    codec_result read_pixel(pixel& px, bool& end_of_stream);

    /**
     * Decode whole pixels into out, channel_count() bytes each.
     * @param out Destination, at least one pixel long
     * @param bytes_read Bytes stored in out; 0 once the end marker is verified
     * @return Result of the read
     */
    codec_result read(std::span<std::uint8_t> out, std::size_t& bytes_read);

    /**
     * Decode every remaining pixel into a sink.
     */
    codec_result decode(sink& out);

    [[nodiscard]] std::uint64_t pixel_count() const noexcept { return pixel_count_; }
    [[nodiscard]] std::uint64_t pixels_decoded() const noexcept { return pixels_in_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] channels channel_layout() const noexcept { return channels_; }
    [[nodiscard]] const color_cache& cache() const noexcept { return cache_; }
    [[nodiscard]] const codec_result& status() const noexcept { return status_; }

private:
    codec_result read_end_marker();
    codec_result fail(codec_result result);

    std::unique_ptr<stream_reader> reader_;
    channels channels_;
    std::uint64_t pixel_count_;
    std::uint64_t pixels_in_ = 0;

    color_cache cache_;
    pixel prev_ = START_PIXEL;

    codec_result status_;
    bool finished_ = false;
};

} // namespace koi

#endif // KOI_DECODER_HPP_
