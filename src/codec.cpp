#include <koi/codec.hpp>
#include <koi/decoder.hpp>
#include <koi/encoder.hpp>
#include <koi/io.hpp>

#include <limits>
#include <new>
#include <string>

namespace koi {

encode_output encode(std::span<const std::uint8_t> pixels, channels ch,
                     const stream_options& options) {
    encode_output output;

    const std::size_t c = channel_count(ch);
    if (c == 0) {
        output.result = codec_result::failure(codec_error::invalid_argument, "Channel count must be 3 or 4");
        return output;
    }
    if (pixels.size() % c != 0) {
        output.result = codec_result::failure(codec_error::channel_mismatch,
            "Buffer of " + std::to_string(pixels.size()) + " bytes is not a multiple of " +
            std::to_string(c) + " channels");
        return output;
    }

    memory_sink out;
    pixel_encoder encoder(out, pixels.size() / c, ch, options);

    output.result = encoder.write(pixels);
    if (!output.result) return output;

    output.result = encoder.flush();
    if (!output.result) return output;

    output.data = out.release();
    return output;
}

decode_output decode(std::span<const std::uint8_t> data, std::uint64_t pixel_count,
                     channels ch, backend kind, const decode_options& options) {
    decode_output output;

    const std::size_t c = channel_count(ch);
    if (c == 0) {
        output.result = codec_result::failure(codec_error::invalid_argument, "Channel count must be 3 or 4");
        return output;
    }

    // Prevent overflow
    if (pixel_count > std::numeric_limits<std::size_t>::max() / c ||
        (options.max_pixels > 0 && pixel_count > options.max_pixels)) {
        output.result = codec_result::failure(codec_error::limit_exceeded,
            "Pixel count " + std::to_string(pixel_count) + " exceeds limit");
        return output;
    }

    try {
        output.pixels.resize(static_cast<std::size_t>(pixel_count) * c);
    } catch (const std::bad_alloc&) {
        output.result = codec_result::failure(codec_error::internal_error, "Failed to allocate pixel buffer");
        return output;
    }

    memory_source in(data);
    pixel_decoder decoder(in, pixel_count, ch, kind);

    std::size_t filled = 0;
    for (;;) {
        std::size_t n = 0;
        std::span<std::uint8_t> dst(output.pixels.data() + filled, output.pixels.size() - filled);
        if (dst.empty()) {
            // Room for one more read is only needed to verify the end marker
            std::uint8_t probe[4];
            output.result = decoder.read(std::span<std::uint8_t>(probe, c), n);
        } else {
            output.result = decoder.read(dst, n);
        }
        if (!output.result) {
            output.pixels.clear();
            return output;
        }
        if (n == 0) break;
        filled += n;
    }

    return output;
}

} // namespace koi
