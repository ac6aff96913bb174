#include <koi/encoder.hpp>

#include <string>
#include <vector>

namespace koi {

namespace {

constexpr std::size_t ENCODE_READ_CHUNK = 64 * 1024;

} // namespace

pixel_encoder::pixel_encoder(sink& out, std::uint64_t pixel_count, channels ch,
                             const stream_options& options)
    : writer_(make_stream_writer(out, options)),
      channels_(ch),
      pixel_count_(pixel_count),
      status_(codec_result::success()) {
    if (channel_count(ch) == 0) {
        status_ = codec_result::failure(codec_error::invalid_argument, "Channel count must be 3 or 4");
        return;
    }

    // An empty image is only the end marker
    if (pixel_count_ == 0) {
        auto result = finish_stream();
        if (!result) status_ = std::move(result);
    }
}

pixel_encoder::~pixel_encoder() = default;

codec_result pixel_encoder::fail(codec_result result) {
    status_ = result;
    return result;
}

codec_result pixel_encoder::emit(op_kind kind, std::span<const std::uint8_t> bytes) {
    auto result = writer_->write(bytes);
    if (result) ++op_counts_[static_cast<std::size_t>(kind)];
    return result;
}

codec_result pixel_encoder::finish_stream() {
    auto result = writer_->write(END_MARKER);
    if (!result) return result;

    finished_ = true;
    return writer_->finish();
}

codec_result pixel_encoder::encode_pixel(const pixel& px) {
    if (channels_ == channels::rgb && px.a != 255) {
        return fail(codec_result::failure(codec_error::alpha_mismatch,
            "Pixel " + std::to_string(pixels_in_) + " has alpha " + std::to_string(px.a) +
            " in a 3-channel stream"));
    }

    codec_result result;
    const std::uint8_t index = pixel_hash(px);

    if (cache_.lookup(index) == px) {
        const auto op = static_cast<std::uint8_t>(OP_INDEX | index);
        result = emit(op_kind::index, std::span(&op, 1));
    } else if (auto alpha = encode_alpha_diff(px, prev_)) {
        result = emit(op_kind::alpha_diff, std::span(&*alpha, 1));
    } else if (px.a != prev_.a) {
        if (px.is_gray()) {
            const std::uint8_t bytes[] = {OP_GRAY_ALPHA, px.r, px.a};
            result = emit(op_kind::gray_alpha, bytes);
        } else {
            const std::uint8_t bytes[] = {OP_RGBA, px.r, px.g, px.b, px.a};
            result = emit(op_kind::rgba, bytes);
        }
    } else {
        const pixel_delta d = diff(px, prev_);
        if (auto op = encode_diff(d)) {
            result = emit(op_kind::diff, std::span(&*op, 1));
        } else if (auto luma = encode_luma(d)) {
            result = emit(op_kind::luma, *luma);
        } else if (px.is_gray()) {
            const std::uint8_t bytes[] = {OP_GRAY, px.r};
            result = emit(op_kind::gray, bytes);
        } else {
            const std::uint8_t bytes[] = {OP_RGB, px.r, px.g, px.b};
            result = emit(op_kind::rgb, bytes);
        }
    }

    if (!result) return fail(std::move(result));

    cache_.store(px);
    prev_ = px;
    ++pixels_in_;

    if (pixels_in_ == pixel_count_) {
        result = finish_stream();
        if (!result) return fail(std::move(result));
    }
    return codec_result::success();
}

codec_result pixel_encoder::write(std::span<const std::uint8_t> data) {
    if (!status_) return status_;

    const std::size_t c = channel_count(channels_);
    for (std::uint8_t byte : data) {
        if (finished_) {
            return fail(codec_result::failure(codec_error::session_finished,
                "All " + std::to_string(pixel_count_) + " pixels already encoded"));
        }

        buffer_[buffered_++] = byte;
        if (buffered_ < c) {
            continue;
        }
        buffered_ = 0;

        const pixel px{buffer_[0], buffer_[1], buffer_[2],
                       c == 4 ? buffer_[3] : std::uint8_t{255}};
        auto result = encode_pixel(px);
        if (!result) return result;
    }
    return codec_result::success();
}

codec_result pixel_encoder::write_pixel(const pixel& px) {
    if (!status_) return status_;

    if (buffered_ != 0) {
        return codec_result::failure(codec_error::invalid_argument,
            "Cannot write a whole pixel while " + std::to_string(buffered_) +
            " raw bytes of the previous one are buffered");
    }
    if (finished_) {
        return fail(codec_result::failure(codec_error::session_finished,
            "All " + std::to_string(pixel_count_) + " pixels already encoded"));
    }
    return encode_pixel(px);
}

codec_result pixel_encoder::encode(source& in) {
    if (!status_) return status_;

    std::vector<std::uint8_t> chunk(ENCODE_READ_CHUNK);
    for (;;) {
        std::size_t n = 0;
        auto result = in.read(chunk, n);
        if (!result) return fail(std::move(result));
        if (n == 0) break;

        result = write(std::span<const std::uint8_t>(chunk.data(), n));
        if (!result) return result;
    }

    auto result = flush();
    if (!result) return result;

    if (!finished_) {
        return fail(codec_result::failure(codec_error::truncated_data,
            "Source ended after " + std::to_string(pixels_in_) + " of " +
            std::to_string(pixel_count_) + " pixels"));
    }
    return codec_result::success();
}

codec_result pixel_encoder::flush() {
    if (!status_) return status_;

    auto result = writer_->flush();
    if (!result) return fail(std::move(result));

    if (buffered_ != 0) {
        return fail(codec_result::failure(codec_error::channel_mismatch,
            std::to_string(buffered_) + " trailing bytes do not form a pixel of " +
            std::to_string(channel_count(channels_)) + " channels"));
    }
    return codec_result::success();
}

} // namespace koi
