#include <koi/decoder.hpp>
#include <koi/ops.hpp>

#include <array>
#include <cstdio>
#include <string>
#include <vector>

namespace koi {

namespace {

constexpr std::size_t DECODE_CHUNK_PIXELS = 16 * 1024;

std::string hex_byte(std::uint8_t b) {
    char buf[5];
    std::snprintf(buf, sizeof(buf), "0x%02X", b);
    return buf;
}

// Ops that produce an alpha other than the previous one cannot occur in RGB streams
bool allowed_in_rgb(op_kind kind) {
    return kind != op_kind::alpha_diff && kind != op_kind::gray_alpha && kind != op_kind::rgba;
}

} // namespace

pixel_decoder::pixel_decoder(source& in, std::uint64_t pixel_count, channels ch, backend kind)
    : reader_(make_stream_reader(in, kind)),
      channels_(ch),
      pixel_count_(pixel_count),
      status_(codec_result::success()) {
    if (channel_count(ch) == 0) {
        status_ = codec_result::failure(codec_error::invalid_argument, "Channel count must be 3 or 4");
    }
}

pixel_decoder::~pixel_decoder() = default;

codec_result pixel_decoder::fail(codec_result result) {
    status_ = result;
    return result;
}

codec_result pixel_decoder::read_end_marker() {
    std::array<std::uint8_t, END_MARKER_SIZE> marker{};
    auto result = reader_->read_exact(marker);
    if (!result) return fail(std::move(result));

    if (marker != END_MARKER) {
        return fail(codec_result::failure(codec_error::invalid_end_marker,
            "Invalid end marker after " + std::to_string(pixels_in_) + " pixels"));
    }

    finished_ = true;
    return codec_result::success();
}

codec_result pixel_decoder::read_pixel(pixel& px, bool& end_of_stream) {
    end_of_stream = false;
    if (!status_) return status_;

    if (!finished_ && pixels_in_ == pixel_count_) {
        auto result = read_end_marker();
        if (!result) return result;
    }
    if (finished_) {
        end_of_stream = true;
        return codec_result::success();
    }

    std::uint8_t b1 = 0;
    auto result = reader_->read_exact(std::span(&b1, 1));
    if (!result) return fail(std::move(result));

    const op_kind kind = classify(b1);
    if (kind == op_kind::run || kind == op_kind::unassigned ||
        (channels_ == channels::rgb && !allowed_in_rgb(kind))) {
        return fail(codec_result::failure(codec_error::invalid_op,
            "Unexpected op " + hex_byte(b1) + " (" + to_string(kind) + ") at pixel " +
            std::to_string(pixels_in_)));
    }

    std::array<std::uint8_t, 4> payload{};
    const std::size_t extra = payload_size(kind);
    if (extra > 0) {
        result = reader_->read_exact(std::span(payload.data(), extra));
        if (!result) return fail(std::move(result));
    }

    pixel next;
    switch (kind) {
        case op_kind::index:
            next = cache_.lookup(b1 & MASK_6);
            if (channels_ == channels::rgb && next.a != 255) {
                return fail(codec_result::failure(codec_error::invalid_op,
                    "Index op " + hex_byte(b1) + " names a slot with alpha " +
                    std::to_string(next.a) + " at pixel " + std::to_string(pixels_in_)));
            }
            break;
        case op_kind::diff:
            next = apply_diff(prev_, b1);
            break;
        case op_kind::luma:
            next = apply_luma(prev_, b1, payload[0]);
            break;
        case op_kind::alpha_diff:
            next = apply_alpha_diff(prev_, b1);
            break;
        case op_kind::gray:
            next = {payload[0], payload[0], payload[0], prev_.a};
            break;
        case op_kind::gray_alpha:
            next = {payload[0], payload[0], payload[0], payload[1]};
            break;
        case op_kind::rgb:
            next = {payload[0], payload[1], payload[2], prev_.a};
            break;
        case op_kind::rgba:
            next = {payload[0], payload[1], payload[2], payload[3]};
            break;
        case op_kind::run:
        case op_kind::unassigned:
            return fail(codec_result::failure(codec_error::internal_error, "Unhandled op"));
    }

    cache_.store(next);
    prev_ = next;
    ++pixels_in_;

    px = next;
    return codec_result::success();
}

codec_result pixel_decoder::read(std::span<std::uint8_t> out, std::size_t& bytes_read) {
    bytes_read = 0;
    if (!status_) return status_;

    const std::size_t c = channel_count(channels_);
    if (out.size() < c) {
        return codec_result::failure(codec_error::invalid_argument,
            "Output buffer smaller than one pixel");
    }

    while (out.size() - bytes_read >= c) {
        pixel px;
        bool end_of_stream = false;
        auto result = read_pixel(px, end_of_stream);
        if (!result) return result;
        if (end_of_stream) break;

        std::uint8_t* dst = out.data() + bytes_read;
        dst[0] = px.r;
        dst[1] = px.g;
        dst[2] = px.b;
        if (c == 4) {
            dst[3] = px.a;
        }
        bytes_read += c;

        // Leave the end marker to the next call
        if (pixels_in_ == pixel_count_) break;
    }
    return codec_result::success();
}

codec_result pixel_decoder::decode(sink& out) {
    if (!status_) return status_;

    std::vector<std::uint8_t> chunk(DECODE_CHUNK_PIXELS * channel_count(channels_));
    for (;;) {
        std::size_t n = 0;
        auto result = read(chunk, n);
        if (!result) return result;
        if (n == 0) break;

        result = out.write(std::span<const std::uint8_t>(chunk.data(), n));
        if (!result) return fail(std::move(result));
    }
    return out.flush();
}

} // namespace koi
