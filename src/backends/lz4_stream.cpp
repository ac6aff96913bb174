#include "lz4_stream.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace koi {

namespace {

constexpr std::size_t LZ4_READ_CHUNK = 64 * 1024;
constexpr std::size_t LZ4_DECODE_CHUNK = 64 * 1024;

LZ4F_blockSizeID_t block_size_id(std::size_t block_size) {
    if (block_size <= 64 * 1024) return LZ4F_max64KB;
    if (block_size <= 256 * 1024) return LZ4F_max256KB;
    if (block_size <= 1024 * 1024) return LZ4F_max1MB;
    return LZ4F_max4MB;
}

codec_result lz4_failure(const char* what, std::size_t code) {
    return codec_result::failure(codec_error::compression_error,
        std::string(what) + ": " + LZ4F_getErrorName(code));
}

} // namespace

// ============================================================================
// LZ4 Writer
// ============================================================================

lz4_stream_writer::lz4_stream_writer(sink& out, const stream_options& options)
    : out_(out),
      block_size_(options.block_size > 0 ? options.block_size : 64 * 1024),
      init_result_(codec_result::success()) {
    prefs_.frameInfo.blockSizeID = block_size_id(block_size_);
    prefs_.frameInfo.blockMode = LZ4F_blockLinked;
    prefs_.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
    prefs_.compressionLevel = options.compression_level;

    const std::size_t code = LZ4F_createCompressionContext(&ctx_, LZ4F_VERSION);
    if (LZ4F_isError(code)) {
        ctx_ = nullptr;
        init_result_ = lz4_failure("LZ4F_createCompressionContext", code);
        return;
    }

    pending_.reserve(block_size_);
    out_buf_.resize(std::max<std::size_t>(LZ4F_compressBound(block_size_, &prefs_),
                                          LZ4F_HEADER_SIZE_MAX));
}

lz4_stream_writer::~lz4_stream_writer() {
    if (ctx_) {
        LZ4F_freeCompressionContext(ctx_);
    }
}

codec_result lz4_stream_writer::emit(std::size_t size_or_error, const char* what) {
    if (LZ4F_isError(size_or_error)) {
        return lz4_failure(what, size_or_error);
    }
    if (size_or_error == 0) {
        return codec_result::success();
    }
    return out_.write(std::span<const std::uint8_t>(out_buf_.data(), size_or_error));
}

codec_result lz4_stream_writer::begin() {
    if (!init_result_) return init_result_;
    if (started_) return codec_result::success();

    started_ = true;
    return emit(LZ4F_compressBegin(ctx_, out_buf_.data(), out_buf_.size(), &prefs_),
                "LZ4F_compressBegin");
}

codec_result lz4_stream_writer::compress_pending() {
    std::size_t offset = 0;
    while (offset < pending_.size()) {
        const std::size_t n = std::min(block_size_, pending_.size() - offset);
        auto result = emit(LZ4F_compressUpdate(ctx_, out_buf_.data(), out_buf_.size(),
                                               pending_.data() + offset, n, nullptr),
                           "LZ4F_compressUpdate");
        if (!result) return result;
        offset += n;
    }
    pending_.clear();
    return codec_result::success();
}

codec_result lz4_stream_writer::write(std::span<const std::uint8_t> data) {
    if (finished_) {
        return codec_result::failure(codec_error::internal_error, "Write after LZ4 frame was finished");
    }

    auto result = begin();
    if (!result) return result;

    pending_.insert(pending_.end(), data.begin(), data.end());
    if (pending_.size() >= block_size_) {
        return compress_pending();
    }
    return codec_result::success();
}

codec_result lz4_stream_writer::flush() {
    if (finished_) {
        return out_.flush();
    }

    auto result = begin();
    if (!result) return result;

    result = compress_pending();
    if (!result) return result;

    result = emit(LZ4F_flush(ctx_, out_buf_.data(), out_buf_.size(), nullptr), "LZ4F_flush");
    if (!result) return result;

    return out_.flush();
}

codec_result lz4_stream_writer::finish() {
    if (finished_) {
        return codec_result::success();
    }

    auto result = begin();
    if (!result) return result;

    result = compress_pending();
    if (!result) return result;

    result = emit(LZ4F_compressEnd(ctx_, out_buf_.data(), out_buf_.size(), nullptr),
                  "LZ4F_compressEnd");
    if (!result) return result;

    finished_ = true;
    return out_.flush();
}

// ============================================================================
// LZ4 Reader
// ============================================================================

lz4_stream_reader::lz4_stream_reader(source& in)
    : in_(in),
      init_result_(codec_result::success()),
      in_buf_(LZ4_READ_CHUNK),
      out_buf_(LZ4_DECODE_CHUNK) {
    const std::size_t code = LZ4F_createDecompressionContext(&ctx_, LZ4F_VERSION);
    if (LZ4F_isError(code)) {
        ctx_ = nullptr;
        init_result_ = lz4_failure("LZ4F_createDecompressionContext", code);
    }
}

lz4_stream_reader::~lz4_stream_reader() {
    if (ctx_) {
        LZ4F_freeDecompressionContext(ctx_);
    }
}

codec_result lz4_stream_reader::refill() {
    if (frame_done_) {
        return codec_result::failure(codec_error::truncated_data,
            "LZ4 frame ended before the pixel stream was complete");
    }

    if (in_pos_ == in_len_) {
        std::size_t n = 0;
        auto result = in_.read(in_buf_, n);
        if (!result) return result;
        if (n == 0) {
            return codec_result::failure(codec_error::truncated_data,
                "Input ended inside an LZ4 frame");
        }
        in_pos_ = 0;
        in_len_ = n;
    }

    std::size_t dst_size = out_buf_.size();
    std::size_t src_size = in_len_ - in_pos_;
    const std::size_t hint = LZ4F_decompress(ctx_, out_buf_.data(), &dst_size,
                                             in_buf_.data() + in_pos_, &src_size, nullptr);
    if (LZ4F_isError(hint)) {
        return lz4_failure("LZ4F_decompress", hint);
    }

    in_pos_ += src_size;
    out_pos_ = 0;
    out_len_ = dst_size;

    // A zero hint means the frame end mark (and checksum) was consumed
    if (hint == 0) {
        frame_done_ = true;
    }
    return codec_result::success();
}

codec_result lz4_stream_reader::read_exact(std::span<std::uint8_t> buf) {
    if (!init_result_) return init_result_;

    std::size_t filled = 0;
    while (filled < buf.size()) {
        if (out_pos_ == out_len_) {
            auto result = refill();
            if (!result) return result;
            continue;
        }

        const std::size_t n = std::min(buf.size() - filled, out_len_ - out_pos_);
        std::memcpy(buf.data() + filled, out_buf_.data() + out_pos_, n);
        out_pos_ += n;
        filled += n;
    }
    return codec_result::success();
}

} // namespace koi
