#include "raw_stream.hpp"

#include <string>

namespace koi {

raw_stream_writer::raw_stream_writer(sink& out, std::size_t buffer_size)
    : out_(out),
      buffer_size_(buffer_size > 0 ? buffer_size : 1) {
    buffer_.reserve(buffer_size_);
}

codec_result raw_stream_writer::write(std::span<const std::uint8_t> data) {
    if (finished_) {
        return codec_result::failure(codec_error::internal_error, "Write after stream was finished");
    }

    if (data.size() >= buffer_size_) {
        auto result = drain();
        if (!result) return result;
        return out_.write(data);
    }

    if (buffer_.size() + data.size() > buffer_size_) {
        auto result = drain();
        if (!result) return result;
    }
    buffer_.insert(buffer_.end(), data.begin(), data.end());
    return codec_result::success();
}

codec_result raw_stream_writer::drain() {
    if (buffer_.empty()) {
        return codec_result::success();
    }
    auto result = out_.write(buffer_);
    buffer_.clear();
    return result;
}

codec_result raw_stream_writer::flush() {
    auto result = drain();
    if (!result) return result;
    return out_.flush();
}

codec_result raw_stream_writer::finish() {
    if (finished_) {
        return codec_result::success();
    }
    finished_ = true;
    return flush();
}

codec_result raw_stream_reader::read_exact(std::span<std::uint8_t> buf) {
    std::size_t filled = 0;
    while (filled < buf.size()) {
        std::size_t n = 0;
        auto result = in_.read(buf.subspan(filled), n);
        if (!result) return result;
        if (n == 0) {
            return codec_result::failure(codec_error::truncated_data,
                "Stream ended after " + std::to_string(filled) + " of " +
                std::to_string(buf.size()) + " requested bytes");
        }
        filled += n;
    }
    return codec_result::success();
}

} // namespace koi
