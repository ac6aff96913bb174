#include <koi/io.hpp>

#include <algorithm>
#include <cstring>
#include <istream>
#include <new>
#include <ostream>

namespace koi {

// ============================================================================
// Memory Sink / Source
// ============================================================================

codec_result memory_sink::write(std::span<const std::uint8_t> data) {
    try {
        data_.insert(data_.end(), data.begin(), data.end());
    } catch (const std::bad_alloc&) {
        return codec_result::failure(codec_error::io_error, "Out of memory in memory_sink");
    }
    return codec_result::success();
}

codec_result memory_source::read(std::span<std::uint8_t> buf, std::size_t& bytes_read) {
    bytes_read = std::min(buf.size(), data_.size() - pos_);
    if (bytes_read > 0) {
        std::memcpy(buf.data(), data_.data() + pos_, bytes_read);
        pos_ += bytes_read;
    }
    return codec_result::success();
}

// ============================================================================
// iostream Adapters
// ============================================================================

codec_result ostream_sink::write(std::span<const std::uint8_t> data) {
    os_.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!os_) {
        return codec_result::failure(codec_error::io_error, "Failed to write to output stream");
    }
    return codec_result::success();
}

codec_result ostream_sink::flush() {
    os_.flush();
    if (!os_) {
        return codec_result::failure(codec_error::io_error, "Failed to flush output stream");
    }
    return codec_result::success();
}

codec_result istream_source::read(std::span<std::uint8_t> buf, std::size_t& bytes_read) {
    bytes_read = 0;
    if (buf.empty() || is_.eof()) {
        return codec_result::success();
    }

    is_.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    bytes_read = static_cast<std::size_t>(is_.gcount());

    // Hitting end of file sets failbit alongside eofbit; only badbit is an error
    if (is_.bad()) {
        return codec_result::failure(codec_error::io_error, "Failed to read from input stream");
    }
    return codec_result::success();
}

} // namespace koi
