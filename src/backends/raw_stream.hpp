#pragma once

#include <koi/stream.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace koi {

// Pass-through writer; coalesces the small per-pixel writes before they reach the sink
class raw_stream_writer final : public stream_writer {
public:
    explicit raw_stream_writer(sink& out, std::size_t buffer_size = 8 * 1024);

    codec_result write(std::span<const std::uint8_t> data) override;
    codec_result flush() override;
    codec_result finish() override;

private:
    codec_result drain();

    sink& out_;
    std::vector<std::uint8_t> buffer_;
    std::size_t buffer_size_;
    bool finished_ = false;
};

// Pass-through reader; never reads past the bytes it was asked for
class raw_stream_reader final : public stream_reader {
public:
    explicit raw_stream_reader(source& in) noexcept : in_(in) {}

    codec_result read_exact(std::span<std::uint8_t> buf) override;

private:
    source& in_;
};

} // namespace koi
