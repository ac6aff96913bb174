#pragma once

#include <koi/stream.hpp>

#include <lz4frame.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace koi {

// Wraps everything written into a single LZ4 frame
class lz4_stream_writer final : public stream_writer {
public:
    lz4_stream_writer(sink& out, const stream_options& options);
    ~lz4_stream_writer() override;

    lz4_stream_writer(const lz4_stream_writer&) = delete;
    lz4_stream_writer& operator=(const lz4_stream_writer&) = delete;

    codec_result write(std::span<const std::uint8_t> data) override;
    codec_result flush() override;
    codec_result finish() override;

private:
    codec_result begin();
    codec_result compress_pending();
    codec_result emit(std::size_t size_or_error, const char* what);

    sink& out_;
    LZ4F_cctx* ctx_ = nullptr;
    LZ4F_preferences_t prefs_{};
    std::size_t block_size_;
    std::vector<std::uint8_t> pending_;
    std::vector<std::uint8_t> out_buf_;
    codec_result init_result_;
    bool started_ = false;
    bool finished_ = false;
};

// Reads one LZ4 frame and serves its decompressed content
class lz4_stream_reader final : public stream_reader {
public:
    explicit lz4_stream_reader(source& in);
    ~lz4_stream_reader() override;

    lz4_stream_reader(const lz4_stream_reader&) = delete;
    lz4_stream_reader& operator=(const lz4_stream_reader&) = delete;

    codec_result read_exact(std::span<std::uint8_t> buf) override;

private:
    codec_result refill();

    source& in_;
    LZ4F_dctx* ctx_ = nullptr;
    codec_result init_result_;
    std::vector<std::uint8_t> in_buf_;
    std::size_t in_pos_ = 0;
    std::size_t in_len_ = 0;
    std::vector<std::uint8_t> out_buf_;
    std::size_t out_pos_ = 0;
    std::size_t out_len_ = 0;
    bool frame_done_ = false;
};

} // namespace koi
