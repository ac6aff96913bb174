#ifndef KOI_IO_HPP_
#define KOI_IO_HPP_

#include <koi/koi_export.h>
#include <koi/types.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <utility>
#include <vector>

namespace koi {

// ============================================================================
// Byte Sink Interface
// ============================================================================

/**
 * Destination for encoded bytes.
 *
 * Implement this interface to route the codec output into a file,
 * socket or container writer. Failures are returned to the codec and
 * handed back to the caller unchanged.
 */
class KOI_EXPORT sink {
public:
    virtual ~sink() = default;

    /**
     * Write all bytes or fail.
     * @param data Bytes to append
     * @return Result of the write
     */
    virtual codec_result write(std::span<const std::uint8_t> data) = 0;

    /**
     * Push buffered bytes to the underlying device.
     */
    virtual codec_result flush() { return codec_result::success(); }
};

// ============================================================================
// Byte Source Interface
// ============================================================================

/**
 * Origin of encoded bytes for the decoder.
 */
class KOI_EXPORT source {
public:
    virtual ~source() = default;

    /**
     * Read up to buf.size() bytes.
     * @param buf Destination buffer
     * @param bytes_read Number of bytes stored in buf; 0 means end of input
     * @return Result of the read
     */
    virtual codec_result read(std::span<std::uint8_t> buf, std::size_t& bytes_read) = 0;
};

// ============================================================================
// Memory Implementations
// ============================================================================

/**
 * Appends everything to an owned byte vector.
 */
class KOI_EXPORT memory_sink : public sink {
public:
    memory_sink() = default;
    ~memory_sink() override = default;

    memory_sink(const memory_sink&) = delete;
    memory_sink& operator=(const memory_sink&) = delete;
    memory_sink(memory_sink&&) noexcept = default;
    memory_sink& operator=(memory_sink&&) noexcept = default;

    codec_result write(std::span<const std::uint8_t> data) override;

    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }
    [[nodiscard]] std::vector<std::uint8_t> release() noexcept { return std::move(data_); }

private:
    std::vector<std::uint8_t> data_;
};

/**
 * Reads from a borrowed byte range. The range must outlive the source.
 */
class KOI_EXPORT memory_source : public source {
public:
    explicit memory_source(std::span<const std::uint8_t> data) noexcept
        : data_(data) {}

    codec_result read(std::span<std::uint8_t> buf, std::size_t& bytes_read) override;

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// ============================================================================
// iostream Adapters
// ============================================================================

class KOI_EXPORT ostream_sink : public sink {
public:
    explicit ostream_sink(std::ostream& os) noexcept : os_(os) {}

    codec_result write(std::span<const std::uint8_t> data) override;
    codec_result flush() override;

private:
    std::ostream& os_;
};

class KOI_EXPORT istream_source : public source {
public:
    explicit istream_source(std::istream& is) noexcept : is_(is) {}

    codec_result read(std::span<std::uint8_t> buf, std::size_t& bytes_read) override;

private:
    std::istream& is_;
};

} // namespace koi

#endif // KOI_IO_HPP_
