#ifndef KOI_STREAM_HPP_
#define KOI_STREAM_HPP_

#include <koi/koi_export.h>
#include <koi/io.hpp>
#include <koi/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace koi {

// ============================================================================
// Stream Writer
// ============================================================================

/**
 * Byte transport between the pixel encoder and a sink.
 * The variant is chosen once when the encoder is built.
 */
class KOI_EXPORT stream_writer {
public:
    virtual ~stream_writer() = default;

    /**
     * Write all bytes or fail.
     */
    virtual codec_result write(std::span<const std::uint8_t> data) = 0;

    /**
     * Push every byte written so far down to the sink.
     */
    virtual codec_result flush() = 0;

    /**
     * Close the stream framing (if any) and flush. Nothing may be written
     * afterwards.
     */
    virtual codec_result finish() = 0;
};

// ============================================================================
// Stream Reader
// ============================================================================

/**
 * Byte transport between a source and the pixel decoder.
 */
class KOI_EXPORT stream_reader {
public:
    virtual ~stream_reader() = default;

    /**
     * Fill buf completely. Running out of input first is truncated_data.
     */
    virtual codec_result read_exact(std::span<std::uint8_t> buf) = 0;
};

// ============================================================================
// Factories
// ============================================================================

/**
 * Create the writer for options.kind on top of out.
 * @param out Destination sink (must outlive the writer)
 * @param options Backend selection and LZ4 tuning
 */
[[nodiscard]] KOI_EXPORT std::unique_ptr<stream_writer> make_stream_writer(sink& out,
                                                                         const stream_options& options);

/**
 * Create the reader for kind on top of in.
 * @param in Source of encoded bytes (must outlive the reader)
 * @param kind Backend the data was written with
 */
[[nodiscard]] KOI_EXPORT std::unique_ptr<stream_reader> make_stream_reader(source& in, backend kind);

} // namespace koi

#endif // KOI_STREAM_HPP_
