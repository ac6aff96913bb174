#ifndef KOI_KOI_HPP_
#define KOI_KOI_HPP_

#include <koi/koi_export.h>
#include <koi/types.hpp>
#include <koi/pixel.hpp>
#include <koi/ops.hpp>
#include <koi/cache.hpp>
#include <koi/io.hpp>
#include <koi/stream.hpp>
#include <koi/encoder.hpp>
#include <koi/decoder.hpp>
#include <koi/codec.hpp>

namespace koi {

// All public API is included via the headers above.
// See:
//   - types.hpp:   channels, backend, codec_error, codec_result, options
//   - pixel.hpp:   pixel, wraparound arithmetic, color hash
//   - ops.hpp:     op-code table and the difference encodings
//   - cache.hpp:   recent-colors cache
//   - io.hpp:      sink/source interfaces and implementations
//   - stream.hpp:  raw and LZ4 stream backends
//   - encoder.hpp: pixel_encoder
//   - decoder.hpp: pixel_decoder
//   - codec.hpp:   one-call encode() / decode()

} // namespace koi

#endif // KOI_KOI_HPP_
