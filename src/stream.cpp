#include <koi/stream.hpp>
#include "backends/lz4_stream.hpp"
#include "backends/raw_stream.hpp"

namespace koi {

std::unique_ptr<stream_writer> make_stream_writer(sink& out, const stream_options& options) {
    switch (options.kind) {
        case backend::lz4: return std::make_unique<lz4_stream_writer>(out, options);
        case backend::raw: break;
    }
    return std::make_unique<raw_stream_writer>(out);
}

std::unique_ptr<stream_reader> make_stream_reader(source& in, backend kind) {
    switch (kind) {
        case backend::lz4: return std::make_unique<lz4_stream_reader>(in);
        case backend::raw: break;
    }
    return std::make_unique<raw_stream_reader>(in);
}

} // namespace koi
