#include <koi/types.hpp>
#include <koi/ops.hpp>

namespace koi {

const char* to_string(backend b) noexcept {
    switch (b) {
        case backend::raw: return "raw";
        case backend::lz4: return "lz4";
    }
    return "unknown";
}

const char* to_string(codec_error err) noexcept {
    switch (err) {
        case codec_error::none:               return "none";
        case codec_error::invalid_argument:   return "invalid_argument";
        case codec_error::alpha_mismatch:     return "alpha_mismatch";
        case codec_error::channel_mismatch:   return "channel_mismatch";
        case codec_error::session_finished:   return "session_finished";
        case codec_error::invalid_op:         return "invalid_op";
        case codec_error::invalid_end_marker: return "invalid_end_marker";
        case codec_error::truncated_data:     return "truncated_data";
        case codec_error::limit_exceeded:     return "limit_exceeded";
        case codec_error::io_error:           return "io_error";
        case codec_error::compression_error:  return "compression_error";
        case codec_error::internal_error:     return "internal_error";
    }
    return "unknown";
}

const char* to_string(op_kind kind) noexcept {
    switch (kind) {
        case op_kind::index:      return "index";
        case op_kind::diff:       return "diff";
        case op_kind::luma:       return "luma";
        case op_kind::run:        return "run";
        case op_kind::alpha_diff: return "alpha_diff";
        case op_kind::gray:       return "gray";
        case op_kind::gray_alpha: return "gray_alpha";
        case op_kind::rgb:        return "rgb";
        case op_kind::rgba:       return "rgba";
        case op_kind::unassigned: return "unassigned";
    }
    return "unknown";
}

} // namespace koi
