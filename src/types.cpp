#include <rasterfx/types.hpp>

namespace rasterfx {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                return "none";
        case decode_error::invalid_format:      return "invalid_format";
        case decode_error::dimensions_exceeded: return "dimensions_exceeded";
        case decode_error::truncated_data:      return "truncated_data";
        case decode_error::internal_error:      return "internal_error";
    }
    return "unknown";
}

const char* to_string(encode_error err) noexcept {
    switch (err) {
        case encode_error::none:               return "none";
        case encode_error::invalid_dimensions: return "invalid_dimensions";
        case encode_error::size_mismatch:      return "size_mismatch";
        case encode_error::encoder_failure:    return "encoder_failure";
    }
    return "unknown";
}

const char* to_string(filter_error err) noexcept {
    switch (err) {
        case filter_error::none:            return "none";
        case filter_error::decode_failed:   return "decode_failed";
        case filter_error::unknown_filter:  return "unknown_filter";
        case filter_error::encode_failed:   return "encode_failed";
        case filter_error::invalid_options: return "invalid_options";
    }
    return "unknown";
}

} // namespace rasterfx
