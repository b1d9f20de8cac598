
#pragma once
#include <system_error>

namespace streammux {

enum class errc {
    header_decode = 1,
    header_checksum,
    chunk_checksum,
    protocol_misuse,
    metadata_decode,
    unknown_stream
};

const std::error_category& streammux_category();
std::error_code make_error_code(errc e);

} // namespace streammux

namespace std {
template <> struct is_error_code_enum<streammux::errc> : true_type {};
} // namespace std
