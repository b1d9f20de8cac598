
#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

namespace streammux {

bool parse_u32(const std::string& s, uint32_t& out);
// Lowercase hex, truncated to max_bytes with a trailing "..".
std::string bytes_to_hex(const uint8_t* data, size_t len, size_t max_bytes = 32);

} // namespace streammux
