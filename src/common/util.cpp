
#include "util.hpp"
#include <stdexcept>

namespace streammux {

bool parse_u32(const std::string &s, uint32_t &out) {
  if (s.empty() || s[0] == '-')
    return false;
  try {
    size_t used = 0;
    unsigned long long v = std::stoull(s, &used, 10);
    if (used != s.size() || v > 0xFFFFFFFFull)
      return false;
    out = (uint32_t)v;
    return true;
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

std::string bytes_to_hex(const uint8_t *data, size_t len, size_t max_bytes) {
  static const char digits[] = "0123456789abcdef";
  size_t n = len < max_bytes ? len : max_bytes;
  std::string out;
  out.reserve(n * 2 + 2);
  for (size_t i = 0; i < n; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  if (n < len)
    out += "..";
  return out;
}

} // namespace streammux
