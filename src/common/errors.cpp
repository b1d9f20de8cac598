
#include "errors.hpp"
#include <string>

namespace streammux {

namespace {

class StreammuxCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "streammux"; }
  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::header_decode:
      return "malformed or truncated header";
    case errc::header_checksum:
      return "header checksum mismatch";
    case errc::chunk_checksum:
      return "chunk checksum mismatch";
    case errc::protocol_misuse:
      return "protocol misuse";
    case errc::metadata_decode:
      return "stream metadata is not valid JSON";
    case errc::unknown_stream:
      return "chunk references an undeclared stream";
    }
    return "unknown streammux error";
  }
};

} // namespace

const std::error_category &streammux_category() {
  static StreammuxCategory cat;
  return cat;
}

std::error_code make_error_code(errc e) {
  return std::error_code(static_cast<int>(e), streammux_category());
}

} // namespace streammux
