
#include "playback.hpp"
#include "descriptor_source.hpp"

namespace streammux {

std::shared_ptr<Demultiplexer> demultiplex_file(asio::io_context &io,
                                                const std::string &filename,
                                                const DemuxConfig &cfg,
                                                ReadyHandler handler) {
  std::error_code ec;
  auto src = DescriptorSource::open_file(io, filename, ec);
  if (!src) {
    asio::post(io, [handler, ec]() { handler(ec, SessionInfo{}); });
    return nullptr;
  }
  auto d = demultiplex(io, src->stream(), cfg, std::move(handler));
  src->start();
  return d;
}

std::shared_ptr<Demultiplexer> demultiplex_buffer(asio::io_context &io,
                                                  const std::vector<uint8_t> &buf,
                                                  const DemuxConfig &cfg,
                                                  ReadyHandler handler) {
  auto input = std::make_shared<ByteStream>();
  auto d = demultiplex(io, input, cfg, std::move(handler));
  input->write(buf);
  input->end();
  return d;
}

} // namespace streammux
