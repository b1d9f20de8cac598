
#pragma once
#include <asio.hpp>
#include <memory>
#include <string>
#include <vector>
#include "demultiplexer.hpp"

namespace streammux {

// Returns nullptr when the file cannot be opened; the handler then receives
// the open(2) error on the next io_context turn.
std::shared_ptr<Demultiplexer> demultiplex_file(asio::io_context& io, const std::string& filename,
                                                const DemuxConfig& cfg, ReadyHandler handler);

std::shared_ptr<Demultiplexer> demultiplex_buffer(asio::io_context& io,
                                                  const std::vector<uint8_t>& buf,
                                                  const DemuxConfig& cfg, ReadyHandler handler);

} // namespace streammux
