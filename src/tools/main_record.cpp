
#include "descriptor_source.hpp"
#include "logging.hpp"
#include "recorder.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <iostream>

using namespace streammux;

static void usage() {
  std::cerr << "usage: streammux_record --output FILE [--append-interval MS]"
               " [--max-gap MS] [--crc-window BYTES] [--log-level LVL]"
               " INPUT...\n";
}

int main(int argc, char **argv) {
  std::string output;
  std::vector<std::string> inputs;
  RecorderConfig cfg;
  LogLevel lvl = LogLevel::INFO;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto next_u32 = [&](int &i) -> uint32_t {
      std::string v = next(i);
      uint32_t out;
      if (!parse_u32(v, out)) {
        std::cerr << "bad value for " << a << ": " << v << "\n";
        std::exit(1);
      }
      return out;
    };
    if (a == "--output")
      output = next(i);
    else if (a == "--append-interval")
      cfg.append_interval_ms = next_u32(i);
    else if (a == "--max-gap")
      cfg.mux.max_data_gap_ms = next_u32(i);
    else if (a == "--crc-window")
      cfg.mux.checksum_window_bytes = next_u32(i);
    else if (a == "--log-level") {
      if (!parse_log_level(next(i), lvl)) {
        std::cerr << "bad log level" << std::endl;
        return 1;
      }
    } else if (a == "--help" || a == "-h") {
      usage();
      return 0;
    } else if (a.size() > 1 && a[0] == '-') {
      std::cerr << "unknown option: " << a << "\n";
      usage();
      return 1;
    } else
      inputs.push_back(a);
  }
  if (output.empty() || inputs.empty()) {
    usage();
    return 1;
  }
  Logger::instance().set_level(lvl);

  asio::io_context io;
  std::vector<std::shared_ptr<DescriptorSource>> readers;
  std::vector<std::shared_ptr<ByteStream>> sources;
  for (const auto &path : inputs) {
    std::error_code ec;
    auto r = DescriptorSource::open_file(io, path, ec);
    if (!r) {
      std::cerr << "cannot open " << path << ": " << ec.message() << std::endl;
      return 1;
    }
    readers.push_back(r);
    sources.push_back(r->stream());
  }

  std::shared_ptr<ByteStream> muxed;
  try {
    muxed = record_streams(io, sources, output, cfg);
  } catch (const std::system_error &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  bool failed = false;
  muxed->on_error([&failed](std::error_code) { failed = true; });

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([muxed](std::error_code ec, int) {
    if (!ec)
      muxed->end();
  });
  muxed->on_end([&signals]() {
    std::error_code ec;
    signals.cancel(ec);
  });

  for (auto &r : readers)
    r->start();
  io.run();
  return failed ? 1 : 0;
}
