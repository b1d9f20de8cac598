
#include "logging.hpp"
#include "playback.hpp"
#include <asio.hpp>
#include <cstdio>
#include <iostream>
#include <memory>

using namespace streammux;

static void usage() {
  std::cerr << "usage: streammux_play --input FILE [--output-dir DIR]"
               " [--realtime] [--log-level LVL]\n";
}

int main(int argc, char **argv) {
  std::string input;
  std::string out_dir = ".";
  DemuxConfig cfg;
  LogLevel lvl = LogLevel::INFO;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--input")
      input = next(i);
    else if (a == "--output-dir")
      out_dir = next(i);
    else if (a == "--realtime")
      cfg.realtime_playback = true;
    else if (a == "--log-level") {
      if (!parse_log_level(next(i), lvl)) {
        std::cerr << "bad log level" << std::endl;
        return 1;
      }
    } else if (a == "--help" || a == "-h") {
      usage();
      return 0;
    } else {
      std::cerr << "unknown argument: " << a << "\n";
      usage();
      return 1;
    }
  }
  if (input.empty()) {
    usage();
    return 1;
  }
  Logger::instance().set_level(lvl);

  asio::io_context io;
  int rc = 0;
  Json::StreamWriterBuilder wb;
  wb["indentation"] = "";

  demultiplex_file(
      io, input, cfg, [&](std::error_code ec, SessionInfo info) {
        if (ec) {
          std::cerr << "demultiplex " << input << ": " << ec.message()
                    << std::endl;
          rc = 1;
          return;
        }
        for (auto &ds : info.streams) {
          std::string path =
              out_dir + "/stream_" + std::to_string(ds.stream_id) + ".bin";
          std::shared_ptr<std::FILE> f(std::fopen(path.c_str(), "wb"),
                                       [](std::FILE *p) {
                                         if (p)
                                           std::fclose(p);
                                       });
          if (!f) {
            std::cerr << "cannot create " << path << std::endl;
            rc = 1;
            continue;
          }
          Logger::instance().log(LogLevel::INFO, "stream %u -> %s meta=%s",
                                 (unsigned)ds.stream_id, path.c_str(),
                                 Json::writeString(wb, ds.metadata).c_str());
          auto stream = ds.stream;
          stream->on_data([f, &rc, path](const std::vector<uint8_t> &data) {
            if (std::fwrite(data.data(), 1, data.size(), f.get()) !=
                data.size()) {
              std::cerr << "write to " << path << " failed" << std::endl;
              rc = 1;
            }
          });
          stream->on_error([&rc, path](std::error_code ec) {
            std::cerr << path << ": " << ec.message() << std::endl;
            rc = 1;
          });
          // drop the FILE as soon as the stream ends
          stream->on_end([stream]() { stream->remove_all_listeners(); });
        }
      });
  io.run();
  return rc;
}
