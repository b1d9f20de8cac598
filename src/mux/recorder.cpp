
#include "recorder.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cerrno>
#include <cstdio>

namespace streammux {

FileRecorder::FileRecorder(asio::io_context &io,
                           std::shared_ptr<ByteStream> muxed,
                           std::string filename, uint32_t append_interval_ms)
    : muxed_(std::move(muxed)), filename_(std::move(filename)),
      append_interval_ms_(append_interval_ms), timer_(io) {}

void FileRecorder::start() {
  auto self = shared_from_this();
  muxed_->on_data([self](const std::vector<uint8_t> &data) {
    self->buffer_.insert(self->buffer_.end(), data.begin(), data.end());
  });
  muxed_->on_end([self]() { self->finish(); });
  if (!finished_)
    schedule_append();
}

void FileRecorder::schedule_append() {
  auto self = shared_from_this();
  timer_.expires_after(std::chrono::milliseconds(append_interval_ms_));
  timer_.async_wait([self](std::error_code ec) {
    if (ec || self->finished_)
      return;
    if (!self->flush()) {
      // a failed append ends the recording
      self->muxed_->end();
      return;
    }
    self->schedule_append();
  });
}

bool FileRecorder::flush() {
  if (buffer_.empty())
    return true;
  std::vector<uint8_t> out;
  out.swap(buffer_);

  std::error_code ec;
  std::FILE *f = std::fopen(filename_.c_str(), "ab");
  if (!f) {
    ec = std::error_code(errno, std::generic_category());
  } else {
    size_t n = std::fwrite(out.data(), 1, out.size(), f);
    if (n != out.size())
      ec = std::error_code(errno ? errno : EIO, std::generic_category());
    if (std::fclose(f) != 0 && !ec)
      ec = std::error_code(errno, std::generic_category());
  }
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "append %zu bytes to %s: %s",
                           out.size(), filename_.c_str(),
                           ec.message().c_str());
    muxed_->fail(ec);
    return false;
  }
  bytes_appended_ += out.size();
  Logger::instance().log(LogLevel::DEBUG, "appended %zu bytes to %s",
                         out.size(), filename_.c_str());
  return true;
}

void FileRecorder::finish() {
  if (finished_)
    return;
  finished_ = true;
  timer_.cancel();
  if (!flush())
    return;
  Logger::instance().log(LogLevel::INFO, "recording %s closed, %zu bytes",
                         filename_.c_str(), bytes_appended_);
}

std::shared_ptr<ByteStream>
record_streams(asio::io_context &io,
               std::vector<std::shared_ptr<ByteStream>> sources,
               const std::string &filename, const RecorderConfig &cfg) {
  if (cfg.append_interval_ms == 0)
    throw std::system_error(make_error_code(errc::protocol_misuse),
                            "append_interval_ms must be positive");
  auto muxed = multiplex(io, std::move(sources), cfg.mux);
  auto rec = std::make_shared<FileRecorder>(io, muxed, filename,
                                            cfg.append_interval_ms);
  rec->start();
  return muxed;
}

} // namespace streammux
