
#include "descriptor_source.hpp"
#include "logging.hpp"
#include <cerrno>
#include <fcntl.h>

namespace streammux {

DescriptorSource::DescriptorSource(asio::io_context &io, int fd)
    : desc_(io, fd), read_buf_(64 * 1024),
      out_(std::make_shared<ByteStream>()) {}

std::shared_ptr<DescriptorSource>
DescriptorSource::open_file(asio::io_context &io, const std::string &path,
                            std::error_code &ec) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    ec = std::error_code(errno, std::generic_category());
    Logger::instance().log(LogLevel::ERROR, "open %s failed: %s", path.c_str(),
                           ec.message().c_str());
    return nullptr;
  }
  ec.clear();
  return std::make_shared<DescriptorSource>(io, fd);
}

void DescriptorSource::start() {
  auto self = shared_from_this();
  // Consumer ended the stream: stop reading.
  end_listener_ = out_->on_finish([self]() { self->close(); });
  do_read();
}

void DescriptorSource::close() {
  if (closed_)
    return;
  closed_ = true;
  out_->remove_listener(end_listener_);
  std::error_code ec;
  desc_.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "descriptor close: %s",
                           ec.message().c_str());
}

void DescriptorSource::do_read() {
  if (closed_)
    return;
  auto self = shared_from_this();
  desc_.async_read_some(
      asio::buffer(read_buf_), [self](std::error_code ec, std::size_t n) {
        if (n > 0 && !self->out_->ended())
          self->out_->write(self->read_buf_.data(), n);
        if (ec) {
          if (ec == asio::error::operation_aborted)
            return;
          if (ec != asio::error::eof) {
            Logger::instance().log(LogLevel::WARN, "descriptor read error: %s",
                                   ec.message().c_str());
            self->out_->fail(ec);
          }
          self->close();
          self->out_->end();
          return;
        }
        if (self->out_->ended()) {
          self->close();
          return;
        }
        self->do_read();
      });
}

} // namespace streammux
