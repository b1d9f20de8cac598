
#pragma once
#include <asio.hpp>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include "byte_stream.hpp"

namespace streammux {

// Pumps a file, FIFO or pipe descriptor into a ByteStream until EOF.
class DescriptorSource : public std::enable_shared_from_this<DescriptorSource> {
public:
    // Takes ownership of fd.
    DescriptorSource(asio::io_context& io, int fd);
    static std::shared_ptr<DescriptorSource> open_file(asio::io_context& io,
                                                       const std::string& path,
                                                       std::error_code& ec);
    void start();
    void close();
    std::shared_ptr<ByteStream> stream() const { return out_; }

private:
    void do_read();

    asio::posix::stream_descriptor desc_;
    std::vector<uint8_t> read_buf_;
    std::shared_ptr<ByteStream> out_;
    ByteStream::ListenerId end_listener_{0};
    bool closed_{false};
};

} // namespace streammux
