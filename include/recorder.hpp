
#pragma once
#include <asio.hpp>
#include <memory>
#include <string>
#include <vector>
#include "byte_stream.hpp"
#include "multiplexer.hpp"

namespace streammux {

struct RecorderConfig {
    // Data buffered between appends is lost if the process dies.
    uint32_t append_interval_ms{1000};
    MuxConfig mux;
};

class FileRecorder : public std::enable_shared_from_this<FileRecorder> {
public:
    FileRecorder(asio::io_context& io, std::shared_ptr<ByteStream> muxed,
                 std::string filename, uint32_t append_interval_ms);
    void start();
    // Appends whatever is buffered; false on I/O failure.
    bool flush();
    size_t bytes_appended() const { return bytes_appended_; }

private:
    void schedule_append();
    void finish();

    std::shared_ptr<ByteStream> muxed_;
    std::string filename_;
    uint32_t append_interval_ms_;
    asio::steady_timer timer_;
    std::vector<uint8_t> buffer_;
    size_t bytes_appended_{0};
    bool finished_{false};
};

// Multiplexes sources and periodically appends the result to filename.
// Returns the multiplexed stream; ending it stops the recording.
std::shared_ptr<ByteStream> record_streams(asio::io_context& io,
                                           std::vector<std::shared_ptr<ByteStream>> sources,
                                           const std::string& filename,
                                           const RecorderConfig& cfg = RecorderConfig{});

} // namespace streammux
