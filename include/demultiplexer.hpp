
#pragma once
#include <asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>
#include <json/json.h>
#include "byte_stream.hpp"
#include "protocol.hpp"

namespace streammux {

struct DemuxConfig {
    // Hold each frame back until its recorded offset has elapsed since the
    // previous delivery.
    bool realtime_playback{false};
};

struct DemuxedStream {
    uint8_t stream_id{};
    Json::Value metadata;
    std::shared_ptr<ByteStream> stream;
};

struct SessionInfo {
    float initial_timestamp{};
    std::vector<DemuxedStream> streams;
};

// Called exactly once: with the reconstructed streams, or with a header-stage
// error and no streams.
using ReadyHandler = std::function<void(std::error_code, SessionInfo)>;

class Demultiplexer : public std::enable_shared_from_this<Demultiplexer> {
public:
    Demultiplexer(asio::io_context& io, std::shared_ptr<ByteStream> input,
                  const DemuxConfig& cfg, ReadyHandler handler);
    void start();
    void stop();

    size_t pending_chunks() const { return pending_.size(); }
    bool header_parsed() const { return state_ != State::AwaitingHeader; }

private:
    enum class State { AwaitingHeader, StreamingChunks, Closed };
    using Clock = std::chrono::steady_clock;

    struct PendingChunk {
        uint8_t stream_id;
        uint16_t offset_ms;
        std::vector<uint8_t> payload;
    };

    void on_input(const std::vector<uint8_t>& data);
    void on_input_end();
    void schedule_parse();
    void parse_step();
    // Each returns true when it made progress and another pass should follow.
    bool parse_header();
    bool parse_frame();
    void schedule_delivery();
    void deliver_next();
    void maybe_finish();

    void fail_header(std::error_code ec);
    void fail_chunks(std::error_code ec);
    void detach_input();
    void end_sinks();

    asio::io_context& io_;
    std::shared_ptr<ByteStream> input_;
    DemuxConfig cfg_;
    ReadyHandler handler_;
    std::vector<ByteStream::ListenerId> input_listeners_;

    State state_{State::AwaitingHeader};
    std::vector<uint8_t> buffered_;
    size_t read_pos_{0};
    bool input_ended_{false};
    bool input_drained_{false};
    bool parse_scheduled_{false};

    uint16_t crc_{0};
    std::map<uint8_t, std::shared_ptr<ByteStream>> sinks_;

    std::deque<PendingChunk> pending_;
    asio::steady_timer delivery_timer_;
    bool delivery_scheduled_{false};
    // Scheduled time of the previous delivery; realtime offsets count from it.
    std::optional<Clock::time_point> last_delivery_;
};

std::shared_ptr<Demultiplexer> demultiplex(asio::io_context& io,
                                           std::shared_ptr<ByteStream> input,
                                           const DemuxConfig& cfg, ReadyHandler handler);

} // namespace streammux
