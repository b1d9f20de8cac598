
#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>
#include <json/json.h>
#include "byte_stream.hpp"
#include "protocol.hpp"

namespace streammux {

struct MuxConfig {
    uint32_t max_data_gap_ms{60000};
    uint32_t checksum_window_bytes{1500};
    uint32_t tick_interval_ms{1000};
    // Source of elapsed time for frame offsets; steady_clock::now when empty.
    std::function<std::chrono::steady_clock::time_point()> clock;
};

class Multiplexer : public std::enable_shared_from_this<Multiplexer> {
public:
    // Throws std::system_error(errc::protocol_misuse) on bad arguments.
    Multiplexer(asio::io_context& io, std::vector<std::shared_ptr<ByteStream>> sources,
                const MuxConfig& cfg, std::vector<Json::Value> extra_metadata = {});
    void start();
    // Idempotent; also runs when anyone ends output().
    void stop();
    std::shared_ptr<ByteStream> output() const { return output_; }
    size_t streams_alive() const { return streams_alive_; }

private:
    using Clock = std::chrono::steady_clock;

    struct SourceSlot {
        std::shared_ptr<ByteStream> stream;
        std::vector<ByteStream::ListenerId> listeners;
        bool open{true};
    };

    Clock::time_point now() const;
    uint16_t take_offset(Clock::time_point now);
    void write_header();
    void on_source_data(size_t index, const std::vector<uint8_t>& data);
    void on_source_end(size_t index);
    void detach_source(SourceSlot& slot);
    void maybe_send_crc();
    void schedule_tick();

    asio::io_context& io_;
    MuxConfig cfg_;
    std::vector<SourceSlot> sources_;
    std::vector<StreamMeta> metas_;
    std::shared_ptr<ByteStream> output_;
    ByteStream::ListenerId output_finish_listener_{0};
    asio::steady_timer tick_;

    Clock::time_point last_frame_time_;
    uint16_t crc_{0};
    size_t unchecked_bytes_{0};
    size_t streams_alive_{0};
    bool can_write_{false};
    bool stopped_{false};
};

std::shared_ptr<ByteStream> multiplex(asio::io_context& io,
                                      std::vector<std::shared_ptr<ByteStream>> sources,
                                      const MuxConfig& cfg = MuxConfig{},
                                      std::vector<Json::Value> extra_metadata = {});

} // namespace streammux
