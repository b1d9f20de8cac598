
#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <system_error>
#include <vector>

namespace streammux {

// In-process byte pipe with data/end/error listeners. Dispatch is synchronous
// on the calling thread; a stream must only be touched from the thread running
// its io_context.
class ByteStream : public std::enable_shared_from_this<ByteStream> {
public:
    using ListenerId = uint64_t;
    using DataHandler = std::function<void(const std::vector<uint8_t>&)>;
    using EndHandler = std::function<void()>;
    using ErrorHandler = std::function<void(std::error_code)>;

    ByteStream() = default;
    ByteStream(const ByteStream&) = delete;
    ByteStream& operator=(const ByteStream&) = delete;

    // Chunks written before the first data listener attaches are held and
    // replayed to it, so nothing written at setup time is lost.
    ListenerId on_data(DataHandler h);
    // Invoked immediately if the end has already been delivered.
    ListenerId on_end(EndHandler h);
    // Fires inside end() itself, before any held chunks reach a reader.
    // Invoked immediately if end() has already been called.
    ListenerId on_finish(EndHandler h);
    ListenerId on_error(ErrorHandler h);
    void remove_listener(ListenerId id);
    void remove_all_listeners();

    // Returns false once end() has been called.
    bool write(const std::vector<uint8_t>& data);
    bool write(const uint8_t* data, size_t len);
    void end();
    void fail(std::error_code ec);

    bool ended() const { return ended_; }
    size_t bytes_written() const { return bytes_written_; }

private:
    template <typename H>
    using ListenerMap = std::map<ListenerId, H>;

    void flush_pending();
    void deliver(const std::vector<uint8_t>& data);
    void fire_end();

    ListenerId next_id_{1};
    ListenerMap<DataHandler> data_;
    ListenerMap<EndHandler> end_;
    ListenerMap<EndHandler> finish_;
    ListenerMap<ErrorHandler> error_;
    std::deque<std::vector<uint8_t>> pending_;
    bool ended_{false};
    bool end_fired_{false};
    size_t bytes_written_{0};
};

} // namespace streammux
