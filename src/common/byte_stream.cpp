
#include "byte_stream.hpp"
#include "logging.hpp"

namespace streammux {

template <typename Map, typename Fn>
static void dispatch(const Map &listeners, Fn &&call) {
  std::vector<typename Map::key_type> ids;
  ids.reserve(listeners.size());
  for (const auto &kv : listeners)
    ids.push_back(kv.first);
  for (auto id : ids) {
    auto it = listeners.find(id);
    if (it == listeners.end())
      continue; // removed by an earlier listener
    auto h = it->second;
    call(h);
  }
}

ByteStream::ListenerId ByteStream::on_data(DataHandler h) {
  ListenerId id = next_id_++;
  data_.emplace(id, std::move(h));
  flush_pending();
  return id;
}

ByteStream::ListenerId ByteStream::on_end(EndHandler h) {
  ListenerId id = next_id_++;
  if (end_fired_) {
    h();
    return id;
  }
  end_.emplace(id, std::move(h));
  return id;
}

ByteStream::ListenerId ByteStream::on_finish(EndHandler h) {
  ListenerId id = next_id_++;
  if (ended_) {
    h();
    return id;
  }
  finish_.emplace(id, std::move(h));
  return id;
}

ByteStream::ListenerId ByteStream::on_error(ErrorHandler h) {
  ListenerId id = next_id_++;
  error_.emplace(id, std::move(h));
  return id;
}

void ByteStream::remove_listener(ListenerId id) {
  data_.erase(id);
  end_.erase(id);
  finish_.erase(id);
  error_.erase(id);
}

void ByteStream::remove_all_listeners() {
  data_.clear();
  end_.clear();
  finish_.clear();
  error_.clear();
}

bool ByteStream::write(const std::vector<uint8_t> &data) {
  if (ended_)
    return false;
  bytes_written_ += data.size();
  if (data_.empty() || !pending_.empty()) {
    pending_.push_back(data);
    return true;
  }
  deliver(data);
  return true;
}

bool ByteStream::write(const uint8_t *data, size_t len) {
  return write(std::vector<uint8_t>(data, data + len));
}

void ByteStream::end() {
  if (ended_)
    return;
  ended_ = true;
  dispatch(finish_, [](EndHandler &h) { h(); });
  finish_.clear();
  if (pending_.empty())
    fire_end();
}

void ByteStream::fail(std::error_code ec) {
  if (error_.empty()) {
    Logger::instance().log(LogLevel::WARN, "unhandled stream error: %s",
                           ec.message().c_str());
    return;
  }
  dispatch(error_, [&](ErrorHandler &h) { h(ec); });
}

void ByteStream::flush_pending() {
  while (!pending_.empty() && !data_.empty()) {
    std::vector<uint8_t> chunk = std::move(pending_.front());
    pending_.pop_front();
    deliver(chunk);
  }
  if (ended_ && !end_fired_ && pending_.empty())
    fire_end();
}

void ByteStream::deliver(const std::vector<uint8_t> &data) {
  dispatch(data_, [&](DataHandler &h) { h(data); });
}

void ByteStream::fire_end() {
  if (end_fired_)
    return;
  end_fired_ = true;
  dispatch(end_, [](EndHandler &h) { h(); });
  end_.clear();
}

} // namespace streammux
