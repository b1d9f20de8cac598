
#include "multiplexer.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace streammux {

static constexpr int64_t kMaxOffsetMs = 0xFFFF;

static void misuse(const char *what) {
  throw std::system_error(make_error_code(errc::protocol_misuse), what);
}

static uint16_t clamp_offset(int64_t ms) {
  if (ms < 0)
    return 0;
  if (ms > kMaxOffsetMs) {
    Logger::instance().log(LogLevel::WARN,
                           "offset %lld ms exceeds field range, clamped",
                           (long long)ms);
    return (uint16_t)kMaxOffsetMs;
  }
  return (uint16_t)ms;
}

Multiplexer::Multiplexer(asio::io_context &io,
                         std::vector<std::shared_ptr<ByteStream>> sources,
                         const MuxConfig &cfg,
                         std::vector<Json::Value> extra_metadata)
    : io_(io), cfg_(cfg), output_(std::make_shared<ByteStream>()), tick_(io) {
  if (sources.size() > kMaxStreams)
    misuse("too many streams, at most 254 can be multiplexed");
  if (cfg_.max_data_gap_ms > (uint32_t)kMaxOffsetMs)
    misuse("max_data_gap_ms must fit the 16-bit offset field");
  if (cfg_.tick_interval_ms == 0)
    misuse("tick_interval_ms must be positive");
  if (!extra_metadata.empty() && extra_metadata.size() != sources.size())
    misuse("extra_metadata must have one entry per source");

  Json::StreamWriterBuilder wb;
  wb["indentation"] = "";
  for (size_t i = 0; i < sources.size(); i++) {
    if (!sources[i])
      misuse("null source stream");
    Json::Value meta(Json::objectValue);
    if (!extra_metadata.empty()) {
      if (!extra_metadata[i].isObject() && !extra_metadata[i].isNull())
        misuse("stream metadata must be a JSON object");
      if (extra_metadata[i].isObject())
        meta = extra_metadata[i];
    }
    uint8_t id = (uint8_t)(i + 1);
    meta["id"] = (Json::UInt)id;
    metas_.push_back(StreamMeta{id, Json::writeString(wb, meta)});

    SourceSlot slot;
    slot.stream = std::move(sources[i]);
    sources_.push_back(std::move(slot));
  }
}

Multiplexer::Clock::time_point Multiplexer::now() const {
  return cfg_.clock ? cfg_.clock() : Clock::now();
}

void Multiplexer::write_header() {
  using namespace std::chrono;
  auto epoch_ms =
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count();
  output_->write(encode_header((float)epoch_ms, metas_));
}

void Multiplexer::start() {
  auto self = shared_from_this();
  last_frame_time_ = now();
  write_header();
  can_write_ = true;
  streams_alive_ = sources_.size();
  Logger::instance().log(LogLevel::INFO, "multiplexing %zu streams",
                         sources_.size());

  output_finish_listener_ = output_->on_finish([self]() { self->stop(); });

  for (size_t i = 0; i < sources_.size() && !stopped_; i++) {
    auto &slot = sources_[i];
    auto src = slot.stream;
    slot.listeners.push_back(
        src->on_data([self, i](const std::vector<uint8_t> &data) {
          self->on_source_data(i, data);
        }));
    if (stopped_)
      break;
    slot.listeners.push_back(
        src->on_end([self, i]() { self->on_source_end(i); }));
  }

  if (sources_.empty()) {
    maybe_send_crc();
    output_->end();
    return;
  }
  if (!stopped_)
    schedule_tick();
}

void Multiplexer::stop() {
  if (stopped_)
    return;
  stopped_ = true;
  can_write_ = false;
  tick_.cancel();
  for (auto &slot : sources_)
    detach_source(slot);
  output_->remove_listener(output_finish_listener_);
  output_->end();
}

void Multiplexer::detach_source(SourceSlot &slot) {
  for (auto id : slot.listeners)
    slot.stream->remove_listener(id);
  slot.listeners.clear();
}

uint16_t Multiplexer::take_offset(Clock::time_point t) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                t - last_frame_time_)
                .count();
  last_frame_time_ = t;
  return clamp_offset(ms);
}

void Multiplexer::on_source_data(size_t index,
                                 const std::vector<uint8_t> &data) {
  if (!can_write_)
    return;
  uint16_t offset = take_offset(now());
  auto buf = encode_data_frames((uint8_t)(index + 1), offset, data.data(),
                                data.size());
  output_->write(buf);
  crc_ = crc16(buf.data(), buf.size(), crc_);
  unchecked_bytes_ += buf.size();
  maybe_send_crc();
}

void Multiplexer::on_source_end(size_t index) {
  auto &slot = sources_[index];
  if (!slot.open)
    return;
  slot.open = false;
  streams_alive_--;
  detach_source(slot);
  maybe_send_crc();
  if (streams_alive_ == 0 && !stopped_) {
    Logger::instance().log(LogLevel::INFO,
                           "all %zu sources ended, closing output",
                           sources_.size());
    stop();
  }
}

// Emits a control frame once the data gap or the unchecked byte window is
// exceeded, or when no source is left open.
void Multiplexer::maybe_send_crc() {
  if (!can_write_)
    return;
  auto t = now();
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     t - last_frame_time_)
                     .count();
  if (elapsed > (int64_t)cfg_.max_data_gap_ms ||
      unchecked_bytes_ > cfg_.checksum_window_bytes || streams_alive_ == 0) {
    uint16_t offset = take_offset(t);
    unchecked_bytes_ = 0;
    auto buf = encode_control_frame(offset, crc_);
    output_->write(buf);
    Logger::instance().log(LogLevel::DEBUG,
                           "control frame offset=%u crc=0x%04x",
                           (unsigned)offset, (unsigned)crc_);
    // the control frame itself is covered by the next checkpoint
    crc_ = crc16(buf.data(), buf.size(), crc_);
  }
}

void Multiplexer::schedule_tick() {
  auto self = shared_from_this();
  tick_.expires_after(std::chrono::milliseconds(cfg_.tick_interval_ms));
  tick_.async_wait([self](std::error_code ec) {
    if (ec || self->stopped_)
      return;
    self->maybe_send_crc();
    self->schedule_tick();
  });
}

std::shared_ptr<ByteStream>
multiplex(asio::io_context &io,
          std::vector<std::shared_ptr<ByteStream>> sources,
          const MuxConfig &cfg, std::vector<Json::Value> extra_metadata) {
  auto mux = std::make_shared<Multiplexer>(io, std::move(sources), cfg,
                                           std::move(extra_metadata));
  mux->start();
  return mux->output();
}

} // namespace streammux
