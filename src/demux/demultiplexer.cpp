
#include "demultiplexer.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace streammux {

static constexpr std::chrono::milliseconds kMaxPlaybackLag{1000};

Demultiplexer::Demultiplexer(asio::io_context &io,
                             std::shared_ptr<ByteStream> input,
                             const DemuxConfig &cfg, ReadyHandler handler)
    : io_(io), input_(std::move(input)), cfg_(cfg),
      handler_(std::move(handler)), delivery_timer_(io) {
  if (!input_)
    throw std::system_error(make_error_code(errc::protocol_misuse),
                            "null input stream");
}

void Demultiplexer::start() {
  auto self = shared_from_this();
  input_listeners_.push_back(input_->on_data(
      [self](const std::vector<uint8_t> &data) { self->on_input(data); }));
  if (state_ == State::Closed)
    return;
  input_listeners_.push_back(
      input_->on_end([self]() { self->on_input_end(); }));
}

void Demultiplexer::stop() {
  if (state_ == State::Closed)
    return;
  bool had_header = state_ != State::AwaitingHeader;
  state_ = State::Closed;
  delivery_timer_.cancel();
  pending_.clear();
  detach_input();
  end_sinks();
  if (!had_header && handler_) {
    auto h = std::move(handler_);
    handler_ = nullptr;
    h(asio::error::operation_aborted, SessionInfo{});
  }
}

void Demultiplexer::on_input(const std::vector<uint8_t> &data) {
  if (state_ == State::Closed)
    return;
  if (read_pos_ > 0 && read_pos_ * 2 >= buffered_.size()) {
    buffered_.erase(buffered_.begin(), buffered_.begin() + read_pos_);
    read_pos_ = 0;
  }
  buffered_.insert(buffered_.end(), data.begin(), data.end());
  schedule_parse();
}

void Demultiplexer::on_input_end() {
  if (state_ == State::Closed)
    return;
  input_ended_ = true;
  schedule_parse();
}

// One header or one frame per turn, so a large backlog does not starve
// other handlers on the same io_context.
void Demultiplexer::schedule_parse() {
  if (parse_scheduled_ || state_ == State::Closed)
    return;
  parse_scheduled_ = true;
  auto self = shared_from_this();
  asio::post(io_, [self]() {
    self->parse_scheduled_ = false;
    self->parse_step();
  });
}

void Demultiplexer::parse_step() {
  if (state_ == State::Closed)
    return;
  bool progressed =
      state_ == State::AwaitingHeader ? parse_header() : parse_frame();
  if (state_ == State::Closed)
    return;
  if (progressed) {
    schedule_parse();
    return;
  }
  if (!input_ended_ || input_drained_)
    return;

  size_t leftover = buffered_.size() - read_pos_;
  if (state_ == State::AwaitingHeader) {
    Logger::instance().log(LogLevel::ERROR,
                           "input ended after %zu bytes, header incomplete",
                           leftover);
    fail_header(errc::header_decode);
    return;
  }
  if (leftover > 0)
    Logger::instance().log(LogLevel::WARN,
                           "discarding %zu trailing bytes of a partial frame",
                           leftover);
  input_drained_ = true;
  maybe_finish();
}

bool Demultiplexer::parse_header() {
  const uint8_t *p = buffered_.data() + read_pos_;
  size_t len = buffered_.size() - read_pos_;
  uint32_t header_len = 0;
  uint16_t stored = 0;
  DecodeStatus st = peek_header(p, len, header_len, stored);
  if (st == DecodeStatus::NeedMoreData)
    return false;
  if (st == DecodeStatus::Malformed) {
    Logger::instance().log(LogLevel::ERROR, "malformed header prefix: %s",
                           bytes_to_hex(p, len, kHeaderPrefixSize).c_str());
    fail_header(errc::header_decode);
    return false;
  }

  // Verified before the body is interpreted, so any corruption inside it
  // reads as a checksum failure.
  uint16_t computed = header_body_checksum(p, header_len);
  if (computed != stored) {
    Logger::instance().log(LogLevel::ERROR,
                           "header checksum 0x%04x, computed 0x%04x",
                           (unsigned)stored, (unsigned)computed);
    fail_header(errc::header_checksum);
    return false;
  }

  Header hdr;
  size_t consumed = 0;
  if (decode_header(p, len, hdr, consumed) != DecodeStatus::Ok) {
    Logger::instance().log(LogLevel::ERROR, "malformed header body: %s",
                           bytes_to_hex(p, header_len).c_str());
    fail_header(errc::header_decode);
    return false;
  }

  SessionInfo info;
  info.initial_timestamp = hdr.initial_timestamp;
  Json::CharReaderBuilder rb;
  std::unique_ptr<Json::CharReader> reader(rb.newCharReader());
  for (const auto &sm : hdr.streams) {
    DemuxedStream ds;
    ds.stream_id = sm.stream_id;
    std::string errs;
    const char *begin = sm.metadata_json.data();
    if (!reader->parse(begin, begin + sm.metadata_json.size(), &ds.metadata,
                       &errs)) {
      Logger::instance().log(LogLevel::ERROR,
                             "stream %u metadata does not parse: %s",
                             (unsigned)sm.stream_id, errs.c_str());
      fail_header(errc::metadata_decode);
      return false;
    }
    ds.stream = std::make_shared<ByteStream>();
    info.streams.push_back(std::move(ds));
  }

  read_pos_ += consumed;
  crc_ = 0;
  for (const auto &ds : info.streams)
    sinks_[ds.stream_id] = ds.stream;
  state_ = State::StreamingChunks;
  Logger::instance().log(LogLevel::INFO,
                         "header parsed: %zu streams, %u header bytes",
                         info.streams.size(), (unsigned)hdr.header_length);

  auto h = std::move(handler_);
  handler_ = nullptr;
  if (h)
    h(std::error_code(), std::move(info));
  return true;
}

bool Demultiplexer::parse_frame() {
  const uint8_t *p = buffered_.data() + read_pos_;
  size_t len = buffered_.size() - read_pos_;
  Frame frame;
  size_t consumed = 0;
  // Frames are self-delimiting, so the only non-Ok outcome is NeedMoreData.
  if (decode_frame(p, len, frame, consumed) != DecodeStatus::Ok)
    return false;

  if (auto *cf = std::get_if<ControlFrame>(&frame)) {
    if (cf->checksum != crc_) {
      Logger::instance().log(LogLevel::ERROR,
                             "chunk checksum 0x%04x, computed 0x%04x",
                             (unsigned)cf->checksum, (unsigned)crc_);
      fail_chunks(errc::chunk_checksum);
      return false;
    }
    Logger::instance().log(LogLevel::DEBUG, "checkpoint 0x%04x verified",
                           (unsigned)crc_);
    crc_ = crc16(p, consumed, crc_);
    read_pos_ += consumed;
    return true;
  }

  auto &df = std::get<DataFrame>(frame);
  if (sinks_.find(df.stream_id) == sinks_.end()) {
    Logger::instance().log(LogLevel::ERROR, "chunk for undeclared stream %u",
                           (unsigned)df.stream_id);
    fail_chunks(errc::unknown_stream);
    return false;
  }
  crc_ = crc16(p, consumed, crc_);
  read_pos_ += consumed;
  if (Logger::instance().level() == LogLevel::TRACE)
    Logger::instance().log(LogLevel::TRACE, "stream %u +%ums %s",
                           (unsigned)df.stream_id, (unsigned)df.offset_ms,
                           bytes_to_hex(df.payload.data(), df.payload.size())
                               .c_str());
  pending_.push_back(
      PendingChunk{df.stream_id, df.offset_ms, std::move(df.payload)});
  schedule_delivery();
  return true;
}

void Demultiplexer::schedule_delivery() {
  if (delivery_scheduled_ || pending_.empty() || state_ == State::Closed)
    return;
  delivery_scheduled_ = true;
  auto self = shared_from_this();

  if (cfg_.realtime_playback && last_delivery_) {
    auto elapsed = Clock::now() - *last_delivery_;
    auto due = std::chrono::milliseconds(pending_.front().offset_ms);
    if (elapsed < due) {
      delivery_timer_.expires_after(due - elapsed);
      delivery_timer_.async_wait([self](std::error_code ec) {
        self->delivery_scheduled_ = false;
        if (ec)
          return;
        self->deliver_next();
      });
      return;
    }
  }
  asio::post(io_, [self]() {
    self->delivery_scheduled_ = false;
    self->deliver_next();
  });
}

void Demultiplexer::deliver_next() {
  if (state_ == State::Closed)
    return;
  if (pending_.empty()) {
    maybe_finish();
    return;
  }

  auto now = Clock::now();
  Clock::time_point anchor = now;
  if (cfg_.realtime_playback && last_delivery_) {
    auto due = *last_delivery_ +
               std::chrono::milliseconds(pending_.front().offset_ms);
    if (now < due) {
      schedule_delivery();
      return;
    }
    // Keep the recorded cadence through timer latency, but re-anchor after
    // a real stall.
    if (now - due <= kMaxPlaybackLag)
      anchor = due;
  }

  PendingChunk chunk = std::move(pending_.front());
  pending_.pop_front();
  last_delivery_ = anchor;
  sinks_[chunk.stream_id]->write(chunk.payload);
  if (state_ == State::Closed)
    return;

  if (!pending_.empty())
    schedule_delivery();
  else
    maybe_finish();
}

void Demultiplexer::maybe_finish() {
  if (state_ != State::StreamingChunks || !input_drained_ ||
      !pending_.empty() || delivery_scheduled_)
    return;
  state_ = State::Closed;
  detach_input();
  Logger::instance().log(LogLevel::INFO, "input drained, ending %zu streams",
                         sinks_.size());
  end_sinks();
}

void Demultiplexer::fail_header(std::error_code ec) {
  if (state_ == State::Closed)
    return;
  state_ = State::Closed;
  detach_input();
  input_->end();
  auto h = std::move(handler_);
  handler_ = nullptr;
  if (h)
    h(ec, SessionInfo{});
}

void Demultiplexer::fail_chunks(std::error_code ec) {
  if (state_ == State::Closed)
    return;
  state_ = State::Closed;
  delivery_timer_.cancel();
  if (!pending_.empty())
    Logger::instance().log(LogLevel::WARN,
                           "dropping %zu undelivered chunks after %s",
                           pending_.size(), ec.message().c_str());
  pending_.clear();
  detach_input();
  for (auto &kv : sinks_)
    if (!kv.second->ended())
      kv.second->fail(ec);
  end_sinks();
  input_->end();
}

void Demultiplexer::detach_input() {
  for (auto id : input_listeners_)
    input_->remove_listener(id);
  input_listeners_.clear();
}

void Demultiplexer::end_sinks() {
  for (auto &kv : sinks_)
    kv.second->end();
}

std::shared_ptr<Demultiplexer> demultiplex(asio::io_context &io,
                                           std::shared_ptr<ByteStream> input,
                                           const DemuxConfig &cfg,
                                           ReadyHandler handler) {
  auto d =
      std::make_shared<Demultiplexer>(io, std::move(input), cfg,
                                      std::move(handler));
  d->start();
  return d;
}

} // namespace streammux
