
#include "errors.hpp"
#include "multiplexer.hpp"
#include "playback.hpp"
#include "test_helpers.hpp"
#include <thread>

using namespace streammux;
using namespace streammux::test;
using std::chrono::milliseconds;

namespace {

// Hand-assembled recording with a correctly chained checksum.
struct WireBuilder {
  std::vector<uint8_t> bytes;
  uint16_t crc{0};

  explicit WireBuilder(const std::vector<StreamMeta> &metas, float ts = 1000.0f)
      : bytes(encode_header(ts, metas)) {}

  WireBuilder &data(uint8_t id, uint16_t offset, const std::vector<uint8_t> &payload) {
    auto b = encode_data_frames(id, offset, payload.data(), payload.size());
    crc = crc16(b.data(), b.size(), crc);
    append(bytes, b);
    return *this;
  }

  WireBuilder &control(uint16_t offset = 0) {
    auto b = encode_control_frame(offset, crc);
    crc = crc16(b.data(), b.size(), crc);
    append(bytes, b);
    return *this;
  }
};

std::vector<StreamMeta> two_streams() {
  return {{1, "{\"id\":1}"}, {2, "{\"id\":2}"}};
}

std::shared_ptr<DemuxResult> run_buffer(const std::vector<uint8_t> &wire,
                                        const DemuxConfig &cfg = DemuxConfig{}) {
  asio::io_context io;
  auto r = std::make_shared<DemuxResult>();
  demultiplex_buffer(io, wire, cfg, capture(r));
  io.run();
  return r;
}

struct Delivery {
  uint8_t stream_id;
  std::vector<uint8_t> payload;
  std::chrono::steady_clock::time_point at;
};

// Records every sink write in arrival order.
ReadyHandler record_order(const std::shared_ptr<std::vector<Delivery>> &log) {
  return [log](std::error_code ec, SessionInfo info) {
    ASSERT_FALSE(ec) << ec.message();
    for (auto &ds : info.streams) {
      auto id = ds.stream_id;
      ds.stream->on_data([log, id](const std::vector<uint8_t> &d) {
        log->push_back(Delivery{id, d, std::chrono::steady_clock::now()});
      });
    }
  };
}

} // namespace

TEST(Demultiplexer, LiveRoundTrip) {
  asio::io_context io;
  auto sources = std::vector<std::shared_ptr<ByteStream>>{
      std::make_shared<ByteStream>(), std::make_shared<ByteStream>(),
      std::make_shared<ByteStream>()};
  auto muxed = multiplex(io, sources);
  auto r = std::make_shared<DemuxResult>();
  demultiplex(io, muxed, DemuxConfig{}, capture(r));

  auto a = make_bytes(600, 1);
  auto b = make_bytes(1000, 2);
  auto c = make_bytes(7, 3);
  sources[0]->write(a);
  sources[1]->write(b);
  sources[2]->write(std::vector<uint8_t>());
  sources[2]->write(c);
  sources[0]->write(a);
  for (auto &s : sources)
    s->end();
  io.run();

  ASSERT_TRUE(r->ready_called);
  EXPECT_EQ(1, r->ready_calls);
  EXPECT_FALSE(r->ec) << r->ec.message();
  ASSERT_EQ(3u, r->streams.size());
  auto aa = a;
  append(aa, a);
  EXPECT_EQ(aa, r->streams[1]->bytes);
  EXPECT_EQ(b, r->streams[2]->bytes);
  EXPECT_EQ(c, r->streams[3]->bytes);
  for (auto &kv : r->streams)
    EXPECT_TRUE(kv.second->ended) << "stream " << (int)kv.first;
  EXPECT_TRUE(r->errors.empty());
}

TEST(Demultiplexer, NoStreams) {
  asio::io_context io;
  auto muxed = multiplex(io, {});
  auto r = std::make_shared<DemuxResult>();
  demultiplex(io, muxed, DemuxConfig{}, capture(r));
  io.run();
  ASSERT_TRUE(r->ready_called);
  EXPECT_FALSE(r->ec);
  EXPECT_TRUE(r->info.streams.empty());
}

TEST(Demultiplexer, MetadataAndTimestampDelivered) {
  WireBuilder w({{1, "{\"id\":1,\"name\":\"imu\"}"}, {5, "[1,2]"}}, 1234.5f);
  w.control();
  auto r = run_buffer(w.bytes);
  ASSERT_FALSE(r->ec);
  EXPECT_FLOAT_EQ(1234.5f, r->info.initial_timestamp);
  ASSERT_EQ(2u, r->info.streams.size());
  EXPECT_EQ(1, r->info.streams[0].stream_id);
  EXPECT_EQ("imu", r->info.streams[0].metadata["name"].asString());
  EXPECT_EQ(5, r->info.streams[1].stream_id);
  ASSERT_TRUE(r->info.streams[1].metadata.isArray());
  EXPECT_EQ(2u, r->info.streams[1].metadata.size());
}

TEST(Demultiplexer, HeaderChecksumCatchesEveryBitFlip) {
  WireBuilder w(two_streams());
  w.data(1, 0, {1, 2, 3}).control();
  size_t header_len = encode_header(1000.0f, two_streams()).size();

  for (size_t i = kHeaderPrefixSize; i < header_len; i++) {
    for (int bit = 0; bit < 8; bit++) {
      auto wire = w.bytes;
      wire[i] ^= (uint8_t)(1u << bit);
      auto r = run_buffer(wire);
      ASSERT_TRUE(r->ready_called);
      EXPECT_EQ(1, r->ready_calls);
      EXPECT_EQ(make_error_code(errc::header_checksum), r->ec)
          << "byte " << i << " bit " << bit;
      EXPECT_TRUE(r->streams.empty());
    }
  }
}

TEST(Demultiplexer, ChunkChecksumFailureReachesEveryStream) {
  WireBuilder w(two_streams());
  w.data(1, 0, make_bytes(20, 1)).data(2, 3, make_bytes(20, 2)).control(1);
  size_t header_len = encode_header(1000.0f, two_streams()).size();
  w.bytes[header_len + kDataFrameOverhead + 5] ^= 0x40;

  auto r = run_buffer(w.bytes);
  ASSERT_FALSE(r->ec);
  ASSERT_EQ(2u, r->streams.size());
  for (uint8_t id : {1, 2}) {
    ASSERT_EQ(1u, r->errors[id].size()) << "stream " << (int)id;
    EXPECT_EQ(make_error_code(errc::chunk_checksum), r->errors[id][0]);
    EXPECT_TRUE(r->streams[id]->ended);
  }
}

TEST(Demultiplexer, CorruptOffsetIsAlsoCaught) {
  WireBuilder w(two_streams());
  w.data(2, 100, {9, 9}).control();
  size_t header_len = encode_header(1000.0f, two_streams()).size();
  w.bytes[header_len + 1] ^= 0x01;

  auto r = run_buffer(w.bytes);
  ASSERT_EQ(1u, r->errors[2].size());
  EXPECT_EQ(make_error_code(errc::chunk_checksum), r->errors[2][0]);
}

TEST(Demultiplexer, ChecksumChainsAcrossCheckpoints) {
  WireBuilder w(two_streams());
  for (int i = 0; i < 10; i++)
    w.data(1 + i % 2, (uint16_t)i, make_bytes(30 + i, (uint8_t)i)).control();
  auto r = run_buffer(w.bytes);
  EXPECT_TRUE(r->errors.empty());
  EXPECT_EQ(5u * 30 + 0 + 2 + 4 + 6 + 8, r->streams[1]->bytes.size());
  EXPECT_TRUE(r->streams[2]->ended);
}

TEST(Demultiplexer, ChecksumRestartedAtCheckpointIsRejected) {
  auto f1 = encode_data_frames(1, 0, std::vector<uint8_t>{1, 2, 3}.data(), 3);
  auto f2 = encode_data_frames(2, 0, std::vector<uint8_t>{4, 5}.data(), 2);
  auto wire = encode_header(1.0f, two_streams());
  append(wire, f1);
  append(wire, encode_control_frame(0, crc16(f1.data(), f1.size())));
  append(wire, f2);
  // checksum of the second window alone, as if the accumulator had restarted
  append(wire, encode_control_frame(0, crc16(f2.data(), f2.size())));

  auto r = run_buffer(wire);
  ASSERT_FALSE(r->ec);
  EXPECT_EQ((std::vector<uint8_t>{1, 2, 3}), r->streams[1]->bytes);
  ASSERT_EQ(1u, r->errors[2].size());
  EXPECT_EQ(make_error_code(errc::chunk_checksum), r->errors[2][0]);
}

TEST(Demultiplexer, ByteAtATimeArrival) {
  WireBuilder w(two_streams());
  auto a = make_bytes(300, 4);
  auto b = make_bytes(40, 5);
  w.data(1, 0, a).data(2, 10, b).control();

  asio::io_context io;
  auto input = std::make_shared<ByteStream>();
  auto r = std::make_shared<DemuxResult>();
  demultiplex(io, input, DemuxConfig{}, capture(r));
  // each byte lands in its own turn, after the parse the previous one queued
  const auto &wire = w.bytes;
  std::function<void(size_t)> feed = [&](size_t i) {
    if (i == wire.size()) {
      input->end();
      return;
    }
    input->write(std::vector<uint8_t>{wire[i]});
    asio::post(io, [&feed, i]() { feed(i + 1); });
  };
  asio::post(io, [&feed]() { feed(0); });
  io.run();

  ASSERT_FALSE(r->ec);
  EXPECT_EQ(a, r->streams[1]->bytes);
  EXPECT_EQ(b, r->streams[2]->bytes);
  EXPECT_TRUE(r->streams[1]->ended);
  EXPECT_TRUE(r->errors.empty());
}

TEST(Demultiplexer, EmptyOrTruncatedHeader) {
  auto r = run_buffer({});
  EXPECT_EQ(make_error_code(errc::header_decode), r->ec);
  EXPECT_EQ(1, r->ready_calls);

  auto header = encode_header(1.0f, two_streams());
  header.pop_back();
  r = run_buffer(header);
  EXPECT_EQ(make_error_code(errc::header_decode), r->ec);

  auto bad_version = encode_header(1.0f, two_streams());
  bad_version[0] = 9;
  r = run_buffer(bad_version);
  EXPECT_EQ(make_error_code(errc::header_decode), r->ec);
}

TEST(Demultiplexer, MalformedHeaderBodyWithValidChecksum) {
  // stream id 0 is reserved for control frames
  WireBuilder w({{0, "{}"}});
  auto r = run_buffer(w.bytes);
  EXPECT_EQ(make_error_code(errc::header_decode), r->ec);
}

TEST(Demultiplexer, MetadataThatIsNotJson) {
  WireBuilder w({{1, "{\"id\":1}"}, {2, "{\"id\":"}});
  w.control();
  auto r = run_buffer(w.bytes);
  EXPECT_EQ(make_error_code(errc::metadata_decode), r->ec);
  EXPECT_TRUE(r->streams.empty());
}

TEST(Demultiplexer, UndeclaredStreamEndsSession) {
  WireBuilder w(two_streams());
  w.data(1, 0, {1, 2}).data(9, 0, {3}).data(2, 0, {4}).control();
  auto r = run_buffer(w.bytes);
  ASSERT_FALSE(r->ec);
  for (uint8_t id : {1, 2}) {
    ASSERT_EQ(1u, r->errors[id].size());
    EXPECT_EQ(make_error_code(errc::unknown_stream), r->errors[id][0]);
    EXPECT_TRUE(r->streams[id]->ended);
  }
  EXPECT_TRUE(r->streams[2]->bytes.empty());
}

TEST(Demultiplexer, TrailingPartialFrameIsDropped) {
  WireBuilder w(two_streams());
  auto a = make_bytes(50, 6);
  w.data(1, 0, a).control();
  auto partial = encode_data_frames(2, 0, a.data(), a.size());
  w.bytes.insert(w.bytes.end(), partial.begin(), partial.begin() + 10);

  auto r = run_buffer(w.bytes);
  ASSERT_FALSE(r->ec);
  EXPECT_EQ(a, r->streams[1]->bytes);
  EXPECT_TRUE(r->streams[2]->bytes.empty());
  EXPECT_TRUE(r->streams[1]->ended);
  EXPECT_TRUE(r->streams[2]->ended);
  EXPECT_TRUE(r->errors.empty());
}

TEST(Demultiplexer, DeliversInWireOrderAcrossStreams) {
  WireBuilder w({{1, "{}"}, {2, "{}"}, {3, "{}"}});
  w.data(2, 0, {20}).data(1, 0, {10}).data(2, 0, {21}).data(3, 0, {30}).control();

  asio::io_context io;
  auto log = std::make_shared<std::vector<Delivery>>();
  demultiplex_buffer(io, w.bytes, DemuxConfig{}, record_order(log));
  io.run();

  ASSERT_EQ(4u, log->size());
  std::vector<uint8_t> order;
  for (const auto &d : *log)
    order.push_back(d.payload.at(0));
  EXPECT_EQ((std::vector<uint8_t>{20, 10, 21, 30}), order);
}

TEST(Demultiplexer, RealtimePlaybackHonoursOffsets) {
  WireBuilder w(two_streams());
  w.data(1, 0, {1}).data(1, 500, {2}).data(2, 0, {3}).control();

  asio::io_context io;
  auto log = std::make_shared<std::vector<Delivery>>();
  DemuxConfig cfg;
  cfg.realtime_playback = true;
  demultiplex_buffer(io, w.bytes, cfg, record_order(log));
  io.run();

  ASSERT_EQ(3u, log->size());
  EXPECT_GE((*log)[1].at - (*log)[0].at, milliseconds(450));
  EXPECT_LT((*log)[2].at - (*log)[1].at, milliseconds(250));
}

TEST(Demultiplexer, RealtimeCadenceDoesNotDriftAfterLateDelivery) {
  WireBuilder w(two_streams());
  w.data(1, 0, {1}).data(1, 300, {2}).data(1, 300, {3}).control();

  asio::io_context io;
  asio::steady_timer blocker(io);
  auto log = std::make_shared<std::vector<Delivery>>();
  DemuxConfig cfg;
  cfg.realtime_playback = true;
  demultiplex_buffer(io, w.bytes, cfg, [&](std::error_code ec, SessionInfo info) {
    ASSERT_FALSE(ec);
    info.streams[0].stream->on_data([&](const std::vector<uint8_t> &d) {
      log->push_back(Delivery{1, d, std::chrono::steady_clock::now()});
      if (log->size() != 1)
        return;
      // hold the loop across the second frame's due time so it fires ~100ms late
      blocker.expires_after(milliseconds(250));
      blocker.async_wait([](std::error_code) { std::this_thread::sleep_for(milliseconds(150)); });
    });
  });
  io.run();

  ASSERT_EQ(3u, log->size());
  EXPECT_GE((*log)[1].at - (*log)[0].at, milliseconds(380));
  // third frame stays on the recorded schedule: 600ms, not 700ms
  EXPECT_GE((*log)[2].at - (*log)[0].at, milliseconds(590));
  EXPECT_LT((*log)[2].at - (*log)[0].at, milliseconds(660));
}

TEST(Demultiplexer, WithoutRealtimeFramesArriveBackToBack) {
  WireBuilder w(two_streams());
  w.data(1, 0, {1}).data(1, 5000, {2}).control();

  asio::io_context io;
  auto log = std::make_shared<std::vector<Delivery>>();
  auto begin = std::chrono::steady_clock::now();
  demultiplex_buffer(io, w.bytes, DemuxConfig{}, record_order(log));
  io.run();

  ASSERT_EQ(2u, log->size());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, milliseconds(1000));
}

TEST(Demultiplexer, StopBeforeHeaderAborts) {
  asio::io_context io;
  auto input = std::make_shared<ByteStream>();
  auto r = std::make_shared<DemuxResult>();
  auto d = demultiplex(io, input, DemuxConfig{}, capture(r));
  input->write({kVersion, 40});
  d->stop();
  d->stop();
  EXPECT_TRUE(input->write({0, 0, 0}));
  io.run();

  EXPECT_EQ(1, r->ready_calls);
  EXPECT_EQ(std::error_code(asio::error::operation_aborted), r->ec);
  EXPECT_FALSE(d->header_parsed());
}

TEST(Demultiplexer, InputEndAfterFailureIsNoOp) {
  asio::io_context io;
  auto input = std::make_shared<ByteStream>();
  auto r = std::make_shared<DemuxResult>();
  demultiplex(io, input, DemuxConfig{}, capture(r));
  input->write({2, 0, 0, 0, 0, 0});
  io.run();
  EXPECT_EQ(make_error_code(errc::header_decode), r->ec);
  EXPECT_TRUE(input->ended());

  input->end();
  io.restart();
  io.run();
  EXPECT_EQ(1, r->ready_calls);
}
