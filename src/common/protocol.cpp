
#include "protocol.hpp"
#include <array>
#include <cstring>
#include <set>

namespace streammux {

static std::array<uint16_t, 256> make_crc16_table() {
  std::array<uint16_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i << 8;
    for (int j = 0; j < 8; j++)
      c = (c & 0x8000) ? ((c << 1) ^ 0x1021u) : (c << 1);
    table[i] = (uint16_t)(c & 0xFFFF);
  }
  return table;
}

uint16_t crc16(const uint8_t *data, size_t len, uint16_t seed) {
  static const std::array<uint16_t, 256> table = make_crc16_table();
  uint16_t c = seed;
  for (size_t i = 0; i < len; i++)
    c = (uint16_t)((c << 8) ^ table[((c >> 8) ^ data[i]) & 0xFF]);
  return c;
}

static void put_u16le(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back((uint8_t)(v & 0xFF));
  out.push_back((uint8_t)(v >> 8));
}

static void put_u32le(std::vector<uint8_t> &out, uint32_t v) {
  for (int i = 0; i < 4; i++)
    out.push_back((uint8_t)((v >> (8 * i)) & 0xFF));
}

static uint16_t get_u16le(const uint8_t *p) {
  return (uint16_t)(p[0] | (p[1] << 8));
}

static uint32_t get_u32le(const uint8_t *p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
         ((uint32_t)p[3] << 24);
}

std::vector<uint8_t> encode_header(float initial_timestamp,
                                   const std::vector<StreamMeta> &streams) {
  std::vector<uint8_t> body;
  body.push_back((uint8_t)streams.size());
  uint32_t ts_bits;
  std::memcpy(&ts_bits, &initial_timestamp, sizeof(ts_bits));
  put_u32le(body, ts_bits);
  for (const auto &sm : streams) {
    body.push_back(sm.stream_id);
    put_u32le(body, (uint32_t)sm.metadata_json.size());
    body.insert(body.end(), sm.metadata_json.begin(), sm.metadata_json.end());
  }

  uint32_t header_len =
      (uint32_t)(kHeaderPrefixSize + body.size() + kHeaderChecksumSize);
  std::vector<uint8_t> out;
  out.reserve(header_len);
  out.push_back(kVersion);
  put_u32le(out, header_len);
  out.insert(out.end(), body.begin(), body.end());
  put_u16le(out, crc16(body.data(), body.size()));
  return out;
}

DecodeStatus peek_header(const uint8_t *data, size_t len,
                         uint32_t &header_length, uint16_t &checksum) {
  if (len < kHeaderPrefixSize)
    return DecodeStatus::NeedMoreData;
  if (data[0] != kVersion)
    return DecodeStatus::Malformed;
  uint32_t header_len = get_u32le(data + 1);
  if (header_len < kMinHeaderLength || header_len > kMaxHeaderLength)
    return DecodeStatus::Malformed;
  if (len < header_len)
    return DecodeStatus::NeedMoreData;
  header_length = header_len;
  checksum = get_u16le(data + header_len - kHeaderChecksumSize);
  return DecodeStatus::Ok;
}

DecodeStatus decode_header(const uint8_t *data, size_t len, Header &out,
                           size_t &consumed) {
  consumed = 0;
  uint32_t header_len = 0;
  uint16_t checksum = 0;
  DecodeStatus st = peek_header(data, len, header_len, checksum);
  if (st != DecodeStatus::Ok)
    return st;

  const size_t body_end = header_len - kHeaderChecksumSize;
  size_t pos = kHeaderPrefixSize;
  Header h;
  h.version = data[0];
  h.header_length = header_len;
  size_t stream_count = data[pos++];
  if (stream_count > kMaxStreams)
    return DecodeStatus::Malformed;
  uint32_t ts_bits = get_u32le(data + pos);
  std::memcpy(&h.initial_timestamp, &ts_bits, sizeof(ts_bits));
  pos += 4;

  std::set<uint8_t> seen;
  h.streams.reserve(stream_count);
  for (size_t i = 0; i < stream_count; i++) {
    if (body_end - pos < 5)
      return DecodeStatus::Malformed;
    StreamMeta sm;
    sm.stream_id = data[pos];
    uint32_t meta_len = get_u32le(data + pos + 1);
    pos += 5;
    if (sm.stream_id == kControlStreamId || !seen.insert(sm.stream_id).second)
      return DecodeStatus::Malformed;
    if (meta_len > body_end - pos)
      return DecodeStatus::Malformed;
    sm.metadata_json.assign((const char *)data + pos, meta_len);
    pos += meta_len;
    h.streams.push_back(std::move(sm));
  }
  if (pos != body_end)
    return DecodeStatus::Malformed;

  h.checksum = checksum;
  out = std::move(h);
  consumed = header_len;
  return DecodeStatus::Ok;
}

uint16_t header_body_checksum(const uint8_t *data, uint32_t header_length) {
  return crc16(data + kHeaderPrefixSize,
               header_length - kHeaderPrefixSize - kHeaderChecksumSize);
}

static void append_data_frame(std::vector<uint8_t> &out, uint8_t stream_id,
                              uint16_t offset_ms, const uint8_t *data,
                              size_t len) {
  out.push_back(stream_id);
  put_u16le(out, offset_ms);
  out.push_back((uint8_t)len);
  out.insert(out.end(), data, data + len);
}

std::vector<uint8_t> encode_data_frames(uint8_t stream_id, uint16_t offset_ms,
                                        const uint8_t *data, size_t len) {
  // Continuation frames are cut from the tail, so the head keeps the remainder.
  size_t head = len;
  while (head > kMaxChunkPayload)
    head -= kMaxChunkPayload;
  size_t continuations = (len - head) / kMaxChunkPayload;

  std::vector<uint8_t> out;
  out.reserve(len + kDataFrameOverhead * (continuations + 1));
  append_data_frame(out, stream_id, offset_ms, data, head);
  for (size_t off = head; off < len; off += kMaxChunkPayload)
    append_data_frame(out, stream_id, 0, data + off, kMaxChunkPayload);
  return out;
}

std::vector<uint8_t> encode_control_frame(uint16_t offset_ms,
                                          uint16_t checksum) {
  std::vector<uint8_t> out;
  out.reserve(kControlFrameSize);
  out.push_back(kControlStreamId);
  put_u16le(out, offset_ms);
  put_u16le(out, checksum);
  return out;
}

DecodeStatus decode_frame(const uint8_t *data, size_t len, Frame &out,
                          size_t &consumed) {
  consumed = 0;
  if (len < 1)
    return DecodeStatus::NeedMoreData;
  if (data[0] == kControlStreamId) {
    if (len < kControlFrameSize)
      return DecodeStatus::NeedMoreData;
    ControlFrame cf;
    cf.offset_ms = get_u16le(data + 1);
    cf.checksum = get_u16le(data + 3);
    out = cf;
    consumed = kControlFrameSize;
    return DecodeStatus::Ok;
  }
  if (len < kDataFrameOverhead)
    return DecodeStatus::NeedMoreData;
  size_t payload_len = data[3];
  if (len < kDataFrameOverhead + payload_len)
    return DecodeStatus::NeedMoreData;
  DataFrame df;
  df.stream_id = data[0];
  df.offset_ms = get_u16le(data + 1);
  df.payload.assign(data + kDataFrameOverhead,
                    data + kDataFrameOverhead + payload_len);
  out = std::move(df);
  consumed = kDataFrameOverhead + payload_len;
  return DecodeStatus::Ok;
}

size_t encoded_size(const Frame &f) {
  if (std::holds_alternative<ControlFrame>(f))
    return kControlFrameSize;
  return kDataFrameOverhead + std::get<DataFrame>(f).payload.size();
}

} // namespace streammux
