
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace streammux {

constexpr uint8_t  kVersion = 1;
constexpr size_t   kMaxStreams = 254;
constexpr size_t   kMaxChunkPayload = 255;
constexpr size_t   kControlFrameSize = 5;
constexpr size_t   kDataFrameOverhead = 4;
constexpr uint8_t  kControlStreamId = 0;

// version(1) + header_length(4) ... checksum(2)
constexpr size_t   kHeaderPrefixSize = 5;
constexpr size_t   kHeaderChecksumSize = 2;
// prefix + stream_count(1) + initial_timestamp(4) + checksum
constexpr size_t   kMinHeaderLength = kHeaderPrefixSize + 1 + 4 + kHeaderChecksumSize;
constexpr uint32_t kMaxHeaderLength = 16u * 1024u * 1024u;

struct StreamMeta {
    uint8_t stream_id{};
    std::string metadata_json;
};

struct Header {
    uint8_t  version{kVersion};
    uint32_t header_length{};
    float    initial_timestamp{};
    std::vector<StreamMeta> streams;
    uint16_t checksum{};
};

struct DataFrame {
    uint8_t  stream_id{};
    uint16_t offset_ms{};
    std::vector<uint8_t> payload;
};

struct ControlFrame {
    uint16_t offset_ms{};
    uint16_t checksum{};
};

using Frame = std::variant<ControlFrame, DataFrame>;

enum class DecodeStatus { Ok, NeedMoreData, Malformed };

// CRC-16/XMODEM. Pass a previous result as seed to continue a running checksum.
uint16_t crc16(const uint8_t* data, size_t len, uint16_t seed = 0);

std::vector<uint8_t> encode_header(float initial_timestamp,
                                   const std::vector<StreamMeta>& streams);
// Checks version and length and that the whole header is buffered, without
// looking inside the body. checksum is the stored trailing field.
DecodeStatus peek_header(const uint8_t* data, size_t len, uint32_t& header_length,
                         uint16_t& checksum);
DecodeStatus decode_header(const uint8_t* data, size_t len, Header& out, size_t& consumed);
// Checksum over the body of an encoded header, i.e. [kHeaderPrefixSize, header_length - 2).
uint16_t header_body_checksum(const uint8_t* data, uint32_t header_length);

// A payload over kMaxChunkPayload bytes becomes a head frame carrying offset_ms
// followed by continuation frames of exactly kMaxChunkPayload bytes with offset 0.
std::vector<uint8_t> encode_data_frames(uint8_t stream_id, uint16_t offset_ms,
                                        const uint8_t* data, size_t len);
std::vector<uint8_t> encode_control_frame(uint16_t offset_ms, uint16_t checksum);
DecodeStatus decode_frame(const uint8_t* data, size_t len, Frame& out, size_t& consumed);

size_t encoded_size(const Frame& f);

} // namespace streammux
