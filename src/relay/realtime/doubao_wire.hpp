#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Binary framing of the Volcengine streaming ASR socket:
//
//   byte 0   version(4) | header size in 4-byte words(4)
//   byte 1   message type(4) | flags(4)
//   byte 2   serialization(4) | compression(4)
//   byte 3   reserved
//   [int32 BE sequence]      present when flags bit 0 is set
//   uint32 BE payload size
//   payload                  gzip when compression == 1
//
// Server error frames (type 0xf) carry a uint32 error code right after the
// header instead of a sequence.
namespace doubao_wire {

constexpr uint8_t kProtocolVersion = 0x1;
constexpr uint8_t kHeaderWords = 0x1;

enum class MessageType : uint8_t {
    FullClientRequest = 0x1,
    AudioOnlyRequest = 0x2,
    FullServerResponse = 0x9,
    ServerAck = 0xb,
    ServerError = 0xf,
};

namespace flags {
constexpr uint8_t kNone = 0x0;
constexpr uint8_t kSequence = 0x1;
constexpr uint8_t kLast = 0x2;
// Sequence present and this is the final frame (negated sequence).
constexpr uint8_t kLastWithSequence = kSequence | kLast;
} // namespace flags

enum class Serialization : uint8_t { None = 0x0, Json = 0x1 };
enum class Compression : uint8_t { None = 0x0, Gzip = 0x1 };

struct Frame {
    MessageType type = MessageType::FullServerResponse;
    uint8_t flags = flags::kNone;
    Serialization serialization = Serialization::None;
    Compression compression = Compression::None;
    std::optional<int32_t> sequence;
    // Decompressed payload.
    std::vector<uint8_t> payload;
    // ServerError frames only.
    uint32_t error_code = 0;
    std::string error_message;

    bool is_last() const { return (flags & flags::kLast) != 0; }
};

std::expected<std::vector<uint8_t>, AsrError>
    encode_frame(MessageType type, uint8_t flags, int32_t sequence,
                 std::span<const uint8_t> payload, Compression compression);

// Full client request: gzip'd JSON configuration, sequence 1.
std::expected<std::vector<uint8_t>, AsrError>
    encode_config_request(const std::string& config_json, int32_t sequence = 1);

// Audio-only request. The final frame negates the sequence.
std::vector<uint8_t> encode_audio(std::span<const uint8_t> pcm, int32_t sequence, bool last);

std::expected<Frame, AsrError> decode_frame(std::span<const uint8_t> data);

struct Response {
    std::string text;
    bool is_final = false;
    std::optional<int32_t> sequence;
};

// Reads `result.text` and the final flag from a decoded non-error frame.
std::expected<Response, AsrError> read_response(const Frame& frame);

// decode_frame() plus the JSON `result.text` lookup. Server error frames come
// back as a WireProtocol error.
std::expected<Response, AsrError> parse_response(std::span<const uint8_t> data);

// JSON body of the full client request (PCM, 16 kHz, 16-bit, mono).
std::string default_config_json(const std::string& uid);

} // namespace doubao_wire
