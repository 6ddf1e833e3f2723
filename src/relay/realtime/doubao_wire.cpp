#include "doubao_wire.hpp"

#include "../gzip.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace doubao_wire {

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

uint32_t get_u32(std::span<const uint8_t> data, size_t offset) {
    return (uint32_t(data[offset]) << 24) | (uint32_t(data[offset + 1]) << 16) |
           (uint32_t(data[offset + 2]) << 8) | uint32_t(data[offset + 3]);
}

std::vector<uint8_t> assemble(MessageType type, uint8_t flag_bits, int32_t sequence,
                              std::span<const uint8_t> body, Compression compression) {
    auto serialization = type == MessageType::FullClientRequest ? Serialization::Json
                                                                : Serialization::None;
    std::vector<uint8_t> out;
    out.reserve(12 + body.size());
    out.push_back(static_cast<uint8_t>((kProtocolVersion << 4) | kHeaderWords));
    out.push_back(static_cast<uint8_t>((static_cast<uint8_t>(type) << 4) | (flag_bits & 0x0f)));
    out.push_back(static_cast<uint8_t>((static_cast<uint8_t>(serialization) << 4) |
                                       static_cast<uint8_t>(compression)));
    out.push_back(0x00);
    if (flag_bits & flags::kSequence) {
        put_u32(out, static_cast<uint32_t>(sequence));
    }
    put_u32(out, static_cast<uint32_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

} // namespace

std::expected<std::vector<uint8_t>, AsrError>
encode_frame(MessageType type, uint8_t flag_bits, int32_t sequence,
             std::span<const uint8_t> payload, Compression compression) {
    if (compression == Compression::Gzip) {
        auto packed = gzip::compress(payload);
        if (!packed) {
            return std::unexpected(AsrError::internal("gzip compression failed: " + packed.error()));
        }
        return assemble(type, flag_bits, sequence, *packed, compression);
    }
    return assemble(type, flag_bits, sequence, payload, compression);
}

std::expected<std::vector<uint8_t>, AsrError>
encode_config_request(const std::string& config_json, int32_t sequence) {
    std::span<const uint8_t> payload(reinterpret_cast<const uint8_t*>(config_json.data()),
                                     config_json.size());
    return encode_frame(MessageType::FullClientRequest, flags::kSequence, sequence, payload,
                        Compression::Gzip);
}

std::vector<uint8_t> encode_audio(std::span<const uint8_t> pcm, int32_t sequence, bool last) {
    if (last) {
        return assemble(MessageType::AudioOnlyRequest, flags::kLastWithSequence, -sequence, pcm,
                        Compression::None);
    }
    return assemble(MessageType::AudioOnlyRequest, flags::kSequence, sequence, pcm,
                    Compression::None);
}

std::expected<Frame, AsrError> decode_frame(std::span<const uint8_t> data) {
    if (data.size() < 4) {
        return std::unexpected(AsrError::wire(std::format("frame too short: {} bytes", data.size())));
    }

    size_t header_size = static_cast<size_t>(data[0] & 0x0f) * 4;
    if (header_size < 4 || data.size() < header_size) {
        return std::unexpected(AsrError::wire(std::format("bad header size {}", header_size)));
    }

    Frame frame;
    frame.type = static_cast<MessageType>(data[1] >> 4);
    frame.flags = data[1] & 0x0f;
    frame.serialization = static_cast<Serialization>(data[2] >> 4);
    frame.compression = static_cast<Compression>(data[2] & 0x0f);

    size_t offset = header_size;

    if (frame.type == MessageType::ServerError) {
        if (data.size() >= offset + 4) {
            frame.error_code = get_u32(data, offset);
            offset += 4;
        }
        if (data.size() >= offset + 4) {
            size_t msg_size = get_u32(data, offset);
            offset += 4;
            if (data.size() >= offset + msg_size) {
                frame.error_message.assign(reinterpret_cast<const char*>(data.data() + offset),
                                           msg_size);
            }
        }
        return frame;
    }

    if (frame.flags & flags::kSequence) {
        if (data.size() < offset + 4) {
            return std::unexpected(AsrError::wire("frame too short for sequence"));
        }
        frame.sequence = static_cast<int32_t>(get_u32(data, offset));
        offset += 4;
    }

    if (data.size() < offset + 4) {
        return std::unexpected(AsrError::wire("frame too short for payload size"));
    }
    size_t payload_size = get_u32(data, offset);
    offset += 4;

    if (data.size() < offset + payload_size) {
        return std::unexpected(AsrError::wire(std::format(
            "incomplete frame: need {} bytes, have {}", offset + payload_size, data.size())));
    }

    auto payload = data.subspan(offset, payload_size);
    if (frame.compression == Compression::Gzip) {
        auto unpacked = gzip::decompress(payload);
        if (!unpacked) {
            return std::unexpected(AsrError::wire(unpacked.error()));
        }
        frame.payload = std::move(*unpacked);
    } else {
        frame.payload.assign(payload.begin(), payload.end());
    }

    return frame;
}

std::expected<Response, AsrError> parse_response(std::span<const uint8_t> data) {
    auto frame = decode_frame(data);
    if (!frame) return std::unexpected(frame.error());

    if (frame->type == MessageType::ServerError) {
        auto msg = std::format("server error code={}", frame->error_code);
        if (!frame->error_message.empty()) msg += ": " + frame->error_message;
        return std::unexpected(AsrError::wire(msg));
    }

    return read_response(*frame);
}

std::expected<Response, AsrError> read_response(const Frame& frame) {
    Response resp{.is_final = frame.is_last(), .sequence = frame.sequence};
    if (frame.payload.empty()) return resp;

    try {
        auto j = json::parse(frame.payload.begin(), frame.payload.end());
        if (j.contains("result") && j["result"].is_object()) {
            resp.text = j["result"].value("text", "");
        }
    } catch (const json::exception& e) {
        return std::unexpected(AsrError::internal(std::string("response JSON parse error: ") +
                                                  e.what()));
    }
    return resp;
}

std::string default_config_json(const std::string& uid) {
    json config = {
        {"user", {{"uid", uid}}},
        {"audio", {{"format", "pcm"}, {"rate", 16000}, {"bits", 16}, {"channel", 1}}},
        {"request", {{"model_name", "bigmodel"}, {"enable_itn", true}, {"enable_punc", true}}},
    };
    return config.dump();
}

} // namespace doubao_wire
