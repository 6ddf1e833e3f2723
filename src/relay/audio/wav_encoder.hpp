#pragma once

#include "audio_buffer.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

// In-memory RIFF/WAVE container for 16-bit PCM, the upload format of every
// HTTP provider. All header fields are written little-endian regardless of host.
namespace wav {

constexpr size_t kHeaderSize = 44;

namespace detail {

inline void put_tag(std::vector<uint8_t>& out, std::string_view tag) {
    out.insert(out.end(), tag.begin(), tag.end());
}

inline void put_le16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

inline void put_le32(std::vector<uint8_t>& out, uint32_t v) {
    put_le16(out, static_cast<uint16_t>(v & 0xffff));
    put_le16(out, static_cast<uint16_t>(v >> 16));
}

} // namespace detail

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t kBitsPerSample = 16;
    constexpr uint16_t kFormatPcm = 1;
    const uint16_t block_align = channels * (kBitsPerSample / 8);
    const auto data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + data_size);

    detail::put_tag(out, "RIFF");
    detail::put_le32(out, 36 + data_size);
    detail::put_tag(out, "WAVE");

    detail::put_tag(out, "fmt ");
    detail::put_le32(out, 16);
    detail::put_le16(out, kFormatPcm);
    detail::put_le16(out, channels);
    detail::put_le32(out, sample_rate);
    detail::put_le32(out, sample_rate * block_align);
    detail::put_le16(out, block_align);
    detail::put_le16(out, kBitsPerSample);

    detail::put_tag(out, "data");
    detail::put_le32(out, data_size);
    auto body = pcm::to_bytes(samples);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

inline std::vector<uint8_t> encode(const AudioBuffer& audio) {
    auto pcm16 = audio.to_pcm16();
    return encode(pcm16, audio.sample_rate(), audio.channels());
}

} // namespace wav
