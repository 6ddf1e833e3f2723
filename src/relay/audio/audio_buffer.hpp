#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

// Finished capture: normalized float samples in [-1, 1].
class AudioBuffer {
public:
    AudioBuffer() = default;
    AudioBuffer(std::vector<float> samples, uint32_t sample_rate, uint16_t channels = 1)
        : samples_(std::move(samples)), sample_rate_(sample_rate), channels_(channels) {}

    static AudioBuffer from_pcm16(std::span<const int16_t> pcm, uint32_t sample_rate,
                                  uint16_t channels = 1) {
        std::vector<float> samples(pcm.size());
        std::transform(pcm.begin(), pcm.end(), samples.begin(),
                       [](int16_t s) { return static_cast<float>(s) / 32768.0f; });
        return AudioBuffer(std::move(samples), sample_rate, channels);
    }

    const std::vector<float>& samples() const { return samples_; }
    uint32_t sample_rate() const { return sample_rate_; }
    uint16_t channels() const { return channels_; }
    bool empty() const { return samples_.empty(); }

    uint64_t duration_ms() const {
        if (sample_rate_ == 0 || channels_ == 0) return 0;
        return static_cast<uint64_t>(samples_.size()) * 1000 /
               (static_cast<uint64_t>(sample_rate_) * channels_);
    }

    std::vector<int16_t> to_pcm16() const {
        std::vector<int16_t> out(samples_.size());
        std::transform(samples_.begin(), samples_.end(), out.begin(), [](float s) {
            float scaled = std::clamp(s, -1.0f, 1.0f) * 32767.0f;
            return static_cast<int16_t>(scaled);
        });
        return out;
    }

private:
    std::vector<float> samples_;
    uint32_t sample_rate_ = 16000;
    uint16_t channels_ = 1;
};

// One capture tick of mono 16 kHz PCM16.
struct AudioChunk {
    std::vector<int16_t> samples;
};

namespace pcm {

// Little-endian byte packing, the layout both streaming providers expect.
inline std::vector<uint8_t> to_bytes(std::span<const int16_t> samples) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (int16_t s : samples) {
        auto u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xff));
        bytes.push_back(static_cast<uint8_t>(u >> 8));
    }
    return bytes;
}

} // namespace pcm
