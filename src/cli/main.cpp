#include "audio/audio_buffer.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "realtime_task.hpp"
#include "strategy/transcription_strategy.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <audio.pcm>", prog);
    std::println(stderr, "Input is raw mono 16 kHz signed 16-bit little-endian PCM.");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -r, --realtime      Stream through the primary provider's realtime socket");
    std::println(stderr, "  --chunk-ms N        Realtime chunk length in ms (default 100)");
    std::println(stderr, "  --no-pace           Send realtime chunks as fast as possible");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -h, --help          Show this help");
}

static bool read_pcm(const std::string& path, std::vector<int16_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;
    std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    out.resize(raw.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        auto lo = static_cast<uint8_t>(raw[2 * i]);
        auto hi = static_cast<uint8_t>(raw[2 * i + 1]);
        out[i] = static_cast<int16_t>(lo | (hi << 8));
    }
    return true;
}

static json result_json(const TranscriptionResult& r) {
    return {
        {"status", "ok"},
        {"text", r.text},
        {"engine", r.engine_name},
        {"used_fallback", r.used_fallback},
        {"elapsed_ms", r.elapsed.count()},
    };
}

static json error_json(const AsrError& e) {
    json j = {
        {"status", "error"},
        {"kind", std::string(to_string(e.kind))},
        {"message", e.to_string()},
    };
    if (!e.provider.empty()) j["provider"] = e.provider;
    return j;
}

static int run_oneshot(const AsrConfig& config, const std::vector<int16_t>& pcm_samples) {
    auto strategy = make_strategy(config);
    if (!strategy) {
        std::println("{}", error_json(strategy.error()).dump(2));
        return 1;
    }

    auto audio = AudioBuffer::from_pcm16(pcm_samples, 16000);
    logging::info("transcribing {}ms of audio ({} strategy)", audio.duration_ms(),
                  to_string((*strategy)->kind()));

    auto result = (*strategy)->transcribe(audio);
    if (!result) {
        std::println("{}", error_json(result.error()).dump(2));
        return 1;
    }
    std::println("{}", result_json(*result).dump(2));
    return 0;
}

static int run_streaming(AsrConfig config, const std::vector<int16_t>& pcm_samples,
                         uint32_t chunk_ms, bool pace) {
    config.primary.mode = AsrMode::Realtime;

    auto chunks = std::make_shared<ChunkChannel>();
    auto started = start_realtime(config.primary, chunks, [](const std::string& text) {
        std::println(stderr, "partial: {}", text);
    });

    size_t chunk_samples = std::max<size_t>(1, size_t{16} * chunk_ms);
    for (size_t off = 0; off < pcm_samples.size(); off += chunk_samples) {
        if (started.handle.finished()) break;
        auto end = std::min(pcm_samples.size(), off + chunk_samples);
        AudioChunk chunk{std::vector<int16_t>(pcm_samples.begin() + off, pcm_samples.begin() + end)};
        if (!chunks->push(std::move(chunk))) break;
        if (pace) std::this_thread::sleep_for(std::chrono::milliseconds(chunk_ms));
    }
    chunks->close();

    auto result = started.handle.wait();
    if (!result) {
        auto j = error_json(result.error().error);
        j["engine"] = result.error().engine_name;
        j["chunks_sent"] = result.error().chunks_sent;
        j["samples_sent"] = result.error().samples_sent;
        std::println("{}", j.dump(2));
        return 1;
    }
    std::println("{}", result_json(*result).dump(2));
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool realtime = false;
    bool pace = true;
    uint32_t chunk_ms = 100;
    std::string config_path;
    std::string input_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--realtime" || arg == "-r") {
            realtime = true;
        } else if (arg == "--no-pace") {
            pace = false;
        } else if (arg == "--chunk-ms" && i + 1 < argc) {
            chunk_ms = static_cast<uint32_t>(std::atoi(argv[++i]));
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.starts_with("-")) {
            input_path = arg;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (input_path.empty()) {
        usage(argv[0]);
        return 1;
    }
    if (chunk_ms == 0) chunk_ms = 100;

    logging::set_verbose(verbose);

    AsrConfig config;
    if (!config_path.empty()) {
        config = AsrConfig::load(config_path);
    } else {
        config = AsrConfig::load_default();
    }

    std::vector<int16_t> samples;
    if (!read_pcm(input_path, samples)) {
        std::println(stderr, "Failed to read {}", input_path);
        return 1;
    }

    if (realtime) return run_streaming(std::move(config), samples, chunk_ms, pace);
    return run_oneshot(config, samples);
}
