#include <catch2/catch_test_macros.hpp>

#include "base64.hpp"
#include "base64_decode.hpp"
#include "realtime/qwen_wire.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using json = nlohmann::json;
using namespace qwen_wire;

namespace {

ServerEvent event(const json& j) {
    auto ev = parse_event(j.dump());
    REQUIRE(ev.has_value());
    return *ev;
}

} // namespace

TEST_CASE("Qwen realtime events", "[qwen][wire]") {

    SECTION("EventIdFormat") {
        auto id = make_event_id();
        REQUIRE(id.starts_with("event_"));
        REQUIRE(id.size() > 6);
        REQUIRE(id.find_first_not_of("0123456789", 6) == std::string::npos);
    }

    SECTION("SessionUpdate") {
        auto j = json::parse(session_update("zh", "event_1"));
        REQUIRE(j["type"] == "session.update");
        REQUIRE(j["event_id"] == "event_1");
        REQUIRE(j["session"]["modalities"] == json::array({"text"}));
        REQUIRE(j["session"]["input_audio_format"] == "pcm");
        REQUIRE(j["session"]["sample_rate"] == 16000);
        REQUIRE(j["session"]["input_audio_transcription"]["language"] == "zh");
        REQUIRE(j["session"]["turn_detection"].is_null());
    }

    SECTION("AudioAppendCarriesBase64") {
        std::vector<uint8_t> pcm = {0x01, 0x00, 0xff, 0x7f};
        auto j = json::parse(audio_append(pcm, "event_2"));
        REQUIRE(j["type"] == "input_audio_buffer.append");
        auto decoded = b64_check::decode(j["audio"].get<std::string>());
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == pcm);
    }

    SECTION("Commit") {
        auto j = json::parse(audio_commit("event_3"));
        REQUIRE(j["type"] == "input_audio_buffer.commit");
        REQUIRE(j["event_id"] == "event_3");
    }

    SECTION("ParseKinds") {
        REQUIRE(event({{"type", "session.created"}}).kind == EventKind::SessionCreated);
        REQUIRE(event({{"type", "session.updated"}}).kind == EventKind::SessionUpdated);
        REQUIRE(event({{"type", "input_audio_buffer.committed"}}).kind == EventKind::AudioCommitted);
        REQUIRE(event({{"type", "response.done"}}).kind == EventKind::ResponseDone);
        REQUIRE(event({{"type", "rate_limits.updated"}}).kind == EventKind::Other);

        auto err = event({{"type", "error"}, {"error", {{"message", "bad audio"}}}});
        REQUIRE(err.kind == EventKind::Error);
        REQUIRE(err.text == "bad audio");

        REQUIRE_FALSE(parse_event("{not json").has_value());
        REQUIRE_FALSE(parse_event("[1, 2]").has_value());
    }

    SECTION("DeltasAppend") {
        TranscriptAccumulator acc;
        auto u1 = acc.apply(event({{"type", "response.audio_transcript.delta"}, {"delta", "你好"}}));
        auto u2 = acc.apply(event({{"type", "response.audio_transcript.delta"}, {"delta", "世界"}}));
        REQUIRE(u1 == TranscriptAccumulator::Update::Partial);
        REQUIRE(u2 == TranscriptAccumulator::Update::Partial);
        REQUIRE(acc.text() == "你好世界");
        REQUIRE_FALSE(acc.resolved());
    }

    SECTION("CompletedReplaces") {
        TranscriptAccumulator acc;
        acc.apply(event({{"type", "response.audio_transcript.delta"}, {"delta", "draft"}}));
        acc.apply(event({{"type", "conversation.item.input_audio_transcription.completed"},
                         {"transcript", "final text"}}));
        REQUIRE(acc.text() == "final text");
        REQUIRE(acc.resolved());
    }

    SECTION("CompletedWithoutTranscriptDoesNotResolve") {
        TranscriptAccumulator acc;
        acc.apply(event({{"type", "conversation.item.input_audio_transcription.completed"}}));
        REQUIRE_FALSE(acc.completed());
        REQUIRE_FALSE(acc.resolved());
    }

    SECTION("ResponseDoneNeedsText") {
        TranscriptAccumulator acc;
        acc.apply(event({{"type", "response.done"}}));
        REQUIRE(acc.completed());
        REQUIRE_FALSE(acc.resolved());

        acc.apply(event({{"type", "response.audio_transcript.delta"}, {"delta", "late"}}));
        REQUIRE(acc.resolved());
        REQUIRE(acc.text() == "late");
    }

    SECTION("TranscriptDoneKeepsDeltasWhenEmpty") {
        TranscriptAccumulator acc;
        acc.apply(event({{"type", "response.audio_transcript.delta"}, {"delta", "abc"}}));
        acc.apply(event({{"type", "response.audio_transcript.done"}}));
        REQUIRE(acc.text() == "abc");
        REQUIRE(acc.resolved());
    }

    SECTION("ErrorFails") {
        TranscriptAccumulator acc;
        auto u = acc.apply(event({{"type", "error"}, {"error", {{"message", "quota"}}}}));
        REQUIRE(u == TranscriptAccumulator::Update::Failed);
        REQUIRE(acc.error() == "quota");
    }
}
