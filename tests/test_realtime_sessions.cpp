#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "realtime/doubao_realtime_engine.hpp"
#include "realtime/doubao_wire.hpp"
#include "realtime/qwen_realtime_engine.hpp"
#include "realtime/ws_session.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;
using fakes::FakeWsState;

namespace {

WsMessage doubao_reply(const std::string& text, bool final, int32_t seq) {
    json body = {{"result", {{"text", text}}}};
    auto payload = body.dump();
    auto frame = doubao_wire::encode_frame(
        doubao_wire::MessageType::FullServerResponse,
        final ? doubao_wire::flags::kLastWithSequence : doubao_wire::flags::kSequence, seq,
        std::span(reinterpret_cast<const uint8_t*>(payload.data()), payload.size()),
        doubao_wire::Compression::Gzip);
    return WsMessage{WsMessage::Type::Binary, std::string(frame->begin(), frame->end())};
}

WsMessage doubao_error(uint32_t code) {
    std::string b = {0x11, static_cast<char>(0xf0), 0x10, 0x00};
    for (int s = 24; s >= 0; s -= 8) b.push_back(static_cast<char>((code >> s) & 0xff));
    return WsMessage{WsMessage::Type::Binary, b};
}

std::optional<doubao_wire::Frame> client_frame(const WsMessage& msg) {
    auto frame = doubao_wire::decode_frame(
        std::span(reinterpret_cast<const uint8_t*>(msg.data.data()), msg.data.size()));
    if (!frame) return std::nullopt;
    return *frame;
}

// Acks the config, answers every audio frame with a growing interim text and
// the finish frame with the final text.
void script_doubao(FakeWsState& state) {
    state.reply = [](const WsMessage& sent) -> std::vector<WsMessage> {
        auto frame = client_frame(sent);
        if (!frame) return {};
        if (frame->type == doubao_wire::MessageType::FullClientRequest) {
            return {doubao_reply("", false, 1)};
        }
        int32_t seq = frame->sequence.value_or(0);
        if (frame->is_last()) return {doubao_reply("你好世界。", true, seq)};
        return {doubao_reply(std::string("你好").append(seq > 2 ? "世界" : ""), false, seq)};
    };
}

std::vector<uint8_t> chunk_bytes(size_t n = 320) {
    return std::vector<uint8_t>(n, 0x01);
}

WsMessage qwen_event(const json& j) {
    return WsMessage{WsMessage::Type::Text, j.dump()};
}

// Emits a delta per append and the completed transcript on commit.
void script_qwen(FakeWsState& state) {
    state.reply = [](const WsMessage& sent) -> std::vector<WsMessage> {
        auto j = json::parse(sent.data);
        auto type = j.value("type", "");
        if (type == "session.update") return {qwen_event({{"type", "session.updated"}})};
        if (type == "input_audio_buffer.append") {
            return {qwen_event({{"type", "response.audio_transcript.delta"}, {"delta", "你好，"}})};
        }
        if (type == "input_audio_buffer.commit") {
            return {
                qwen_event({{"type", "input_audio_buffer.committed"}}),
                qwen_event({{"type", "conversation.item.input_audio_transcription.completed"},
                            {"transcript", "你好，世界。"}}),
            };
        }
        return {};
    };
}

struct PartialLog {
    std::mutex mu;
    std::vector<std::string> texts;

    StreamingSession::PartialCallback callback() {
        return [this](const std::string& t) {
            std::lock_guard lock(mu);
            texts.push_back(t);
        };
    }

    std::vector<std::string> snapshot() {
        std::lock_guard lock(mu);
        return texts;
    }
};

} // namespace

TEST_CASE("Doubao realtime session", "[doubao][realtime]") {
    auto state = std::make_shared<FakeWsState>();
    DoubaoRealtimeEngine engine("app-1", "token-1", fakes::connector_for(state), 2000ms);

    SECTION("StreamsAndResolvesFinalText") {
        script_doubao(*state);
        PartialLog partials;

        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->state() == SessionState::Streaming);
        (*session)->set_partial_callback(partials.callback());

        auto pcm = chunk_bytes();
        for (int i = 0; i < 3; ++i) REQUIRE((*session)->send_chunk(pcm));

        auto text = (*session)->close();
        REQUIRE(text);
        // Final text is passed through as the server sent it.
        REQUIRE(*text == "你好世界。");
        REQUIRE((*session)->state() == SessionState::Closed);

        auto seen = partials.snapshot();
        REQUIRE(seen.size() >= 3);
        REQUIRE(seen.front() == "你好");
        REQUIRE(seen.back() == "你好世界。");
    }

    SECTION("ConnectHeaders") {
        script_doubao(*state);
        auto session = engine.create_realtime_session();
        REQUIRE(session);

        REQUIRE(state->request.has_value());
        REQUIRE(state->request->url == DoubaoRealtimeEngine::kEndpoint);
        auto headers = state->request->headers;
        auto has = [&](const std::string& name, const std::string& value) {
            return std::find(headers.begin(), headers.end(), std::pair{name, value}) != headers.end();
        };
        REQUIRE(has("X-Api-App-Key", "app-1"));
        REQUIRE(has("X-Api-Access-Key", "token-1"));
        REQUIRE(has("X-Api-Resource-Id", "volc.seedasr.sauc.duration"));
        REQUIRE(std::any_of(headers.begin(), headers.end(),
                            [](const auto& h) { return h.first == "X-Api-Connect-Id"; }));
        REQUIRE((*session)->close());
    }

    SECTION("SequenceNumbering") {
        script_doubao(*state);
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        auto pcm = chunk_bytes();
        REQUIRE((*session)->send_chunk(pcm));
        REQUIRE((*session)->send_chunk(pcm));
        REQUIRE((*session)->close());

        std::vector<std::vector<uint8_t>> sent;
        {
            std::lock_guard lock(state->mu);
            sent = state->sent_binary;
        }
        REQUIRE(sent.size() == 4);

        std::vector<int32_t> seqs;
        for (const auto& b : sent) {
            auto f = doubao_wire::decode_frame(b);
            REQUIRE(f);
            seqs.push_back(f->sequence.value_or(0));
        }
        REQUIRE(seqs == std::vector<int32_t>{1, 2, 3, -4});

        auto finish = doubao_wire::decode_frame(sent.back());
        REQUIRE(finish->flags == doubao_wire::flags::kLastWithSequence);
        REQUIRE(finish->payload.empty());
    }

    SECTION("CommitIsNoOp") {
        script_doubao(*state);
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->commit());
        REQUIRE((*session)->close());
        REQUIRE(state->binary_count() == 2);
    }

    SECTION("ConfigRejected") {
        state->reply = [](const WsMessage&) -> std::vector<WsMessage> {
            return {doubao_error(45000001)};
        };
        auto session = engine.create_realtime_session();
        REQUIRE_FALSE(session);
        REQUIRE(session.error().kind == AsrErrorKind::WireProtocol);
    }

    SECTION("ConnectRefused") {
        DoubaoRealtimeEngine refused("app", "tok", fakes::refusing_connector());
        auto session = refused.create_realtime_session();
        REQUIRE_FALSE(session);
        REQUIRE(session.error().kind == AsrErrorKind::WireProtocol);
    }

    SECTION("ServerErrorMidStream") {
        state->reply = [](const WsMessage& sent) -> std::vector<WsMessage> {
            auto frame = client_frame(sent);
            if (frame && frame->type == doubao_wire::MessageType::FullClientRequest) {
                return {doubao_reply("", false, 1)};
            }
            return {doubao_error(55000031)};
        };
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes()));

        auto text = (*session)->close();
        REQUIRE_FALSE(text);
        REQUIRE(text.error().kind == AsrErrorKind::WireProtocol);
        REQUIRE((*session)->state() == SessionState::Failed);
    }

    SECTION("DropAfterTextKeepsPartialCredit") {
        state->reply = [state_ptr = state.get()](const WsMessage& sent) -> std::vector<WsMessage> {
            auto frame = client_frame(sent);
            if (!frame) return {};
            if (frame->type == doubao_wire::MessageType::FullClientRequest) {
                return {doubao_reply("", false, 1)};
            }
            if (frame->is_last()) {
                state_ptr->hang_up();
                return {};
            }
            return {doubao_reply("部分结果", false, frame->sequence.value_or(0))};
        };
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes()));
        // Let the interim answer arrive before the socket goes away.
        std::this_thread::sleep_for(200ms);

        auto text = (*session)->close();
        REQUIRE(text);
        REQUIRE(*text == "部分结果");
    }

    SECTION("DropWithoutText") {
        state->reply = [state_ptr = state.get()](const WsMessage& sent) -> std::vector<WsMessage> {
            auto frame = client_frame(sent);
            if (frame && frame->type == doubao_wire::MessageType::FullClientRequest) {
                return {doubao_reply("", false, 1)};
            }
            state_ptr->hang_up();
            return {};
        };
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes()));

        auto text = (*session)->close();
        REQUIRE_FALSE(text);
        REQUIRE(text.error().kind == AsrErrorKind::WireProtocol);
    }

    SECTION("CloseTimesOut") {
        state->reply = [](const WsMessage& sent) -> std::vector<WsMessage> {
            auto frame = client_frame(sent);
            if (frame && frame->type == doubao_wire::MessageType::FullClientRequest) {
                return {doubao_reply("", false, 1)};
            }
            return {};
        };
        DoubaoRealtimeEngine slow("app", "tok", fakes::connector_for(state), 200ms);
        auto session = slow.create_realtime_session();
        REQUIRE(session);

        auto start = std::chrono::steady_clock::now();
        auto text = (*session)->close();
        auto waited = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(text);
        REQUIRE(text.error().kind == AsrErrorKind::Timeout);
        REQUIRE(text.error().timeout_ms == 200);
        REQUIRE(waited >= 200ms);
        REQUIRE(waited < 2s);
    }

    SECTION("SingleUse") {
        script_doubao(*state);
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->close());

        auto again = (*session)->close();
        REQUIRE_FALSE(again);
        REQUIRE(again.error().kind == AsrErrorKind::Internal);

        auto late = (*session)->send_chunk(chunk_bytes());
        REQUIRE_FALSE(late);
        REQUIRE(late.error().kind == AsrErrorKind::WireProtocol);
        REQUIRE(state->closed);
    }

    SECTION("DeadSocketRejectsChunks") {
        script_doubao(*state);
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        {
            std::lock_guard lock(state->mu);
            state->fail_sends_after = state->sends;
        }
        REQUIRE((*session)->send_chunk(chunk_bytes()));
        // The sender stops after the failed write and the queue closes.
        std::this_thread::sleep_for(100ms);
        auto r = (*session)->send_chunk(chunk_bytes());
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == AsrErrorKind::WireProtocol);
    }

    SECTION("NoOneShot") {
        auto r = engine.transcribe(fakes::one_second_of_audio());
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == AsrErrorKind::UnsupportedOperation);
        REQUIRE(engine.supports_mode(AsrMode::Realtime));
        REQUIRE_FALSE(engine.supports_mode(AsrMode::Http));
    }
}

TEST_CASE("Qwen realtime session", "[qwen][realtime]") {
    auto state = std::make_shared<FakeWsState>();
    QwenRealtimeEngine engine("sk-q", fakes::connector_for(state), "qwen3-asr-flash-realtime", "zh",
                              2000ms);

    SECTION("StreamsAndResolvesFinalText") {
        script_qwen(*state);
        PartialLog partials;

        auto session = engine.create_realtime_session();
        REQUIRE(session);
        (*session)->set_partial_callback(partials.callback());

        auto pcm = chunk_bytes();
        REQUIRE((*session)->send_chunk(pcm));
        REQUIRE((*session)->send_chunk(pcm));

        auto text = (*session)->close();
        REQUIRE(text);
        REQUIRE(*text == "你好世界");

        auto seen = partials.snapshot();
        REQUIRE(seen.size() == 2);
        REQUIRE(seen[0] == "你好，");
        REQUIRE(seen[1] == "你好，你好，");
    }

    SECTION("ConnectRequestAndEventOrder") {
        script_qwen(*state);
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes(4)));
        REQUIRE((*session)->close());

        REQUIRE(state->request->url ==
                "wss://dashscope.aliyuncs.com/api-ws/v1/realtime?model=qwen3-asr-flash-realtime");
        auto headers = state->request->headers;
        REQUIRE(std::find(headers.begin(), headers.end(),
                          std::pair<std::string, std::string>{"Authorization", "Bearer sk-q"}) !=
                headers.end());
        REQUIRE(std::find(headers.begin(), headers.end(),
                          std::pair<std::string, std::string>{"OpenAI-Beta", "realtime=v1"}) !=
                headers.end());

        std::vector<std::string> types;
        {
            std::lock_guard lock(state->mu);
            for (const auto& t : state->sent_text) {
                types.push_back(json::parse(t)["type"].get<std::string>());
            }
        }
        REQUIRE(types == std::vector<std::string>{"session.update", "input_audio_buffer.append",
                                                  "input_audio_buffer.commit"});
    }

    SECTION("ExplicitCommit") {
        script_qwen(*state);
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes()));
        REQUIRE((*session)->commit());
        auto text = (*session)->close();
        REQUIRE(text);
        REQUIRE(*text == "你好世界");
    }

    SECTION("ErrorEventFails") {
        state->reply = [](const WsMessage& sent) -> std::vector<WsMessage> {
            auto type = json::parse(sent.data).value("type", "");
            if (type == "input_audio_buffer.commit") {
                return {qwen_event({{"type", "error"}, {"error", {{"message", "invalid audio"}}}})};
            }
            return {};
        };
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes()));

        auto text = (*session)->close();
        REQUIRE_FALSE(text);
        REQUIRE(text.error().kind == AsrErrorKind::WireProtocol);
        REQUIRE(text.error().message.find("invalid audio") != std::string::npos);
    }

    SECTION("DropAfterDeltas") {
        state->reply = [state_ptr = state.get()](const WsMessage& sent) -> std::vector<WsMessage> {
            auto type = json::parse(sent.data).value("type", "");
            if (type == "input_audio_buffer.append") {
                return {qwen_event({{"type", "response.audio_transcript.delta"}, {"delta", "半句，"}})};
            }
            if (type == "input_audio_buffer.commit") state_ptr->hang_up();
            return {};
        };
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes()));
        std::this_thread::sleep_for(200ms);

        auto text = (*session)->close();
        REQUIRE(text);
        REQUIRE(*text == "半句");
    }

    SECTION("DropWithoutText") {
        state->reply = [state_ptr = state.get()](const WsMessage& sent) -> std::vector<WsMessage> {
            auto type = json::parse(sent.data).value("type", "");
            if (type == "input_audio_buffer.commit") state_ptr->hang_up();
            return {};
        };
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes()));

        auto text = (*session)->close();
        REQUIRE_FALSE(text);
        REQUIRE(text.error().kind == AsrErrorKind::WireProtocol);
        REQUIRE(text.error().message.find("without a result") != std::string::npos);
        REQUIRE((*session)->state() == SessionState::Failed);
    }

    SECTION("EmptyResponseDoneThenDrop") {
        state->reply = [state_ptr = state.get()](const WsMessage& sent) -> std::vector<WsMessage> {
            auto type = json::parse(sent.data).value("type", "");
            if (type == "input_audio_buffer.commit") {
                // Completion with nothing transcribed does not resolve the session.
                state_ptr->push(qwen_event({{"type", "response.done"}}));
                state_ptr->hang_up();
            }
            return {};
        };
        auto session = engine.create_realtime_session();
        REQUIRE(session);
        REQUIRE((*session)->send_chunk(chunk_bytes()));

        auto text = (*session)->close();
        REQUIRE_FALSE(text);
        REQUIRE(text.error().kind == AsrErrorKind::WireProtocol);
    }

    SECTION("SlowSocketAppliesBackPressure") {
        auto gate = std::make_shared<std::atomic<bool>>(false);
        state->reply = [gate](const WsMessage& sent) -> std::vector<WsMessage> {
            auto type = json::parse(sent.data).value("type", "");
            if (type == "input_audio_buffer.append") {
                while (!gate->load()) std::this_thread::sleep_for(1ms);
            }
            if (type == "input_audio_buffer.commit") {
                return {qwen_event({{"type", "conversation.item.input_audio_transcription.completed"},
                                    {"transcript", "排队。"}})};
            }
            return {};
        };
        auto session = engine.create_realtime_session();
        REQUIRE(session);

        constexpr size_t kCapacity = WsStreamingSession::kSendQueueCapacity;
        size_t accepted = 0;
        std::optional<AsrError> rejected;
        for (size_t i = 0; i < 2 * kCapacity + 10 && !rejected; ++i) {
            auto r = (*session)->send_chunk(chunk_bytes());
            if (r) {
                ++accepted;
            } else {
                rejected = r.error();
            }
        }
        // Unblock the sender before asserting so the session can shut down.
        gate->store(true);

        REQUIRE(rejected.has_value());
        REQUIRE(rejected->kind == AsrErrorKind::WireProtocol);
        REQUIRE(rejected->message.find("queue full") != std::string::npos);
        // One chunk may already be in the sender's hands.
        REQUIRE(accepted >= kCapacity);
        REQUIRE(accepted <= kCapacity + 1);

        auto text = (*session)->close();
        REQUIRE(text);
        REQUIRE(*text == "排队");
        // session.update, every accepted append, then the commit.
        REQUIRE(state->text_count() == accepted + 2);
    }

    SECTION("ConnectRefused") {
        QwenRealtimeEngine refused("sk", fakes::refusing_connector());
        auto session = refused.create_realtime_session();
        REQUIRE_FALSE(session);
        REQUIRE(session.error().kind == AsrErrorKind::WireProtocol);
    }

    SECTION("NoOneShot") {
        auto r = engine.transcribe(fakes::one_second_of_audio());
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == AsrErrorKind::UnsupportedOperation);
    }
}
