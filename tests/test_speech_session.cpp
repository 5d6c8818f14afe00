#include <gtest/gtest.h>

#include <algorithm>

#include "encoding.hpp"
#include "error_manager.hpp"
#include "fakes.hpp"
#include "voice/speech_session.hpp"

using namespace testing_fakes;
using Voice::AudioClip;
using Voice::SpeechEvent;
using Voice::SpeechEventType;
using Voice::SpeechSession;

namespace {

AudioClip clipOf(double seconds) {
    AudioClip clip;
    clip.sampleRate = 16000;
    clip.samples.assign(static_cast<size_t>(seconds * clip.sampleRate), 0.1f);
    return clip;
}

std::vector<SpeechEventType> typesOf(const std::vector<SpeechEvent>& events) {
    std::vector<SpeechEventType> out;
    for (const auto& e : events) out.push_back(e.type);
    return out;
}

int countOf(const std::vector<SpeechEvent>& events, SpeechEventType type) {
    return static_cast<int>(std::count_if(events.begin(), events.end(),
                                          [type](const SpeechEvent& e) { return e.type == type; }));
}

const SpeechEvent* firstOf(const std::vector<SpeechEvent>& events, SpeechEventType type) {
    for (const auto& e : events) {
        if (e.type == type) return &e;
    }
    return nullptr;
}

class SpeechSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.projectId = "proj-1";
        config.sessionId = "sess-9";
        config.tickMs = 1;
        config.interChunkGapMs = 0;
        config.retryGapMs = 0;

        transport->audio = {{"a0", "pcm-zero"}, {"a1", "pcm-one"}, {"a2", "pcm-two"}};
    }

    std::unique_ptr<SpeechSession> makeSession() {
        return std::make_unique<SpeechSession>(config, transport, std::make_shared<FakeDecoder>(),
                                               std::make_unique<FakeOutput>(log), events);
    }

    Voice::VoiceConfig config;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<OutputLog> log = std::make_shared<OutputLog>();
    std::shared_ptr<Voice::EventChannel> events = std::make_shared<Voice::EventChannel>();
};

} // namespace

// ============================================================
// Happy path
// ============================================================
TEST_F(SpeechSessionTest, OutOfOrderChunksPlayInOrder) {
    transport->pieces = {
        textFrame("Hello"),
        audioRefFrame(2, "a2"),
        audioRefFrame(0, "a0"),
        audioRefFrame(1, "a1"),
        completeFrame("Hello there friend.", "hi"),
    };
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(1.0));

    EXPECT_TRUE(result.success) << result.errorCode;
    EXPECT_EQ(result.message, "Hello there friend.");
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(session->phase(), SpeechSession::Phase::Idle);
    EXPECT_FALSE(session->isPlaying());

    auto evs = drain(*events);
    ASSERT_FALSE(evs.empty());
    EXPECT_EQ(evs.front().type, SpeechEventType::Processing);
    EXPECT_EQ(evs.back().type, SpeechEventType::Reset);
    EXPECT_EQ(countOf(evs, SpeechEventType::Complete), 1);
    EXPECT_EQ(countOf(evs, SpeechEventType::Error), 0);
    EXPECT_GE(countOf(evs, SpeechEventType::AiSpeaking), 1);

    const SpeechEvent* chunk = firstOf(evs, SpeechEventType::ResponseChunk);
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->text, "Hello");

    const SpeechEvent* complete = firstOf(evs, SpeechEventType::Complete);
    ASSERT_NE(complete, nullptr);
    EXPECT_EQ(complete->text, "Hello there friend.");
    EXPECT_EQ(complete->transcript, "hi");

    auto types = typesOf(evs);
    auto transcriptAt = std::find(types.begin(), types.end(), SpeechEventType::Transcript);
    auto responseAt   = std::find(types.begin(), types.end(), SpeechEventType::Response);
    auto completeAt   = std::find(types.begin(), types.end(), SpeechEventType::Complete);
    EXPECT_LT(transcriptAt, responseAt);
    EXPECT_LT(responseAt, completeAt);
}

TEST_F(SpeechSessionTest, InlineDataUrlAudioPlays) {
    transport->pieces = {
        inlineAudioFrame(1, "inline-one"),
        inlineAudioFrame(0, "inline-zero"),
        completeFrame("ok", "say ok"),
    };
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(0.5));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0, 1}));
}

TEST_F(SpeechSessionTest, RequestCarriesAudioAndSelectors) {
    config.voice = "nova";
    config.persona = "casual";
    transport->pieces = {completeFrame("r", "t")};
    auto session = makeSession();

    AudioClip clip = clipOf(0.5);
    ASSERT_TRUE(session->submit(clip).success);

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].projectId, "proj-1");
    EXPECT_EQ(requests[0].sessionId, "sess-9");
    EXPECT_EQ(requests[0].voice, "nova");
    EXPECT_EQ(requests[0].persona, "casual");
    EXPECT_EQ(requests[0].audioWav, encoding::encodeWav(clip.samples, clip.sampleRate));
    EXPECT_TRUE(requests[0].history.empty());
}

TEST_F(SpeechSessionTest, HistoryGrowsOnCompleteAndRidesAlong) {
    transport->pieces = {completeFrame("First answer.", "first question")};
    auto session = makeSession();
    ASSERT_TRUE(session->submit(clipOf(0.5)).success);

    auto history = session->conversation();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].role, "user");
    EXPECT_EQ(history[0].content, "first question");
    EXPECT_EQ(history[1].role, "assistant");
    EXPECT_EQ(history[1].content, "First answer.");

    transport->pieces = {completeFrame("Second answer.", "second question")};
    ASSERT_TRUE(session->submit(clipOf(0.5)).success);

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    ASSERT_EQ(requests[1].history.size(), 2u);
    EXPECT_EQ(requests[1].history[0].content, "first question");
    EXPECT_EQ(session->conversation().size(), 4u);

    session->clearConversation();
    EXPECT_TRUE(session->conversation().empty());
}

TEST_F(SpeechSessionTest, StreamedTextStandsInForMissingFullResponse) {
    transport->pieces = {
        textFrame("Hello "),
        textFrame("there."),
        dataLine({{"type", "complete"}, {"transcript", "greet me"}}),
    };
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(0.5));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Hello there.");

    auto history = session->conversation();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].content, "Hello there.");

    const auto evs = drain(*events);
    const SpeechEvent* complete = firstOf(evs, SpeechEventType::Complete);
    ASSERT_NE(complete, nullptr);
    EXPECT_EQ(complete->text, "Hello there.");
}

TEST_F(SpeechSessionTest, ExplicitFullResponseWinsOverStreamedText) {
    transport->pieces = {textFrame("draft"), completeFrame("Final answer.", "q")};
    auto session = makeSession();

    EXPECT_EQ(session->submit(clipOf(0.5)).message, "Final answer.");
}

// ============================================================
// Chunk-level failures never stall the sequence
// ============================================================
TEST_F(SpeechSessionTest, ExpiredChunkIsSkipped) {
    transport->audio.erase("a1");   // 404
    transport->pieces = {
        audioRefFrame(0, "a0"),
        audioRefFrame(1, "a1"),
        audioRefFrame(2, "a2"),
        completeFrame("three parts", "q"),
    };
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(1.0));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0, 2}));
    EXPECT_EQ(countOf(drain(*events), SpeechEventType::Error), 0);
}

TEST_F(SpeechSessionTest, UndecodableChunkIsSkipped) {
    transport->audio["a1"] = "corrupt";
    transport->pieces = {
        audioRefFrame(0, "a0"),
        audioRefFrame(1, "a1"),
        audioRefFrame(2, "a2"),
        completeFrame("three parts", "q"),
    };
    auto session = makeSession();

    EXPECT_TRUE(session->submit(clipOf(1.0)).success);
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0, 2}));
}

TEST_F(SpeechSessionTest, ServerChunkErrorIsSkipped) {
    transport->pieces = {
        audioRefFrame(0, "a0"),
        chunkErrorFrame(1, "tts failed"),
        audioRefFrame(2, "a2"),
        completeFrame("three parts", "q"),
    };
    auto session = makeSession();

    EXPECT_TRUE(session->submit(clipOf(1.0)).success);
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0, 2}));
}

TEST_F(SpeechSessionTest, MissingTrailingChunkIsFlushedOnComplete) {
    transport->pieces = {
        audioRefFrame(0, "a0"),
        audioRefFrame(2, "a2"),    // 1 never announced
        completeFrame("gap", "q"),
    };
    auto session = makeSession();

    EXPECT_TRUE(session->submit(clipOf(1.0)).success);
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0, 2}));
}

// ============================================================
// Cycle-level failures
// ============================================================
TEST_F(SpeechSessionTest, TerminalErrorFrameFailsCycle) {
    transport->pieces = {textFrame("partial"), errorFrame("model overloaded")};
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(1.0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, "ERR_SERVER_ERROR");
    EXPECT_EQ(result.message, "model overloaded");
    EXPECT_TRUE(session->conversation().empty());

    auto evs = drain(*events);
    const SpeechEvent* err = firstOf(evs, SpeechEventType::Error);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->text, "model overloaded");
    EXPECT_EQ(evs.back().type, SpeechEventType::Reset);
    EXPECT_EQ(countOf(evs, SpeechEventType::Complete), 0);
}

TEST_F(SpeechSessionTest, StreamEndingWithoutTerminalFrameFails) {
    transport->pieces = {textFrame("cut"), audioRefFrame(0, "a0")};
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(1.0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, "ERR_STREAM_INCOMPLETE");
    EXPECT_TRUE(session->conversation().empty());
    EXPECT_FALSE(session->isPlaying());

    auto evs = drain(*events);
    EXPECT_EQ(countOf(evs, SpeechEventType::Error), 1);
    EXPECT_EQ(evs.back().type, SpeechEventType::Reset);
}

TEST_F(SpeechSessionTest, HttpErrorSurfacesServerMessage) {
    transport->status = Voice::TransportStatus{};
    transport->status.httpStatus = 503;
    transport->status.errorCode = "ERR_TRANSPORT_HTTP";
    transport->status.message = "Voice service is busy";
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(1.0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, "ERR_TRANSPORT_HTTP");
    EXPECT_EQ(result.message, "Voice service is busy");

    auto evs = drain(*events);
    const SpeechEvent* err = firstOf(evs, SpeechEventType::Error);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->text, "Voice service is busy");
}

TEST_F(SpeechSessionTest, NetworkErrorUsesTableMessage) {
    transport->status = Voice::TransportStatus{};
    transport->status.errorCode = "ERR_TRANSPORT_NETWORK";
    transport->status.message = "Couldn't connect to server";
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(1.0));
    EXPECT_EQ(result.errorCode, "ERR_TRANSPORT_NETWORK");
    EXPECT_EQ(result.message, ErrorManager::getUserMessage("ERR_TRANSPORT_NETWORK"));
}

TEST_F(SpeechSessionTest, ShortClipIsRejectedWithoutNetwork) {
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(0.2));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, "ERR_CLIP_TOO_SHORT");
    EXPECT_EQ(transport->streamCalls.load(), 0);

    auto evs = drain(*events);
    EXPECT_EQ(typesOf(evs), (std::vector<SpeechEventType>{SpeechEventType::Processing, SpeechEventType::Reset}));
}

TEST_F(SpeechSessionTest, MissingProjectIsAnError) {
    config.projectId.clear();
    auto session = makeSession();

    CycleResult result = session->submit(clipOf(1.0));
    EXPECT_EQ(result.errorCode, "ERR_NO_PROJECT");
    EXPECT_EQ(transport->streamCalls.load(), 0);

    auto evs = drain(*events);
    EXPECT_EQ(typesOf(evs), (std::vector<SpeechEventType>{
        SpeechEventType::Processing, SpeechEventType::Error, SpeechEventType::Reset}));
}

// ============================================================
// Cancellation
// ============================================================
TEST_F(SpeechSessionTest, StopAudioDuringSecondOfThreeChunks) {
    log->holdId = 1;
    transport->pieces = {
        audioRefFrame(0, "a0"),
        audioRefFrame(1, "a1"),
        audioRefFrame(2, "a2"),
        completeFrame("three parts", "q"),
    };
    auto session = makeSession();

    auto future = session->submitAsync(clipOf(1.0));
    ASSERT_TRUE(waitFor([&] { return log->hasPlayed(1); }));

    const int stopsBefore = log->stops();
    session->stopAudio();

    EXPECT_GT(log->stops(), stopsBefore);
    EXPECT_FALSE(session->isPlaying());
    EXPECT_EQ(session->phase(), SpeechSession::Phase::Idle);

    CycleResult result = future.get();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, "ERR_SESSION_CANCELLED");

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0, 1}));

    auto evs = drain(*events);
    EXPECT_EQ(evs.back().type, SpeechEventType::Reset);
    EXPECT_EQ(countOf(evs, SpeechEventType::Error), 0);
}

TEST_F(SpeechSessionTest, RejectedFollowUpClipStillSilencesPreviousReply) {
    log->holdId = 0;
    transport->pieces = {
        audioRefFrame(0, "a0"),
        audioRefFrame(1, "a1"),
        completeFrame("two parts", "q"),
    };
    auto session = makeSession();

    auto first = session->submitAsync(clipOf(1.0));
    ASSERT_TRUE(waitFor([&] { return log->hasPlayed(0); }));
    const int stopsBefore = log->stops();

    CycleResult second = session->submit(clipOf(0.1));
    EXPECT_EQ(second.errorCode, "ERR_CLIP_TOO_SHORT");
    EXPECT_EQ(first.get().errorCode, "ERR_SESSION_CANCELLED");

    EXPECT_GT(log->stops(), stopsBefore);
    EXPECT_FALSE(session->isPlaying());
    EXPECT_EQ(session->phase(), SpeechSession::Phase::Idle);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0}));
    EXPECT_EQ(transport->streamCalls.load(), 1);
}

TEST_F(SpeechSessionTest, StopAudioAbortsOpenStream) {
    transport->holdOpen = true;
    transport->pieces = {textFrame("thinking")};
    auto session = makeSession();

    auto future = session->submitAsync(clipOf(1.0));
    ASSERT_TRUE(waitFor([&] { return transport->streamCalls.load() == 1; }));

    session->stopAudio();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(future.get().errorCode, "ERR_SESSION_CANCELLED");
    EXPECT_TRUE(log->snapshot().empty());
}

TEST_F(SpeechSessionTest, SpeechStartInterruptsPlayback) {
    log->holdId = 0;
    transport->pieces = {audioRefFrame(0, "a0"), completeFrame("one", "q")};
    auto session = makeSession();

    auto future = session->submitAsync(clipOf(1.0));
    ASSERT_TRUE(waitFor([&] { return log->hasPlayed(0); }));

    session->onSpeechStart();
    EXPECT_EQ(future.get().errorCode, "ERR_SESSION_CANCELLED");
    EXPECT_FALSE(session->isPlaying());

    auto evs = drain(*events);
    EXPECT_EQ(countOf(evs, SpeechEventType::UserSpeaking), 1);
}

TEST_F(SpeechSessionTest, MisfireJustResets) {
    auto session = makeSession();
    session->onMisfire();
    EXPECT_EQ(typesOf(drain(*events)), (std::vector<SpeechEventType>{SpeechEventType::Reset}));
    EXPECT_EQ(transport->streamCalls.load(), 0);
}

TEST_F(SpeechSessionTest, NextCycleStartsFromChunkZero) {
    log->holdId = 1;
    transport->pieces = {audioRefFrame(0, "a0"), audioRefFrame(1, "a1"), completeFrame("x", "q")};
    auto session = makeSession();

    auto first = session->submitAsync(clipOf(1.0));
    ASSERT_TRUE(waitFor([&] { return log->hasPlayed(1); }));
    session->stopAudio();
    EXPECT_EQ(first.get().errorCode, "ERR_SESSION_CANCELLED");

    {
        std::lock_guard<std::mutex> lock(log->mutex);
        log->holdId = -1;
        log->played.clear();
    }
    transport->pieces = {audioRefFrame(1, "a1"), audioRefFrame(0, "a0"), completeFrame("y", "q")};

    EXPECT_TRUE(session->submit(clipOf(1.0)).success);
    EXPECT_EQ(log->snapshot(), (std::vector<int>{0, 1}));
}
