#include "Session/RecordingSession.h"
#include "Core/Errors.h"
#include "FakeAudio.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace testing_support;
using namespace std::chrono_literals;

namespace {
SessionConfig QuickConfig() {
    SessionConfig config;
    config.audio.sampleRate = kRate;
    config.audio.frameSize = kFrameSize;
    config.segmentation.silenceThreshold = 300;
    config.segmentation.silenceFramesToClose = 2;
    config.segmentation.minSegmentSeconds = 0.5;
    config.segmentation.maxSegmentSeconds = 30.0;
    return config;
}

class CollectingSink : public ITranscriptSink {
public:
    void onLine(const TranscriptLine& line) override {
        std::scoped_lock lock(mutex);
        lines.push_back(line);
    }
    std::vector<TranscriptLine> snapshot() {
        std::scoped_lock lock(mutex);
        return lines;
    }

    std::mutex mutex;
    std::vector<TranscriptLine> lines;
};

// a script that never ends, for tests that stop the session themselves
std::shared_ptr<AudioScript> EndlessScript(std::chrono::milliseconds delay = 5ms) {
    auto script = std::make_shared<AudioScript>();
    script->endWhenEmpty = false;
    script->readDelay = delay;
    return script;
}
} // namespace

TEST(RecordingSession, StartsIdle) {
    auto script = EndlessScript();
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"x"});
    RecordingSession session(source, *engine, QuickConfig());

    const auto status = session.status();
    EXPECT_FALSE(status.isRunning);
    EXPECT_FALSE(status.selectedDeviceIndex);
    EXPECT_FALSE(status.lastError);
    EXPECT_EQ(session.transcriptSize(), 0u);
}

TEST(RecordingSession, RejectsInvalidConfig) {
    auto script = EndlessScript();
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"x"});
    SessionConfig config = QuickConfig();
    config.segmentation.maxSegmentSeconds = 0.1;

    EXPECT_THROW({ RecordingSession session(source, *engine, config); }, ConfigError);
}

TEST(RecordingSession, SecondStartIsRejected) {
    auto script = EndlessScript();
    FakeAudioSource source(script, 2);
    auto engine = FakeEngine::Saying({"x"});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(1);
    EXPECT_THROW(session.start(0), AlreadyRecordingError);

    const auto status = session.status();
    EXPECT_TRUE(status.isRunning);
    ASSERT_TRUE(status.selectedDeviceIndex);
    EXPECT_EQ(*status.selectedDeviceIndex, 1);
    EXPECT_EQ(script->opens.load(), 1);

    session.stop();
    EXPECT_FALSE(session.isRunning());
}

TEST(RecordingSession, UnknownDeviceLeavesSessionIdle) {
    auto script = EndlessScript();
    FakeAudioSource source(script, 1);
    auto engine = FakeEngine::Saying({"x"});
    RecordingSession session(source, *engine, QuickConfig());

    EXPECT_THROW(session.start(4), DeviceUnavailableError);
    EXPECT_FALSE(session.isRunning());
    EXPECT_FALSE(session.status().selectedDeviceIndex);

    // the failed start does not block a good one
    session.start(0);
    EXPECT_TRUE(session.isRunning());
}

TEST(RecordingSession, StopIsPromptDuringSlowRead) {
    auto script = EndlessScript(250ms);
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"x"});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return script->reads.load() > 0; }));

    const auto before = std::chrono::steady_clock::now();
    session.stop();
    const auto elapsed = std::chrono::steady_clock::now() - before;

    EXPECT_FALSE(session.status().isRunning);
    EXPECT_LT(elapsed, 500ms);
    EXPECT_EQ(script->closes.load(), 1);
}

TEST(RecordingSession, StopIsIdempotent) {
    auto script = EndlessScript();
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"x"});
    RecordingSession session(source, *engine, QuickConfig());

    session.stop();
    session.start(0);
    session.stop();
    session.stop();
    EXPECT_FALSE(session.isRunning());
    // device stays reported after stopping
    ASSERT_TRUE(session.status().selectedDeviceIndex);
    EXPECT_EQ(*session.status().selectedDeviceIndex, 0);
}

TEST(RecordingSession, TranscribesEachSegment) {
    auto script = std::make_shared<AudioScript>();
    script->add(Loud(), 4);
    script->add(Quiet(), 2); // closes at 1.5 s
    script->add(Loud(), 3);  // flushed at end of input
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({" hello ", "world"});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));

    const auto transcript = session.readTranscript();
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(transcript[0].index, 0u);
    EXPECT_EQ(transcript[0].text, "hello world");
    EXPECT_DOUBLE_EQ(transcript[0].startSeconds, 0.0);
    EXPECT_DOUBLE_EQ(transcript[0].durationSeconds, 1.5);
    EXPECT_EQ(transcript[1].index, 1u);
    EXPECT_DOUBLE_EQ(transcript[1].startSeconds, 1.5);

    const auto status = session.status();
    EXPECT_FALSE(status.lastError);
    EXPECT_EQ(status.framesRead, 9u);
    EXPECT_EQ(status.segmentsClosed, 2u);
    EXPECT_EQ(engine->samplesSeen.load(), 9 * kFrameSize);
}

TEST(RecordingSession, OverflowIsSkipped) {
    auto script = std::make_shared<AudioScript>();
    script->add(Loud());
    script->addStatus(IAudioStream::ReadStatus::Overflow);
    script->add(Loud());
    script->add(Quiet(), 2);
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"ok"});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));

    const auto status = session.status();
    EXPECT_EQ(status.overflows, 1u);
    EXPECT_EQ(status.framesRead, 4u);
    EXPECT_FALSE(status.lastError);
    EXPECT_EQ(engine->samplesSeen.load(), 4 * kFrameSize);
    EXPECT_EQ(session.transcriptSize(), 1u);
}

TEST(RecordingSession, FatalReadEndsLoopWithError) {
    auto script = std::make_shared<AudioScript>();
    script->add(Loud(), 2);
    script->addStatus(IAudioStream::ReadStatus::Fatal);
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"lost"});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));

    auto status = session.status();
    ASSERT_TRUE(status.lastError);
    EXPECT_EQ(*status.lastError, "device unplugged");
    // buffered audio is discarded, not transcribed
    EXPECT_EQ(engine->calls.load(), 0);
    EXPECT_EQ(script->closes.load(), 1);

    // a new start clears the error
    script->add(Loud(), 2);
    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));
    status = session.status();
    EXPECT_FALSE(status.lastError);
    EXPECT_EQ(session.transcriptSize(), 1u);
}

TEST(RecordingSession, EngineFailureDropsOnlyThatSegment) {
    auto script = std::make_shared<AudioScript>();
    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    FakeAudioSource source(script);
    FakeEngine engine([](int call, const std::vector<float>&) -> std::vector<std::string> {
        if (call == 0) throw TranscriptionEngineError("decoder error");
        return {"second"};
    });
    RecordingSession session(source, engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));

    const auto transcript = session.readTranscript();
    ASSERT_EQ(transcript.size(), 1u);
    EXPECT_EQ(transcript[0].text, "second");
    EXPECT_EQ(transcript[0].index, 0u);

    const auto status = session.status();
    EXPECT_EQ(status.segmentsClosed, 2u);
    EXPECT_EQ(status.segmentsDropped, 1u);
    EXPECT_FALSE(status.lastError);
}

TEST(RecordingSession, EmptyResultAddsNoLine) {
    auto script = std::make_shared<AudioScript>();
    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"  "});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));

    EXPECT_EQ(session.transcriptSize(), 0u);
    EXPECT_EQ(session.status().segmentsClosed, 1u);
    EXPECT_EQ(session.status().segmentsDropped, 0u);
}

TEST(RecordingSession, SinksSeeLinesInOrder) {
    auto script = std::make_shared<AudioScript>();
    for (int i = 0; i < 5; ++i) {
        script->add(Loud(), 2);
        script->add(Quiet(), 2);
    }
    FakeAudioSource source(script);
    FakeEngine engine([](int call, const std::vector<float>&) {
        return std::vector<std::string>{"line " + std::to_string(call)};
    });
    RecordingSession session(source, engine, QuickConfig());
    auto sink = std::make_shared<CollectingSink>();
    session.addSink(sink);

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));

    const auto lines = sink->snapshot();
    ASSERT_EQ(lines.size(), 5u);
    for (size_t i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(lines[i].index, i);
        EXPECT_EQ(lines[i].text, "line " + std::to_string(i));
    }
}

TEST(RecordingSession, SinkMayStopTheSession) {
    auto script = EndlessScript(1ms);
    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    FakeAudioSource source(script);
    auto engine = FakeEngine::HearingSpeech({"stop now"});
    RecordingSession session(source, *engine, QuickConfig());

    class StoppingSink : public ITranscriptSink {
    public:
        explicit StoppingSink(RecordingSession& session) : session_(session) {}
        void onLine(const TranscriptLine&) override { session_.stop(); }

    private:
        RecordingSession& session_;
    };
    session.addSink(std::make_shared<StoppingSink>(session));

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));
    EXPECT_EQ(session.transcriptSize(), 1u);
    session.stop();
}

TEST(RecordingSession, ClearKeepsRecording) {
    auto script = EndlessScript(1ms);
    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    FakeAudioSource source(script);
    auto engine = FakeEngine::HearingSpeech({"first"});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return session.transcriptSize() == 1; }));
    session.clear();
    EXPECT_EQ(session.transcriptSize(), 0u);
    EXPECT_TRUE(session.isRunning());

    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    ASSERT_TRUE(WaitFor([&] { return session.transcriptSize() == 1; }));
    // numbering restarts with the transcript
    EXPECT_EQ(session.readTranscript()[0].index, 0u);
    session.stop();
}

TEST(RecordingSession, CalibrationSetsThresholdForTheRun) {
    auto script = std::make_shared<AudioScript>();
    script->add(MakeFrame(400), 2); // ambient, threshold becomes 600
    script->add(MakeFrame(500), 4); // silent under the calibrated threshold
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"x"});
    SessionConfig config = QuickConfig();
    config.segmentation.calibrationSeconds = 0.5;
    RecordingSession session(source, *engine, config);

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));

    const auto status = session.status();
    EXPECT_EQ(status.silenceThreshold, 600);
    EXPECT_EQ(status.framesRead, 4u);
    EXPECT_EQ(status.segmentsClosed, 2u);
}

TEST(RecordingSession, ReadTranscriptIsMonotonic) {
    auto script = std::make_shared<AudioScript>();
    script->readDelay = 1ms;
    for (int i = 0; i < 60; ++i) {
        script->add(Loud(), 2);
        script->add(Quiet(), 2);
    }
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"complete", "sentence"});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(0);

    std::atomic<bool> ok{true};
    std::thread reader([&] {
        size_t last = 0;
        while (session.isRunning()) {
            const auto lines = session.readTranscript();
            if (lines.size() < last) ok = false;
            for (size_t i = 0; i < lines.size(); ++i) {
                if (lines[i].index != i || lines[i].text != "complete sentence") ok = false;
            }
            last = lines.size();
        }
    });
    reader.join();

    EXPECT_TRUE(ok.load());
    EXPECT_EQ(session.transcriptSize(), 60u);
}

TEST(RecordingSession, StopFromFreshThreadAfterEarlierLoop) {
    auto script = std::make_shared<AudioScript>();
    script->add(Loud(), 2);
    FakeAudioSource source(script);
    auto engine = FakeEngine::Saying({"x"});
    RecordingSession session(source, *engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));
    session.stop();

    // new threads are often handed the id of a loop thread that was joined
    script->endWhenEmpty = false;
    for (int i = 0; i < 50; ++i) {
        bool runningAfterStop = true;
        std::thread controller([&] {
            session.start(0);
            session.stop();
            runningAfterStop = session.isRunning();
        });
        controller.join();
        ASSERT_FALSE(runningAfterStop) << "run " << i;
    }
}

TEST(RecordingSession, AnyEngineExceptionDropsOnlyThatSegment) {
    auto script = std::make_shared<AudioScript>();
    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    FakeAudioSource source(script);
    FakeEngine engine([](int call, const std::vector<float>&) -> std::vector<std::string> {
        if (call == 0) throw std::runtime_error("temp dir unavailable");
        return {"recovered"};
    });
    RecordingSession session(source, engine, QuickConfig());

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return !session.isRunning(); }));

    const auto status = session.status();
    EXPECT_FALSE(status.lastError);
    EXPECT_EQ(status.segmentsDropped, 1u);
    ASSERT_EQ(session.transcriptSize(), 1u);
    EXPECT_EQ(session.readTranscript()[0].text, "recovered");
}

TEST(RecordingSession, StartFromSinkIsRejectedWhileStopping) {
    auto script = EndlessScript(1ms);
    script->add(Loud(), 2);
    script->add(Quiet(), 2);
    FakeAudioSource source(script);
    auto engine = FakeEngine::HearingSpeech({"restart"});
    RecordingSession session(source, *engine, QuickConfig());

    std::atomic<bool> inSink{false};
    std::atomic<bool> rejected{false};

    class RestartingSink : public ITranscriptSink {
    public:
        RestartingSink(RecordingSession& session, std::atomic<bool>& inSink, std::atomic<bool>& rejected)
            : session_(session), inSink_(inSink), rejected_(rejected) {}
        void onLine(const TranscriptLine&) override {
            inSink_ = true;
            // give the other thread time to enter stop()
            std::this_thread::sleep_for(100ms);
            try {
                session_.start(0);
            } catch (const AlreadyRecordingError&) {
                rejected_ = true;
            }
        }

    private:
        RecordingSession& session_;
        std::atomic<bool>& inSink_;
        std::atomic<bool>& rejected_;
    };
    session.addSink(std::make_shared<RestartingSink>(session, inSink, rejected));

    session.start(0);
    ASSERT_TRUE(WaitFor([&] { return inSink.load(); }));
    session.stop();

    EXPECT_TRUE(rejected.load());
    EXPECT_FALSE(session.isRunning());
}
