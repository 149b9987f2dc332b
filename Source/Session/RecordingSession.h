#pragma once

#include "Audio/AudioSource.h"
#include "Audio/SegmentAccumulator.h"
#include "Config/SessionConfig.h"
#include "Sinks/TranscriptSink.h"
#include "Transcription/TranscriptLine.h"
#include "Transcription/TranscriptionDispatcher.h"
#include "Transcription/TranscriptionEngine.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * Owns one capture loop and the transcript it produces.
 *
 * Idle -> Recording -> Idle. start() opens the device and runs
 * read -> segment -> transcribe on a dedicated thread; every other call is
 * safe from any thread and never waits on the loop, except stop(), which
 * waits for the current frame read (and a transcription already in flight)
 * to finish.
 */
class RecordingSession {
public:
    struct Status {
        bool isRunning = false;
        std::optional<int> selectedDeviceIndex;
        std::optional<std::string> lastError; // why the last loop died, if it did
        int silenceThreshold = 0;             // in effect, after calibration
        size_t framesRead = 0;
        size_t overflows = 0;
        size_t segmentsClosed = 0;
        size_t segmentsDropped = 0;           // engine failures of any kind
    };

    RecordingSession(IAudioSource& source, ITranscriptionEngine& engine, SessionConfig config);
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    // Throws AlreadyRecordingError (also when called from a sink), or
    // DeviceUnavailableError (session stays Idle).
    void start(int deviceIndex);

    // Idempotent.
    void stop();

    Status status() const;
    bool isRunning() const;

    std::vector<TranscriptLine> readTranscript() const;
    size_t transcriptSize() const;

    // Empties the transcript; audio already buffered for the next segment is kept.
    void clear();

    // Sinks see each new line once, in order, on the capture thread.
    void addSink(std::shared_ptr<ITranscriptSink> sink);

private:
    void captureLoop(std::unique_ptr<IAudioStream> stream);
    void handleSegment(const TranscriptionDispatcher& dispatcher, const ClosedSegment& segment);
    void commitLine(TranscriptLine line);
    void dumpSegment(const ClosedSegment& segment, size_t number) const;
    void joinFinishedLoop();

    IAudioSource& source_;
    ITranscriptionEngine& engine_;
    const SessionConfig config_;

    // serialises start/stop so exactly one loop can exist
    std::mutex controlMutex_;
    std::unique_ptr<std::thread> loopThread_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<std::thread::id> loopThreadId_{};

    // guards everything below
    mutable std::mutex stateMutex_;
    bool running_ = false;
    std::optional<int> selectedDevice_;
    std::optional<std::string> lastError_;
    int activeThreshold_;
    size_t framesRead_ = 0;
    size_t overflows_ = 0;
    size_t segmentsClosed_ = 0;
    size_t segmentsDropped_ = 0;
    std::vector<TranscriptLine> transcript_;
    std::vector<std::shared_ptr<ITranscriptSink>> sinks_;
};
