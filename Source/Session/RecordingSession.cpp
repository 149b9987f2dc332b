#include "RecordingSession.h"
#include "AmbientCalibration.h"
#include "Audio/SilenceDetector.h"
#include "Audio/WavFile.h"
#include "Core/Errors.h"

#include <filesystem>
#include <iostream>

RecordingSession::RecordingSession(IAudioSource& source, ITranscriptionEngine& engine,
                                   SessionConfig config)
    : source_(source), engine_(engine), config_(std::move(config)),
      activeThreshold_(config_.segmentation.silenceThreshold) {
    config_.validate();
}

RecordingSession::~RecordingSession() { stop(); }

void RecordingSession::start(int deviceIndex) {
    // a sink on the capture thread; its own loop is still alive
    if (loopThreadId_.load() == std::this_thread::get_id()) throw AlreadyRecordingError();

    std::scoped_lock control(controlMutex_);

    {
        std::scoped_lock lock(stateMutex_);
        if (running_) throw AlreadyRecordingError();
    }
    // a loop that died on a device error is finished but not joined yet
    joinFinishedLoop();

    // throws DeviceUnavailableError; nothing has changed yet
    std::unique_ptr<IAudioStream> stream =
        source_.open(deviceIndex, config_.audio.sampleRate, config_.audio.frameSize);

    {
        std::scoped_lock lock(stateMutex_);
        running_ = true;
        selectedDevice_ = deviceIndex;
        lastError_.reset();
        activeThreshold_ = config_.segmentation.silenceThreshold;
        framesRead_ = 0;
        overflows_ = 0;
        segmentsClosed_ = 0;
        segmentsDropped_ = 0;
    }

    std::cout << "[RecordingSession] Recording started on device " << deviceIndex << " ("
              << stream->sampleRate() << " Hz, " << stream->frameSize() << " samples per frame, "
              << engine_.name() << ")" << std::endl;

    stopRequested_.store(false);
    loopThread_.reset(new std::thread(&RecordingSession::captureLoop, this, std::move(stream)));
    loopThreadId_.store(loopThread_->get_id());
}

void RecordingSession::stop() {
    if (loopThreadId_.load() == std::this_thread::get_id()) {
        // called from a sink on the capture thread; the loop exits on its own
        // and the next start()/stop() joins it
        stopRequested_.store(true);
        return;
    }

    std::scoped_lock control(controlMutex_);
    if (!loopThread_) return;

    stopRequested_.store(true);
    joinFinishedLoop();
    std::cout << "[RecordingSession] Recording stopped." << std::endl;
}

void RecordingSession::joinFinishedLoop() {
    if (loopThread_ && loopThread_->joinable()) loopThread_->join();
    loopThread_.reset();
    // a later thread may be handed the same id
    loopThreadId_.store(std::thread::id());
}

RecordingSession::Status RecordingSession::status() const {
    std::scoped_lock lock(stateMutex_);
    Status s;
    s.isRunning = running_;
    s.selectedDeviceIndex = selectedDevice_;
    s.lastError = lastError_;
    s.silenceThreshold = activeThreshold_;
    s.framesRead = framesRead_;
    s.overflows = overflows_;
    s.segmentsClosed = segmentsClosed_;
    s.segmentsDropped = segmentsDropped_;
    return s;
}

bool RecordingSession::isRunning() const {
    std::scoped_lock lock(stateMutex_);
    return running_;
}

std::vector<TranscriptLine> RecordingSession::readTranscript() const {
    std::scoped_lock lock(stateMutex_);
    return transcript_;
}

size_t RecordingSession::transcriptSize() const {
    std::scoped_lock lock(stateMutex_);
    return transcript_.size();
}

void RecordingSession::clear() {
    std::scoped_lock lock(stateMutex_);
    transcript_.clear();
}

void RecordingSession::addSink(std::shared_ptr<ITranscriptSink> sink) {
    if (!sink) return;
    std::scoped_lock lock(stateMutex_);
    sinks_.push_back(std::move(sink));
}

void RecordingSession::captureLoop(std::unique_ptr<IAudioStream> stream) {
    // start() stores it too, but a sink may run before start() returns
    loopThreadId_.store(std::this_thread::get_id());
    std::optional<std::string> fatal;

    try {
        SegmentationConfig segmentation = config_.segmentation;
        segmentation.silenceThreshold = MeasureAmbientThreshold(*stream, segmentation, stopRequested_);
        {
            std::scoped_lock lock(stateMutex_);
            activeThreshold_ = segmentation.silenceThreshold;
        }

        SegmentAccumulator accumulator(segmentation);
        TranscriptionDispatcher dispatcher(engine_, config_.engine.language);

        while (!stopRequested_.load()) {
            AudioFrame frame;
            IAudioStream::ReadStatus status = stream->readFrame(frame);

            // stop wins over whatever the read produced
            if (stopRequested_.load()) break;

            if (status == IAudioStream::ReadStatus::Overflow) {
                std::scoped_lock lock(stateMutex_);
                ++overflows_;
                continue;
            }
            if (status == IAudioStream::ReadStatus::EndOfStream) {
                std::cout << "[RecordingSession] End of input" << std::endl;
                // the input is complete, so the tail is a whole utterance
                if (auto tail = accumulator.flush()) handleSegment(dispatcher, *tail);
                break;
            }
            if (status == IAudioStream::ReadStatus::Fatal) {
                fatal = stream->errorText().empty() ? std::string("audio device failed")
                                                    : stream->errorText();
                break;
            }

            {
                std::scoped_lock lock(stateMutex_);
                ++framesRead_;
            }
            if (config_.verbose) {
                std::cout << "[RecordingSession] peak " << SilenceDetector::PeakAmplitude(frame)
                          << "/" << accumulator.silenceThreshold() << " buffered "
                          << accumulator.bufferedSeconds() << " s" << std::endl;
            }

            if (auto segment = accumulator.append(std::move(frame))) {
                handleSegment(dispatcher, *segment);
            }
        }
    } catch (const std::exception& e) {
        fatal = e.what();
    }

    stream->close();

    std::scoped_lock lock(stateMutex_);
    running_ = false;
    if (fatal) {
        std::cerr << "[RecordingSession] Capture loop stopped: " << *fatal << std::endl;
        lastError_ = fatal;
    }
}

void RecordingSession::handleSegment(const TranscriptionDispatcher& dispatcher,
                                     const ClosedSegment& segment) {
    size_t number = 0;
    {
        std::scoped_lock lock(stateMutex_);
        number = segmentsClosed_++;
    }

    if (config_.verbose) {
        std::cout << "[RecordingSession] Segment " << number << " closed ("
                  << (segment.reason == ClosedSegment::Reason::Natural ? "silence" : "max length")
                  << ", " << segment.durationSeconds() << " s)" << std::endl;
    }
    if (!config_.output.segmentDumpDir.empty()) dumpSegment(segment, number);

    // no lock held while the engine runs
    std::optional<TranscriptLine> line;
    try {
        line = dispatcher.dispatch(segment);
    } catch (const std::exception& e) {
        // whatever the engine throws costs this segment only
        std::cerr << "[RecordingSession] Dropping segment " << number << ": " << e.what() << std::endl;
        std::scoped_lock lock(stateMutex_);
        ++segmentsDropped_;
        return;
    }

    if (line) commitLine(std::move(*line));
}

void RecordingSession::commitLine(TranscriptLine line) {
    std::vector<std::shared_ptr<ITranscriptSink>> sinks;
    {
        std::scoped_lock lock(stateMutex_);
        line.index = transcript_.size();
        transcript_.push_back(line);
        sinks = sinks_;
    }

    for (const auto& sink : sinks) {
        try {
            sink->onLine(line);
        } catch (const std::exception& e) {
            std::cerr << "[RecordingSession] Transcript sink failed: " << e.what() << std::endl;
        }
    }
}

void RecordingSession::dumpSegment(const ClosedSegment& segment, size_t number) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(config_.output.segmentDumpDir, ec);
    if (ec) {
        std::cerr << "[RecordingSession] Cannot create " << config_.output.segmentDumpDir << ": "
                  << ec.message() << std::endl;
        return;
    }

    const fs::path path =
        fs::path(config_.output.segmentDumpDir) / ("segment_" + std::to_string(number) + ".wav");
    WAVFile::Write(path.string(), segment.samples, segment.sampleRate);
}
