#include "SinglePhrase.h"
#include "AmbientCalibration.h"
#include "Audio/SegmentAccumulator.h"
#include "Audio/SilenceDetector.h"
#include "Core/Errors.h"
#include "Transcription/TranscriptionDispatcher.h"

#include <iostream>

std::optional<TranscriptLine> ListenOnce(IAudioSource& source, ITranscriptionEngine& engine,
                                         const SessionConfig& config, double startTimeoutSeconds,
                                         const std::atomic<bool>& cancel) {
    config.validate();

    std::unique_ptr<IAudioStream> stream =
        source.open(config.audio.deviceIndex, config.audio.sampleRate, config.audio.frameSize);

    SegmentationConfig segmentation = config.segmentation;
    segmentation.silenceThreshold = MeasureAmbientThreshold(*stream, segmentation, cancel);

    SegmentAccumulator accumulator(segmentation);
    TranscriptionDispatcher dispatcher(engine, config.engine.language);

    std::cout << "[ListenOnce] Listening for a single phrase..." << std::endl;

    bool speaking = false;
    double waitedSeconds = 0.0;
    std::optional<ClosedSegment> segment;

    while (!segment && !cancel.load()) {
        AudioFrame frame;
        IAudioStream::ReadStatus status = stream->readFrame(frame);
        if (status == IAudioStream::ReadStatus::Overflow) continue;
        if (status == IAudioStream::ReadStatus::EndOfStream) {
            segment = accumulator.flush();
            break;
        }
        if (status == IAudioStream::ReadStatus::Fatal) {
            const std::string reason = stream->errorText();
            stream->close();
            throw AudioDeviceError(reason.empty() ? "audio device failed" : reason);
        }

        if (!speaking) {
            if (SilenceDetector::IsSilent(frame, segmentation.silenceThreshold)) {
                waitedSeconds += frame.durationSeconds();
                if (startTimeoutSeconds > 0.0 && waitedSeconds >= startTimeoutSeconds) {
                    std::cout << "[ListenOnce] No speech within " << startTimeoutSeconds << " s"
                              << std::endl;
                    break;
                }
                continue;
            }
            speaking = true;
        }
        segment = accumulator.append(std::move(frame));
    }
    stream->close();

    if (!segment) return std::nullopt;

    std::cout << "[ListenOnce] Processing " << segment->durationSeconds() << " s..." << std::endl;
    return dispatcher.dispatch(*segment);
}
