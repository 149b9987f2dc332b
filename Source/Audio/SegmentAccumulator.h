#pragma once

#include "AudioFrame.h"
#include "Config/SessionConfig.h"

#include <optional>
#include <vector>

struct ClosedSegment
{
    enum class Reason
    {
        Natural, // silence run after the minimum duration
        Forced   // hit maxSegmentSeconds, or flushed
    };

    AudioFrame::Samples samples;
    unsigned int sampleRate = 16000;
    double startSeconds = 0.0; // stream offset of the first sample
    Reason reason = Reason::Natural;

    double durationSeconds() const
    {
        return sampleRate ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

/**
 * Buffers frames until a segment should be transcribed.
 *
 * After every append: a run of silenceFramesToClose silent frames closes the
 * segment once it is longer than minSegmentSeconds; otherwise growing past
 * maxSegmentSeconds forces it closed. Closing hands the samples out and resets
 * the buffer and both counters.
 *
 * Not thread safe; owned by the single capture loop.
 */
class SegmentAccumulator
{
public:
    explicit SegmentAccumulator(const SegmentationConfig& config);

    std::optional<ClosedSegment> append(AudioFrame frame);

    // Hand out whatever is buffered as a forced segment.
    std::optional<ClosedSegment> flush();

    void reset();

    size_t bufferedFrames() const { return frames_.size(); }
    size_t bufferedSamples() const { return bufferedSamples_; }
    double bufferedSeconds() const;
    int consecutiveSilentFrames() const { return consecutiveSilentFrames_; }
    int silenceThreshold() const { return config_.silenceThreshold; }

private:
    std::optional<ClosedSegment> close(ClosedSegment::Reason reason);

    SegmentationConfig config_;
    std::vector<AudioFrame> frames_;
    int consecutiveSilentFrames_ = 0;
    unsigned int sampleRate_ = 0; // of the buffered frames
    size_t bufferedSamples_ = 0;

    size_t streamSamples_ = 0;    // everything appended since construction/reset
    size_t segmentStartSample_ = 0;
};
