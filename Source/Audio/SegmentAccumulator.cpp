#include "SegmentAccumulator.h"
#include "SilenceDetector.h"

SegmentAccumulator::SegmentAccumulator(const SegmentationConfig& config) : config_(config) {}

std::optional<ClosedSegment> SegmentAccumulator::append(AudioFrame frame) {
    if (SilenceDetector::IsSilent(frame, config_.silenceThreshold)) {
        ++consecutiveSilentFrames_;
    } else {
        consecutiveSilentFrames_ = 0;
    }

    if (frames_.empty()) {
        sampleRate_ = frame.sampleRate;
        segmentStartSample_ = streamSamples_;
    }
    bufferedSamples_ += frame.samples.size();
    streamSamples_ += frame.samples.size();
    frames_.push_back(std::move(frame));

    // durations come from whole sample counts so the limits never drift
    const double seconds = bufferedSeconds();
    if (consecutiveSilentFrames_ >= config_.silenceFramesToClose &&
        seconds > config_.minSegmentSeconds) {
        return close(ClosedSegment::Reason::Natural);
    }
    if (seconds > config_.maxSegmentSeconds) {
        return close(ClosedSegment::Reason::Forced);
    }
    return std::nullopt;
}

std::optional<ClosedSegment> SegmentAccumulator::flush() {
    return close(ClosedSegment::Reason::Forced);
}

void SegmentAccumulator::reset() {
    frames_.clear();
    consecutiveSilentFrames_ = 0;
    bufferedSamples_ = 0;
    streamSamples_ = 0;
    segmentStartSample_ = 0;
}

double SegmentAccumulator::bufferedSeconds() const {
    return sampleRate_ ? static_cast<double>(bufferedSamples_) / sampleRate_ : 0.0;
}

std::optional<ClosedSegment> SegmentAccumulator::close(ClosedSegment::Reason reason) {
    // counters alone never close an empty buffer
    if (frames_.empty()) return std::nullopt;

    ClosedSegment segment;
    segment.reason = reason;
    segment.sampleRate = sampleRate_;
    segment.startSeconds = sampleRate_ ? static_cast<double>(segmentStartSample_) / sampleRate_ : 0.0;

    segment.samples.reserve(bufferedSamples_);
    for (const AudioFrame& f : frames_) {
        segment.samples.insert(segment.samples.end(), f.samples.begin(), f.samples.end());
    }

    frames_.clear();
    consecutiveSilentFrames_ = 0;
    bufferedSamples_ = 0;
    return segment;
}
