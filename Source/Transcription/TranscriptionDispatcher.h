#pragma once

#include "Audio/SegmentAccumulator.h"
#include "TranscriptLine.h"
#include "TranscriptionEngine.h"

#include <optional>
#include <string>
#include <vector>

/**
 * Turns a closed segment into a transcript line.
 *
 * Samples are scaled to [-1, 1], the engine's fragments are joined with single
 * spaces and trimmed. An empty result gives no line. Engine failures propagate
 * as TranscriptionEngineError; the dispatcher itself has no other side effects.
 */
class TranscriptionDispatcher {
public:
    TranscriptionDispatcher(ITranscriptionEngine& engine, std::string languageHint = "en");

    std::optional<TranscriptLine> dispatch(const ClosedSegment& segment) const;

    static std::vector<float> Normalize(const AudioFrame::Samples& samples);


private:
    ITranscriptionEngine& engine_;
    std::string languageHint_;
};
