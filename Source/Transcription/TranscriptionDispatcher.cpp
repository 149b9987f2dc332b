#include "TranscriptionDispatcher.h"
#include "TextUtil.h"

TranscriptionDispatcher::TranscriptionDispatcher(ITranscriptionEngine& engine,
                                                 std::string languageHint)
    : engine_(engine), languageHint_(std::move(languageHint)) {}

std::optional<TranscriptLine> TranscriptionDispatcher::dispatch(const ClosedSegment& segment) const {
    if (segment.samples.empty()) return std::nullopt;

    const std::vector<float> pcmf32 = Normalize(segment.samples);
    const std::vector<std::string> fragments =
        engine_.transcribe(pcmf32, segment.sampleRate, languageHint_);

    std::string text = JoinFragments(fragments);
    if (text.empty()) return std::nullopt;

    TranscriptLine line;
    line.text = std::move(text);
    line.startSeconds = segment.startSeconds;
    line.durationSeconds = segment.durationSeconds();
    return line;
}

std::vector<float> TranscriptionDispatcher::Normalize(const AudioFrame::Samples& samples) {
    std::vector<float> pcmf32;
    pcmf32.reserve(samples.size());
    constexpr float scale = 1.0f / 32768.0f;
    for (int16_t s : samples) pcmf32.push_back(static_cast<float>(s) * scale);
    return pcmf32;
}
