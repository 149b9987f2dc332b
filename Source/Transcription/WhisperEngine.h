#pragma once

#include "TranscriptionEngine.h"

#include <string>

// Forward-declare whisper types to avoid including the header in the public API.
extern "C" {
    struct whisper_context;
    struct whisper_state;
}

// In-process whisper.cpp. Not thread safe; one capture loop drives it.
class WhisperEngine : public ITranscriptionEngine
{
public:
    explicit WhisperEngine(int threads = 0, bool verbose = false);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    bool Initialize(const std::string& modelPath);

    std::vector<std::string> transcribe(const std::vector<float>& samples,
                                        unsigned int sampleRate,
                                        const std::string& languageHint) override;

    std::string name() const override { return "whisper"; }

    // Linear interpolation to whisper's fixed input rate.
    static std::vector<float> Resample(const std::vector<float>& samples, unsigned int fromRate,
                                       unsigned int toRate);

private:
    whisper_context* ctx_ = nullptr;
    whisper_state* state_ = nullptr;
    int threads_;
    bool verbose_;
};
