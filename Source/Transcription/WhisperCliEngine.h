#pragma once

#include "TranscriptionEngine.h"

#include <atomic>
#include <string>

/**
 * Runs an external whisper-cli binary per segment: the samples are written to
 * a temporary 16-bit WAV and the text lines printed on stdout become fragments.
 */
class WhisperCliEngine : public ITranscriptionEngine
{
public:
    WhisperCliEngine(std::string cliPath, std::string modelPath, int threads = 0,
                     bool verbose = false);

    std::vector<std::string> transcribe(const std::vector<float>& samples,
                                        unsigned int sampleRate,
                                        const std::string& languageHint) override;

    std::string name() const override { return "whisper-cli"; }

    std::string buildCommand(const std::string& wavPath, const std::string& languageHint) const;

private:
    std::string cliPath_;
    std::string modelPath_;
    int threads_;
    bool verbose_;
    std::atomic<unsigned long> counter_{0};
};
