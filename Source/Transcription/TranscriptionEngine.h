#pragma once

#include "Config/SessionConfig.h"

#include <memory>
#include <string>
#include <vector>

/**
 * Speech to text capability.
 *
 * transcribe() receives mono float samples in [-1, 1] and returns the text
 * fragments it recognised, in order. Audio it could not understand yields an
 * empty list; failures throw TranscriptionEngineError.
 */
class ITranscriptionEngine
{
public:
    virtual ~ITranscriptionEngine() = default;

    virtual std::vector<std::string> transcribe(const std::vector<float>& samples,
                                                unsigned int sampleRate,
                                                const std::string& languageHint) = 0;

    virtual std::string name() const = 0;
};

// Picks the adapter named by config.name. Throws ConfigError for an unknown name
// and TranscriptionEngineError when the engine cannot be initialised.
std::unique_ptr<ITranscriptionEngine> CreateTranscriptionEngine(const EngineConfig& config,
                                                                bool verbose = false);
