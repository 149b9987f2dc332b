#include "TranscriptionEngine.h"
#include "Core/Errors.h"
#include "WhisperCliEngine.h"
#include "WhisperEngine.h"

#include <iostream>

std::unique_ptr<ITranscriptionEngine> CreateTranscriptionEngine(const EngineConfig& config,
                                                                bool verbose)
{
    if (config.name == "whisper")
    {
        auto engine = std::make_unique<WhisperEngine>(config.threads, verbose);
        if (!engine->Initialize(config.modelPath))
        {
            throw TranscriptionEngineError("failed to load whisper model " + config.modelPath);
        }
        return engine;
    }
    if (config.name == "whisper-cli")
    {
        auto engine = std::make_unique<WhisperCliEngine>(config.cliPath, config.modelPath,
                                                         config.threads, verbose);
        std::cout << "[TranscriptionEngine] Using " << config.cliPath << std::endl;
        return engine;
    }
    throw ConfigError("unknown engine '" + config.name + "'");
}
