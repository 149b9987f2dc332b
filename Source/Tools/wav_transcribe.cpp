#include "Audio/WavAudioSource.h"
#include "Config/SessionConfig.h"
#include "Core/Errors.h"
#include "Session/RecordingSession.h"
#include "Transcription/TranscriptionEngine.h"

#include <chrono>
#include <iostream>
#include <thread>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file.wav> [model.bin] [group.key=value ...]" << std::endl;
        return 1;
    }

    try {
        SessionConfig config;
        if (argc > 2) config.engine.modelPath = argv[2];
        for (int i = 3; i < argc; ++i) config.applyOverride(argv[i]);
        config.output.printToConsole = false;

        std::unique_ptr<ITranscriptionEngine> engine = CreateTranscriptionEngine(config.engine, config.verbose);

        WavAudioSource source(argv[1]);
        RecordingSession session(source, *engine, config);
        session.start(0);

        // the file source ends the loop itself once the tail is transcribed
        while (session.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        session.stop();

        const auto transcript = session.readTranscript();
        if (transcript.empty()) {
            std::cout << "No result" << std::endl;
        }
        for (const auto& line : transcript) {
            std::cout << "[" << line.startSeconds << "s] " << line.text << std::endl;
        }

        const RecordingSession::Status status = session.status();
        if (status.lastError) {
            std::cerr << "Failed: " << *status.lastError << std::endl;
            return 2;
        }
    } catch (const LiveScribeError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
