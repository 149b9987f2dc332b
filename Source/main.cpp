#include "Audio/AlsaAudioSource.h"
#include "Audio/WavAudioSource.h"
#include "Config/SessionConfig.h"
#include "Core/Errors.h"
#include "Session/RecordingSession.h"
#include "Session/SinglePhrase.h"
#include "Sinks/ConsoleTranscriptSink.h"
#include "Sinks/FileTranscriptSink.h"
#include "Sinks/TranscriptExport.h"
#include "Transcription/TranscriptionEngine.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace
{
std::atomic<bool> g_stop{ false };

void onSignal(int)
{
    g_stop.store(true);
}

struct Options
{
    std::string configPath;
    std::vector<std::string> overrides;
    std::string inputPath;
    bool deviceGiven = false;
    int device = -1;
    bool listDevices = false;
    bool once = false;
    double timeoutSeconds = 10.0;
    bool verbose = false;
};

void printUsage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config FILE        YAML configuration\n"
              << "  --set GROUP.KEY=VAL  override one setting (repeatable)\n"
              << "  --device N           input device index (-1 = default)\n"
              << "  --list-devices       list input devices and exit\n"
              << "  --input FILE.wav     transcribe a 16-bit mono WAV instead of a device\n"
              << "  --once               transcribe a single phrase and exit\n"
              << "  --timeout SECONDS    how long --once waits for speech (default 10)\n"
              << "  --verbose            per-frame diagnostics\n";
}

// false when the arguments are unusable; usage has been printed
bool parseArgs(int argc, char** argv, Options& opts)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--config") { if (!next(opts.configPath)) return false; }
        else if (arg == "--set") { if (!next(value)) return false; opts.overrides.push_back(value); }
        else if (arg == "--input") { if (!next(opts.inputPath)) return false; }
        else if (arg == "--device" || arg == "--timeout")
        {
            if (!next(value)) return false;
            try
            {
                if (arg == "--device") { opts.device = std::stoi(value); opts.deviceGiven = true; }
                else opts.timeoutSeconds = std::stod(value);
            }
            catch (const std::exception&)
            {
                std::cerr << "Invalid number for " << arg << ": " << value << std::endl;
                return false;
            }
        }
        else if (arg == "--list-devices") opts.listDevices = true;
        else if (arg == "--once") opts.once = true;
        else if (arg == "--verbose") opts.verbose = true;
        else
        {
            if (arg != "--help" && arg != "-h") std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}
} // namespace

int main(int argc, char** argv)
{
    try
    {
#pragma region Setup
        Options opts;
        if (!parseArgs(argc, argv, opts)) return 1;

        SessionConfig config;
        try
        {
            if (!opts.configPath.empty()) config = SessionConfig::FromYamlFile(opts.configPath);
            for (const auto& assignment : opts.overrides) config.applyOverride(assignment);
            if (opts.deviceGiven) config.audio.deviceIndex = opts.device;
            if (opts.verbose) config.verbose = true;
            config.validate();
        }
        catch (const ConfigError& e)
        {
            std::cerr << "Configuration error: " << e.what() << std::endl;
            return 1;
        }

        std::unique_ptr<IAudioSource> source;
        if (!opts.inputPath.empty()) source = std::make_unique<WavAudioSource>(opts.inputPath);
        else source = std::make_unique<AlsaAudioSource>();

        if (opts.listDevices)
        {
            std::cout << "\nAvailable input devices:" << std::endl;
            for (const auto& device : source->listInputDevices())
            {
                std::cout << "  [" << device.index << "] " << device.name;
                if (!device.description.empty()) std::cout << " - " << device.description;
                std::cout << std::endl;
            }
            return 0;
        }

        std::unique_ptr<ITranscriptionEngine> engine;
        try
        {
            engine = CreateTranscriptionEngine(config.engine, config.verbose);
        }
        catch (const TranscriptionEngineError& e)
        {
            std::cerr << "Cannot start transcription engine: " << e.what() << std::endl;
            return 1;
        }

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
#pragma endregion

#pragma region SinglePhrase
        if (opts.once)
        {
            try
            {
                auto line = ListenOnce(*source, *engine, config, opts.timeoutSeconds, g_stop);
                if (line) std::cout << "\nTranscribed: " << line->text << std::endl;
                else std::cout << "Could not understand audio" << std::endl;
                return 0;
            }
            catch (const DeviceUnavailableError& e)
            {
                std::cerr << "Error accessing input device: " << e.what() << std::endl;
                return 1;
            }
            catch (const LiveScribeError& e)
            {
                std::cerr << "Transcription failed: " << e.what() << std::endl;
                return 1;
            }
        }
#pragma endregion

#pragma region Continuous
        RecordingSession session(*source, *engine, config);

        if (config.output.printToConsole) session.addSink(std::make_shared<ConsoleTranscriptSink>());

        std::shared_ptr<FileTranscriptSink> fileSink;
        if (!config.output.transcriptFile.empty())
        {
            fileSink = std::make_shared<FileTranscriptSink>(config.output.transcriptFile);
            if (!fileSink->open()) return 1;
            session.addSink(fileSink);
        }

        try
        {
            session.start(config.audio.deviceIndex);
        }
        catch (const DeviceUnavailableError& e)
        {
            std::cerr << "Error accessing input device: " << e.what() << std::endl;
            std::cerr << "Use --list-devices to see the available inputs." << std::endl;
            return 1;
        }

        std::cout << "Listening... press Ctrl+C to stop." << std::endl;
        while (!g_stop.load() && session.isRunning())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        session.stop();

        if (fileSink) fileSink->close();

        const RecordingSession::Status status = session.status();
        std::cout << "Stopped listening. " << session.transcriptSize() << " lines, "
                  << status.segmentsClosed << " segments, " << status.overflows << " overruns."
                  << std::endl;

        if (!config.output.jsonFile.empty())
        {
            WriteTranscriptJson(config.output.jsonFile, session.readTranscript());
        }

        if (status.lastError)
        {
            std::cerr << "Capture failed: " << *status.lastError << std::endl;
            return 1;
        }
#pragma endregion

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
