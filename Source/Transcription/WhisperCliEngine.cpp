#include "WhisperCliEngine.h"
#include "Audio/WavFile.h"
#include "Core/Errors.h"
#include "TextUtil.h"

#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>

namespace {
std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

// removes the temporary WAV on every exit path
struct TempFile {
    std::filesystem::path path;
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};
} // namespace

WhisperCliEngine::WhisperCliEngine(std::string cliPath, std::string modelPath, int threads,
                                   bool verbose)
    : cliPath_(std::move(cliPath)), modelPath_(std::move(modelPath)), threads_(threads),
      verbose_(verbose) {}

std::string WhisperCliEngine::buildCommand(const std::string& wavPath,
                                           const std::string& languageHint) const {
    std::string command = shellQuote(cliPath_) + " -m " + shellQuote(modelPath_) + " -l " +
                          shellQuote(languageHint) + " -nt -np";
    if (threads_ > 0) command += " -t " + std::to_string(threads_);
    command += " -f " + shellQuote(wavPath);
    if (!verbose_) command += " 2>/dev/null";
    return command;
}

std::vector<std::string> WhisperCliEngine::transcribe(const std::vector<float>& samples,
                                                      unsigned int sampleRate,
                                                      const std::string& languageHint) {
    if (samples.empty()) return {};

    std::vector<int16_t> pcm16;
    pcm16.reserve(samples.size());
    for (float f : samples) {
        const long v = std::lround(std::clamp(f, -1.0f, 1.0f) * 32767.0f);
        pcm16.push_back(static_cast<int16_t>(v));
    }

    TempFile wav;
    wav.path = std::filesystem::temp_directory_path() /
               ("livescribe_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter_.fetch_add(1)) + ".wav");
    if (!WAVFile::Write(wav.path.string(), pcm16, sampleRate)) {
        throw TranscriptionEngineError("cannot write temporary WAV " + wav.path.string());
    }

    const std::string command = buildCommand(wav.path.string(), languageHint);
    if (verbose_) std::cout << "[WhisperCliEngine] " << command << std::endl;

    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        throw TranscriptionEngineError("cannot run " + cliPath_);
    }

    std::vector<std::string> fragments;
    std::string pending;
    char buffer[1024];
    while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        pending += buffer;
        if (pending.empty() || pending.back() != '\n') continue;

        std::string line = TrimWhitespace(pending);
        pending.clear();
        if (!line.empty() && !IsNonSpeechMarker(line)) fragments.push_back(std::move(line));
    }
    std::string tail = TrimWhitespace(pending);
    if (!tail.empty() && !IsNonSpeechMarker(tail)) fragments.push_back(std::move(tail));

    const int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw TranscriptionEngineError(cliPath_ + " failed (status " + std::to_string(status) + ")");
    }
    return fragments;
}
