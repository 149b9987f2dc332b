#include "WhisperEngine.h"
#include "Core/Errors.h"
#include "TextUtil.h"

#include <whisper.h>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_verboseLog{false};

// keep ggml/whisper warnings and errors, info only when verbose
void logCallback(ggml_log_level level, const char* text, void*) {
    if (level == GGML_LOG_LEVEL_ERROR || level == GGML_LOG_LEVEL_WARN || g_verboseLog.load()) {
        std::fputs(text, stderr);
    }
}
} // namespace

WhisperEngine::WhisperEngine(int threads, bool verbose) : threads_(threads), verbose_(verbose) {}

WhisperEngine::~WhisperEngine() {
    if (state_) {
        whisper_free_state(state_);
        state_ = nullptr;
    }
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperEngine::Initialize(const std::string& modelPath) {
    if (ctx_) return true;

    g_verboseLog.store(verbose_);
    whisper_log_set(logCallback, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!ctx_) {
        std::cerr << "[WhisperEngine] Failed to initialize Whisper model from " << modelPath << std::endl;
        return false;
    }

    // persistent state for repeated calls
    state_ = whisper_init_state(ctx_);
    if (!state_) {
        std::cerr << "[WhisperEngine] whisper_init_state failed" << std::endl;
        whisper_free(ctx_);
        ctx_ = nullptr;
        return false;
    }

    std::cout << "[WhisperEngine] Loaded " << modelPath << std::endl;
    if (verbose_) std::cout << "[WhisperEngine] system: " << whisper_print_system_info() << std::endl;
    return true;
}

std::vector<std::string> WhisperEngine::transcribe(const std::vector<float>& samples,
                                                   unsigned int sampleRate,
                                                   const std::string& languageHint) {
    if (!ctx_ || !state_) throw TranscriptionEngineError("whisper model is not loaded");
    if (samples.empty()) return {};

    std::vector<float> pcmf32 = sampleRate == WHISPER_SAMPLE_RATE
                                    ? samples
                                    : Resample(samples, sampleRate, WHISPER_SAMPLE_RATE);

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.translate = false;
    wparams.no_context = true;
    wparams.language = languageHint.c_str();
    wparams.detect_language = false;
    wparams.n_threads = threads_ > 0
                            ? threads_
                            : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

    int ret = whisper_full_with_state(ctx_, state_, wparams, pcmf32.data(),
                                      static_cast<int>(pcmf32.size()));
    if (ret != 0) {
        throw TranscriptionEngineError("whisper_full_with_state failed: " + std::to_string(ret));
    }

    std::vector<std::string> fragments;
    const int nSegments = whisper_full_n_segments_from_state(state_);
    for (int i = 0; i < nSegments; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(state_, i);
        if (!txt) continue;

        std::string text = TrimWhitespace(txt);
        // [BLANK_AUDIO], [ Silence ], (music) and similar non-speech markers
        if (IsNonSpeechMarker(text)) continue;
        if (!text.empty()) fragments.push_back(std::move(text));
    }

    if (verbose_) whisper_print_timings(ctx_);
    return fragments;
}

std::vector<float> WhisperEngine::Resample(const std::vector<float>& samples, unsigned int fromRate,
                                           unsigned int toRate) {
    if (samples.empty() || fromRate == 0 || toRate == 0 || fromRate == toRate) return samples;

    const double ratio = static_cast<double>(fromRate) / toRate;
    const size_t outCount = static_cast<size_t>(samples.size() / ratio);
    std::vector<float> out;
    out.reserve(outCount);
    for (size_t i = 0; i < outCount; ++i) {
        const double pos = i * ratio;
        const size_t idx = static_cast<size_t>(pos);
        const double frac = pos - idx;
        const float a = samples[std::min(idx, samples.size() - 1)];
        const float b = samples[std::min(idx + 1, samples.size() - 1)];
        out.push_back(static_cast<float>(a + (b - a) * frac));
    }
    return out;
}
