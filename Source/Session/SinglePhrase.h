#pragma once

#include "Audio/AudioSource.h"
#include "Config/SessionConfig.h"
#include "Transcription/TranscriptLine.h"
#include "Transcription/TranscriptionEngine.h"

#include <atomic>
#include <optional>

/**
 * Listen for a single utterance and transcribe it.
 *
 * Waits up to startTimeoutSeconds for the first non-silent frame, then
 * accumulates until the segment closes (silence or max length) and returns
 * its text. Returns nothing on timeout, cancel, or when the engine hears no
 * speech. Throws DeviceUnavailableError, AudioDeviceError or
 * TranscriptionEngineError.
 */
std::optional<TranscriptLine> ListenOnce(IAudioSource& source, ITranscriptionEngine& engine,
                                         const SessionConfig& config, double startTimeoutSeconds,
                                         const std::atomic<bool>& cancel);
