#pragma once

#include "Audio/AudioSource.h"
#include "Config/SessionConfig.h"

#include <atomic>

/**
 * Reads config.calibrationSeconds of audio from the stream and returns the
 * silence threshold to use for this run. Returns config.silenceThreshold
 * unchanged when calibration is off. Overflowed reads are skipped, end of input
 * calibrates on what was read, a fatal read throws AudioDeviceError.
 */
int MeasureAmbientThreshold(IAudioStream& stream, const SegmentationConfig& config,
                            const std::atomic<bool>& cancel);
