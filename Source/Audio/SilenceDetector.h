#pragma once

#include "AudioFrame.h"

#include <vector>

// Peak-amplitude voice activity test. No state between calls.
class SilenceDetector
{
public:
    static int PeakAmplitude(const AudioFrame& frame);

    // silent when the loudest sample is below threshold
    static bool IsSilent(const AudioFrame& frame, int threshold);

    /**
     * Threshold derived from ambient noise: mean frame peak scaled by multiplier,
     * never below floor. Returns floor when no frames are given.
     */
    static int CalibrateThreshold(const std::vector<AudioFrame>& ambientFrames, double multiplier,
                                  int floor);
};
