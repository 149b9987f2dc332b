#include "SilenceDetector.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

int SilenceDetector::PeakAmplitude(const AudioFrame& frame)
{
    int peak = 0;
    for (int16_t s : frame.samples)
    {
        // widen first, -32768 has no int16_t magnitude
        peak = std::max(peak, std::abs(static_cast<int>(s)));
    }
    return peak;
}

bool SilenceDetector::IsSilent(const AudioFrame& frame, int threshold)
{
    return PeakAmplitude(frame) < threshold;
}

int SilenceDetector::CalibrateThreshold(const std::vector<AudioFrame>& ambientFrames,
                                        double multiplier, int floor)
{
    if (ambientFrames.empty()) return floor;

    double sum = 0.0;
    for (const AudioFrame& frame : ambientFrames) sum += PeakAmplitude(frame);
    const double mean = sum / static_cast<double>(ambientFrames.size());

    const int scaled = static_cast<int>(std::lround(mean * multiplier));
    return std::max(floor, scaled);
}
