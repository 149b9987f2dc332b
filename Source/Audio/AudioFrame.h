#pragma once

#include <cstdint>
#include <vector>

// One fixed-size block of mono 16-bit PCM as it came off the input stream.
struct AudioFrame
{
    using Samples = std::vector<int16_t>;

    AudioFrame() = default;
    AudioFrame(Samples samples, unsigned int sampleRate, unsigned int channels = 1)
        : samples(std::move(samples)), sampleRate(sampleRate), channels(channels)
    {
    }

    double durationSeconds() const
    {
        if (sampleRate == 0 || channels == 0) return 0.0;
        return static_cast<double>(samples.size()) / (static_cast<double>(sampleRate) * channels);
    }

    Samples samples;
    unsigned int sampleRate = 16000;
    unsigned int channels = 1;
};
