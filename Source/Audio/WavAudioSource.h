#pragma once

#include "AudioSource.h"

#include <string>

class WavAudioStream : public IAudioStream
{
public:
    WavAudioStream(AudioFrame::Samples samples, unsigned int sampleRate, size_t frameSize,
                   bool realtime);

    ReadStatus readFrame(AudioFrame& frame) override;
    void close() override { closed = true; }

    unsigned int sampleRate() const override { return rate; }
    size_t frameSize() const override { return frames; }

private:
    AudioFrame::Samples samples;
    unsigned int rate;
    size_t frames;
    size_t position = 0;
    bool realtime;
    bool closed = false;
};

/**
 * Plays a 16-bit mono WAV file as if it were a capture device.
 * The only device is index 0 (-1 is accepted as the default).
 * The last partial frame is padded with zeros.
 */
class WavAudioSource : public IAudioSource
{
public:
    // realtime: pace reads at the frame period instead of returning immediately
    explicit WavAudioSource(std::string filePath, bool realtime = false)
        : filePath(std::move(filePath)), realtime(realtime)
    {
    }

    std::unique_ptr<IAudioStream> open(int deviceIndex, unsigned int sampleRate,
                                       size_t frameSize) override;

    std::vector<InputDeviceInfo> listInputDevices() override;

private:
    std::string filePath;
    bool realtime;
};
