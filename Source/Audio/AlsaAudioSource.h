#pragma once

#include "AudioSource.h"

#include <alsa/asoundlib.h>
#include <string>

class AlsaAudioStream : public IAudioStream
{
public:
    AlsaAudioStream(snd_pcm_t* pcmHandle, std::string deviceName, unsigned int sampleRate,
                    size_t frameSize);
    ~AlsaAudioStream() override;

    AlsaAudioStream(const AlsaAudioStream&) = delete;
    AlsaAudioStream& operator=(const AlsaAudioStream&) = delete;

    ReadStatus readFrame(AudioFrame& frame) override;
    void close() override;

    unsigned int sampleRate() const override { return rate; }
    size_t frameSize() const override { return frames; }
    std::string errorText() const override { return lastError; }

private:
    snd_pcm_t* pcmHandle{ nullptr };
    std::string deviceName;
    unsigned int rate;
    size_t frames;
    AudioFrame::Samples buffer;
    std::string lastError;
};

// Capture from ALSA PCM devices. Index -1 opens "default".
class AlsaAudioSource : public IAudioSource
{
public:
    std::unique_ptr<IAudioStream> open(int deviceIndex, unsigned int sampleRate,
                                       size_t frameSize) override;

    std::vector<InputDeviceInfo> listInputDevices() override;

private:
    std::string resolveDeviceName(int deviceIndex);
};
