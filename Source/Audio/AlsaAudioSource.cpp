#include "AlsaAudioSource.h"
#include "Core/Errors.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace
{
constexpr unsigned int kChannels = 1;
// periods of headroom the driver keeps while the loop is busy transcribing
constexpr snd_pcm_uframes_t kBufferFrames = 8;

std::string alsaError(const std::string& what, int err)
{
    return what + ": " + snd_strerror(err);
}
} // namespace

AlsaAudioStream::AlsaAudioStream(snd_pcm_t* pcmHandle, std::string deviceName,
                                 unsigned int sampleRate, size_t frameSize)
    : pcmHandle(pcmHandle), deviceName(std::move(deviceName)), rate(sampleRate),
      frames(frameSize)
{
    buffer.resize(frames * kChannels);
}

AlsaAudioStream::~AlsaAudioStream()
{
    close();
}

IAudioStream::ReadStatus AlsaAudioStream::readFrame(AudioFrame& frame)
{
    if (!pcmHandle)
    {
        lastError = "stream is closed";
        return ReadStatus::Fatal;
    }

    // snd_pcm_readi may return short reads; keep going until the frame is full
    size_t filled = 0;
    while (filled < frames)
    {
        snd_pcm_sframes_t pcm =
            snd_pcm_readi(pcmHandle, buffer.data() + filled * kChannels, frames - filled);

        if (pcm == -EPIPE)
        {
            std::cerr << "[AlsaAudioSource] Overrun occurred on " << deviceName << std::endl;
            snd_pcm_prepare(pcmHandle);
            return ReadStatus::Overflow;
        }
        else if (pcm == -EAGAIN)
        {
            continue;
        }
        else if (pcm < 0)
        {
            int err = snd_pcm_recover(pcmHandle, static_cast<int>(pcm), 1);
            if (err < 0)
            {
                lastError = alsaError("Error from read on " + deviceName, static_cast<int>(pcm));
                std::cerr << "[AlsaAudioSource] " << lastError << std::endl;
                return ReadStatus::Fatal;
            }
            // recovered, but the partial frame is no longer contiguous
            return ReadStatus::Overflow;
        }
        filled += static_cast<size_t>(pcm);
    }

    frame = AudioFrame(buffer, rate, kChannels);
    return ReadStatus::Ok;
}

void AlsaAudioStream::close()
{
    if (!pcmHandle) return;

    snd_pcm_drop(pcmHandle);
    snd_pcm_close(pcmHandle);
    pcmHandle = nullptr;
    std::cout << "[AlsaAudioSource] Closed " << deviceName << std::endl;
}

std::unique_ptr<IAudioStream> AlsaAudioSource::open(int deviceIndex, unsigned int sampleRate,
                                                    size_t frameSize)
{
    if (sampleRate == 0 || frameSize == 0)
    {
        throw DeviceUnavailableError("invalid sample rate or frame size");
    }

    const std::string deviceName = resolveDeviceName(deviceIndex);

    snd_pcm_t* pcmHandle = nullptr;
    int pcm = snd_pcm_open(&pcmHandle, deviceName.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (pcm < 0)
    {
        throw DeviceUnavailableError(alsaError("Can't open \"" + deviceName + "\" PCM device", pcm));
    }

    snd_pcm_hw_params_t* params = nullptr;
    snd_pcm_hw_params_malloc(&params);
    snd_pcm_hw_params_any(pcmHandle, params);

    unsigned int rate = sampleRate;
    snd_pcm_uframes_t framesPerPeriod = frameSize;
    snd_pcm_uframes_t bufferSize = frameSize * kBufferFrames;
    int dir = 0;

    snd_pcm_hw_params_set_access(pcmHandle, params, SND_PCM_ACCESS_RW_INTERLEAVED);
    snd_pcm_hw_params_set_format(pcmHandle, params, SND_PCM_FORMAT_S16_LE);
    snd_pcm_hw_params_set_channels(pcmHandle, params, kChannels);
    snd_pcm_hw_params_set_rate_near(pcmHandle, params, &rate, &dir);
    snd_pcm_hw_params_set_period_size_near(pcmHandle, params, &framesPerPeriod, &dir);
    snd_pcm_hw_params_set_buffer_size_near(pcmHandle, params, &bufferSize);

    pcm = snd_pcm_hw_params(pcmHandle, params);
    snd_pcm_hw_params_free(params);
    if (pcm < 0)
    {
        snd_pcm_close(pcmHandle);
        throw DeviceUnavailableError(alsaError("Can't set hardware parameters on " + deviceName, pcm));
    }

    if (rate != sampleRate)
    {
        snd_pcm_close(pcmHandle);
        throw DeviceUnavailableError(deviceName + " does not support " +
                                     std::to_string(sampleRate) + " Hz (nearest " +
                                     std::to_string(rate) + " Hz)");
    }

    pcm = snd_pcm_prepare(pcmHandle);
    if (pcm < 0)
    {
        snd_pcm_close(pcmHandle);
        throw DeviceUnavailableError(alsaError("Can't prepare " + deviceName, pcm));
    }

    std::cout << "[AlsaAudioSource] Opened " << deviceName << " at " << rate
              << " Hz, period " << framesPerPeriod << ", buffer " << bufferSize << std::endl;
    return std::make_unique<AlsaAudioStream>(pcmHandle, deviceName, rate, frameSize);
}

std::vector<InputDeviceInfo> AlsaAudioSource::listInputDevices()
{
    std::vector<InputDeviceInfo> devices;

    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) < 0)
    {
        std::cerr << "[AlsaAudioSource] snd_device_name_hint failed" << std::endl;
        return devices;
    }

    for (void** hint = hints; *hint != nullptr; ++hint)
    {
        char* name = snd_device_name_get_hint(*hint, "NAME");
        char* desc = snd_device_name_get_hint(*hint, "DESC");
        char* ioid = snd_device_name_get_hint(*hint, "IOID");

        // IOID is absent for devices that do both directions
        const bool isInput = (ioid == nullptr) || (std::strcmp(ioid, "Input") == 0);
        if (name && isInput && std::strcmp(name, "null") != 0)
        {
            InputDeviceInfo info;
            info.index = static_cast<int>(devices.size());
            info.name = name;
            if (desc)
            {
                info.description = desc;
                // DESC is multi-line; keep the first line
                auto nl = info.description.find('\n');
                if (nl != std::string::npos) info.description.resize(nl);
            }
            devices.push_back(std::move(info));
        }

        free(name);
        free(desc);
        free(ioid);
    }

    snd_device_name_free_hint(hints);
    return devices;
}

std::string AlsaAudioSource::resolveDeviceName(int deviceIndex)
{
    if (deviceIndex < 0) return "default";

    std::vector<InputDeviceInfo> devices = listInputDevices();
    if (deviceIndex >= static_cast<int>(devices.size()))
    {
        throw DeviceUnavailableError("no input device with index " + std::to_string(deviceIndex) +
                                     " (" + std::to_string(devices.size()) + " available)");
    }
    return devices[deviceIndex].name;
}
