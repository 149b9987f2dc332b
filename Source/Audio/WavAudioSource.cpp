#include "WavAudioSource.h"
#include "Core/Errors.h"
#include "WavFile.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

WavAudioStream::WavAudioStream(AudioFrame::Samples samples, unsigned int sampleRate,
                               size_t frameSize, bool realtime)
    : samples(std::move(samples)), rate(sampleRate), frames(frameSize), realtime(realtime)
{
}

IAudioStream::ReadStatus WavAudioStream::readFrame(AudioFrame& frame)
{
    if (closed || position >= samples.size()) return ReadStatus::EndOfStream;

    const size_t count = std::min(frames, samples.size() - position);
    AudioFrame::Samples block(frames, 0);
    std::copy(samples.begin() + position, samples.begin() + position + count, block.begin());
    position += count;

    if (realtime)
    {
        std::this_thread::sleep_for(std::chrono::microseconds(frames * 1000000 / rate));
    }

    frame = AudioFrame(std::move(block), rate);
    return ReadStatus::Ok;
}

std::unique_ptr<IAudioStream> WavAudioSource::open(int deviceIndex, unsigned int sampleRate,
                                                   size_t frameSize)
{
    if (deviceIndex > 0)
    {
        throw DeviceUnavailableError("WAV source has a single device (index 0), got " +
                                     std::to_string(deviceIndex));
    }
    if (frameSize == 0)
    {
        throw DeviceUnavailableError("invalid frame size");
    }

    AudioFrame::Samples samples;
    unsigned int fileRate = 0;
    if (!WAVFile::Read(filePath, samples, fileRate))
    {
        throw DeviceUnavailableError("cannot read WAV input " + filePath);
    }
    if (fileRate != sampleRate)
    {
        throw DeviceUnavailableError(filePath + " is " + std::to_string(fileRate) +
                                     " Hz, session expects " + std::to_string(sampleRate) + " Hz");
    }

    std::cout << "[WavAudioSource] Opened " << filePath << " (" << samples.size() << " samples)"
              << std::endl;
    return std::make_unique<WavAudioStream>(std::move(samples), fileRate, frameSize, realtime);
}

std::vector<InputDeviceInfo> WavAudioSource::listInputDevices()
{
    InputDeviceInfo info;
    info.index = 0;
    info.name = filePath;
    info.description = "WAV file playback";
    return { info };
}
