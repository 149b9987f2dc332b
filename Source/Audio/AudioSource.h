#pragma once

#include "AudioFrame.h"

#include <memory>
#include <string>
#include <vector>

struct InputDeviceInfo
{
    int index = -1;
    std::string name;        // id to open ("default", "hw:CARD=PCH,DEV=0", a file path)
    std::string description; // human readable, may be empty
};

/**
 * An open capture stream. Only the capture loop that opened it may read from it.
 */
class IAudioStream
{
public:
    enum class ReadStatus
    {
        Ok,          // frame holds a full frame
        Overflow,    // samples were dropped; frame is unspecified, keep reading
        EndOfStream, // no more input (file sources)
        Fatal        // device is gone; stop reading
    };

    virtual ~IAudioStream() = default;

    /**
     * Block until a full frame is available.
     * On Fatal, errorText() describes the failure.
     */
    virtual ReadStatus readFrame(AudioFrame& frame) = 0;

    virtual void close() = 0;

    virtual unsigned int sampleRate() const = 0;
    virtual size_t frameSize() const = 0;
    virtual std::string errorText() const { return {}; }
};

class IAudioSource
{
public:
    virtual ~IAudioSource() = default;

    // Throws DeviceUnavailableError when the index is unknown or the device cannot be opened.
    virtual std::unique_ptr<IAudioStream> open(int deviceIndex, unsigned int sampleRate,
                                               size_t frameSize) = 0;

    virtual std::vector<InputDeviceInfo> listInputDevices() = 0;
};
