#pragma once

#include <stdexcept>
#include <string>

// Base for every error LiveScribe throws on purpose.
class LiveScribeError : public std::runtime_error
{
public:
    explicit LiveScribeError(const std::string& what) : std::runtime_error(what) {}
};

// No such input device, or the device refused to open with the requested format.
class DeviceUnavailableError : public LiveScribeError
{
public:
    explicit DeviceUnavailableError(const std::string& what) : LiveScribeError(what) {}
};

// start() on a session that already has a capture loop.
class AlreadyRecordingError : public LiveScribeError
{
public:
    AlreadyRecordingError() : LiveScribeError("session is already recording") {}
};

// A read failed and the device could not be recovered.
class AudioDeviceError : public LiveScribeError
{
public:
    explicit AudioDeviceError(const std::string& what) : LiveScribeError(what) {}
};

// The transcription engine failed for one segment.
class TranscriptionEngineError : public LiveScribeError
{
public:
    explicit TranscriptionEngineError(const std::string& what) : LiveScribeError(what) {}
};

class ConfigError : public LiveScribeError
{
public:
    explicit ConfigError(const std::string& what) : LiveScribeError(what) {}
};
