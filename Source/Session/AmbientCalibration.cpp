#include "AmbientCalibration.h"
#include "Audio/SilenceDetector.h"
#include "Core/Errors.h"

#include <iostream>
#include <vector>

int MeasureAmbientThreshold(IAudioStream& stream, const SegmentationConfig& config,
                            const std::atomic<bool>& cancel) {
    if (config.calibrationSeconds <= 0.0) return config.silenceThreshold;

    std::cout << "[Calibration] Measuring ambient noise for " << config.calibrationSeconds
              << " s..." << std::endl;

    std::vector<AudioFrame> ambient;
    double seconds = 0.0;
    while (seconds < config.calibrationSeconds && !cancel.load()) {
        AudioFrame frame;
        IAudioStream::ReadStatus status = stream.readFrame(frame);
        if (status == IAudioStream::ReadStatus::Overflow) continue;
        if (status == IAudioStream::ReadStatus::EndOfStream) break;
        if (status == IAudioStream::ReadStatus::Fatal) {
            throw AudioDeviceError("read failed during calibration: " + stream.errorText());
        }
        seconds += frame.durationSeconds();
        ambient.push_back(std::move(frame));
    }

    const int threshold = SilenceDetector::CalibrateThreshold(
        ambient, config.calibrationMultiplier, config.calibrationFloor);
    std::cout << "[Calibration] " << ambient.size() << " frames, silence threshold " << threshold
              << std::endl;
    return threshold;
}
