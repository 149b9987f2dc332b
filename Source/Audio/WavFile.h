#pragma once
#include <cstdint>
#include <string>
#include <vector>

class WAVFile
{
public:
    // 16-bit PCM mono only. Extra chunks (LIST, fact, ...) are skipped.
    static bool Read(const std::string& filePath, std::vector<int16_t>& outSamples,
                     unsigned int& outSampleRate);

    static bool Write(const std::string& filePath, const std::vector<int16_t>& samples,
                      unsigned int sampleRate);
};
