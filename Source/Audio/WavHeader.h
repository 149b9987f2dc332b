#pragma once
#include <cstdint>
#include <ostream>

// RIFF/WAVE header for 16-bit PCM, laid out exactly as it sits on disk.
#pragma pack(push, 1)
struct WAVHeader
{
    char riffId[4] = {'R', 'I', 'F', 'F'};
    uint32_t riffSize = 36;
    char waveId[4] = {'W', 'A', 'V', 'E'};
    char fmtId[4] = {'f', 'm', 't', ' '};
    uint32_t fmtSize = 16;
    uint16_t audioFormat = 1; // PCM
    uint16_t numChannels = 1;
    uint32_t sampleRate = 16000;
    uint32_t byteRate = 32000;
    uint16_t blockAlign = 2;
    uint16_t bitsPerSample = 16;
    char dataId[4] = {'d', 'a', 't', 'a'};
    uint32_t dataSize = 0;

    static WAVHeader ForPcm16(uint32_t sampleRate, uint16_t channels, uint32_t dataBytes);

    void writeTo(std::ostream& out) const;
};
#pragma pack(pop)

static_assert(sizeof(WAVHeader) == 44, "WAVHeader must match the on-disk layout");
