#include "WavFile.h"
#include "WavHeader.h"

#include <cstring>
#include <fstream>
#include <iostream>

namespace
{
struct ChunkHeader
{
    char id[4];
    uint32_t size;
};

bool idEquals(const char* id, const char* expected)
{
    return std::memcmp(id, expected, 4) == 0;
}
} // namespace

bool WAVFile::Read(const std::string& filePath, std::vector<int16_t>& outSamples,
                   unsigned int& outSampleRate)
{
    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile)
    {
        std::cerr << "[WAVFile] Failed to open WAV file: " << filePath << std::endl;
        return false;
    }

    char riff[4];
    uint32_t riffSize = 0;
    char wave[4];
    inFile.read(riff, 4);
    inFile.read(reinterpret_cast<char*>(&riffSize), sizeof(riffSize));
    inFile.read(wave, 4);
    if (!inFile || !idEquals(riff, "RIFF") || !idEquals(wave, "WAVE"))
    {
        std::cerr << "[WAVFile] Invalid WAV file format: " << filePath << std::endl;
        return false;
    }

    bool haveFormat = false;
    uint16_t audioFormat = 0;
    uint16_t numChannels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;

    ChunkHeader chunk;
    while (inFile.read(reinterpret_cast<char*>(&chunk), sizeof(chunk)))
    {
        if (idEquals(chunk.id, "fmt "))
        {
            if (chunk.size < 16)
            {
                std::cerr << "[WAVFile] Truncated fmt chunk: " << filePath << std::endl;
                return false;
            }
            uint32_t byteRate = 0;
            uint16_t blockAlign = 0;
            inFile.read(reinterpret_cast<char*>(&audioFormat), sizeof(audioFormat));
            inFile.read(reinterpret_cast<char*>(&numChannels), sizeof(numChannels));
            inFile.read(reinterpret_cast<char*>(&sampleRate), sizeof(sampleRate));
            inFile.read(reinterpret_cast<char*>(&byteRate), sizeof(byteRate));
            inFile.read(reinterpret_cast<char*>(&blockAlign), sizeof(blockAlign));
            inFile.read(reinterpret_cast<char*>(&bitsPerSample), sizeof(bitsPerSample));
            inFile.seekg(chunk.size - 16 + (chunk.size & 1), std::ios::cur);
            haveFormat = true;
        }
        else if (idEquals(chunk.id, "data"))
        {
            if (!haveFormat)
            {
                std::cerr << "[WAVFile] data chunk before fmt chunk: " << filePath << std::endl;
                return false;
            }
            if (audioFormat != 1 || bitsPerSample != 16 || numChannels != 1)
            {
                std::cerr << "[WAVFile] Only 16-bit PCM mono is supported (format=" << audioFormat
                          << ", bits=" << bitsPerSample << ", channels=" << numChannels
                          << "): " << filePath << std::endl;
                return false;
            }

            outSamples.resize(chunk.size / sizeof(int16_t));
            inFile.read(reinterpret_cast<char*>(outSamples.data()),
                        outSamples.size() * sizeof(int16_t));
            // tolerate a data size that overstates the file length
            outSamples.resize(static_cast<size_t>(inFile.gcount()) / sizeof(int16_t));
            outSampleRate = sampleRate;
            return true;
        }
        else
        {
            inFile.seekg(chunk.size + (chunk.size & 1), std::ios::cur);
        }
    }

    std::cerr << "[WAVFile] No data chunk found: " << filePath << std::endl;
    return false;
}

bool WAVFile::Write(const std::string& filePath, const std::vector<int16_t>& samples,
                    unsigned int sampleRate)
{
    std::ofstream wavFile(filePath, std::ios::binary);
    if (!wavFile.is_open())
    {
        std::cerr << "[WAVFile] Failed to open file for writing: " << filePath << std::endl;
        return false;
    }

    const uint32_t bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    WAVHeader::ForPcm16(sampleRate, 1, bytes).writeTo(wavFile);
    wavFile.write(reinterpret_cast<const char*>(samples.data()), bytes);

    if (!wavFile)
    {
        std::cerr << "[WAVFile] Write failed: " << filePath << std::endl;
        return false;
    }
    return true;
}
