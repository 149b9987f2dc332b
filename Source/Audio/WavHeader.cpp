#include "WavHeader.h"

WAVHeader WAVHeader::ForPcm16(uint32_t sampleRate, uint16_t channels, uint32_t dataBytes)
{
    WAVHeader header;
    header.numChannels = channels;
    header.sampleRate = sampleRate;
    header.blockAlign = static_cast<uint16_t>(channels * sizeof(int16_t));
    header.byteRate = sampleRate * header.blockAlign;
    header.dataSize = dataBytes;
    header.riffSize = 36 + dataBytes;
    return header;
}

void WAVHeader::writeTo(std::ostream& out) const
{
    out.write(reinterpret_cast<const char*>(this), sizeof(WAVHeader));
}
