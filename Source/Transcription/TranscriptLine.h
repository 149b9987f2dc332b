#pragma once

#include <cstddef>
#include <string>

struct TranscriptLine
{
    size_t index = 0;             // position in the transcript, set when committed
    std::string text;             // never empty
    double startSeconds = 0.0;    // stream offset of the segment
    double durationSeconds = 0.0;
};
