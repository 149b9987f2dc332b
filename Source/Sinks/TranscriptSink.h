#pragma once

#include "Transcription/TranscriptLine.h"

// Receives each committed line once, in order, on the capture thread.
class ITranscriptSink
{
public:
    virtual ~ITranscriptSink() = default;
    virtual void onLine(const TranscriptLine& line) = 0;
};
