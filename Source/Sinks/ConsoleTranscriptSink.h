#pragma once

#include "TranscriptSink.h"

#include <iostream>

class ConsoleTranscriptSink : public ITranscriptSink
{
public:
    explicit ConsoleTranscriptSink(std::ostream& out = std::cout) : out(out) {}

    void onLine(const TranscriptLine& line) override;

private:
    std::ostream& out;
};
