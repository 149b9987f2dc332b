#include "ConsoleTranscriptSink.h"

void ConsoleTranscriptSink::onLine(const TranscriptLine& line)
{
    out << "[segment " << line.index << "] " << line.text << std::endl;
}
