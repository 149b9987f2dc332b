#pragma once

#include "Core/BoundedQueue.h"
#include "TranscriptSink.h"

#include <atomic>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/**
 * Appends one line of text per transcript line to a file.
 * Writes happen on a dedicated thread so a slow disk never stalls capture;
 * close() drains everything queued before returning. A sink opens once.
 */
class FileTranscriptSink : public ITranscriptSink
{
public:
    explicit FileTranscriptSink(std::string filename);
    ~FileTranscriptSink() override;

    bool open();
    void close();
    bool isOpen() const { return running.load(); }

    void onLine(const TranscriptLine& line) override;

    size_t linesWritten() const { return written.load(); }

private:
    static constexpr size_t kMaxQueuedLines = 256;

    void writerThreadFunc();

    std::string filename;
    std::ofstream file;
    BoundedQueue<TranscriptLine> lineQueue;
    std::unique_ptr<std::thread> writerThread;
    std::atomic<bool> running{ false };
    std::atomic<size_t> written{ 0 };
};
