#include "FileTranscriptSink.h"

#include <iostream>

FileTranscriptSink::FileTranscriptSink(std::string filename)
    : filename(std::move(filename)), lineQueue(kMaxQueuedLines)
{
}

FileTranscriptSink::~FileTranscriptSink()
{
    close();
}

bool FileTranscriptSink::open()
{
    // the line queue cannot be reopened once closed
    if (running.load() || lineQueue.closed()) return false;

    file.open(filename, std::ios::out | std::ios::app);
    if (!file.is_open())
    {
        std::cerr << "[FileTranscriptSink] Failed to open file for writing: " << filename << std::endl;
        return false;
    }

    running.store(true);
    writerThread.reset(new std::thread(&FileTranscriptSink::writerThreadFunc, this));
    std::cout << "[FileTranscriptSink] Appending transcript to " << filename << std::endl;
    return true;
}

void FileTranscriptSink::close()
{
    if (!running.load()) return;
    running.store(false);

    lineQueue.close();
    if (writerThread && writerThread->joinable()) writerThread->join();
    writerThread.reset();
    file.close();
}

void FileTranscriptSink::onLine(const TranscriptLine& line)
{
    if (!running.load() || !lineQueue.push(line))
    {
        std::cerr << "[FileTranscriptSink] Not open, dropping line " << line.index << std::endl;
    }
}

void FileTranscriptSink::writerThreadFunc()
{
    std::vector<TranscriptLine> batch;
    // drain keeps returning queued lines after close(), so nothing is lost
    while (lineQueue.drain(batch))
    {
        for (const auto& line : batch) file << line.text << '\n';
        file.flush();
        if (!file)
        {
            std::cerr << "[FileTranscriptSink] Write failed: " << filename << std::endl;
            file.clear();
            continue;
        }
        written += batch.size();
    }
}
