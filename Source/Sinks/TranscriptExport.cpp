#include "TranscriptExport.h"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

std::string TranscriptToJson(const std::vector<TranscriptLine>& lines)
{
    nlohmann::json transcriptJson;
    transcriptJson["lines"] = nlohmann::json::array();

    double totalSeconds = 0.0;
    size_t totalWords = 0;
    for (const auto& line : lines)
    {
        transcriptJson["lines"].push_back({
            {"index", line.index},
            {"text", line.text},
            {"startSeconds", line.startSeconds},
            {"durationSeconds", line.durationSeconds}
        });
        totalSeconds += line.durationSeconds;

        bool inWord = false;
        for (char c : line.text)
        {
            const bool space = (c == ' ');
            if (!space && !inWord) ++totalWords;
            inWord = !space;
        }
    }

    transcriptJson["totals"] = {
        {"lineCount", lines.size()},
        {"wordCount", totalWords},
        {"speechSeconds", totalSeconds}
    };
    return transcriptJson.dump(4);
}

bool WriteTranscriptJson(const std::string& filename, const std::vector<TranscriptLine>& lines)
{
    std::cout << "[TranscriptExport] Writing transcript to file: " << filename << std::endl;

    std::ofstream ofs(filename);
    if (!ofs.is_open())
    {
        std::cerr << "[TranscriptExport] Failed to open file for writing: " << filename << std::endl;
        return false;
    }

    ofs << TranscriptToJson(lines) << std::endl;
    if (!ofs)
    {
        std::cerr << "[TranscriptExport] Write failed: " << filename << std::endl;
        return false;
    }
    return true;
}
