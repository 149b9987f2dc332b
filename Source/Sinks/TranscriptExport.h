#pragma once

#include "Transcription/TranscriptLine.h"

#include <string>
#include <vector>

std::string TranscriptToJson(const std::vector<TranscriptLine>& lines);

bool WriteTranscriptJson(const std::string& filename, const std::vector<TranscriptLine>& lines);
