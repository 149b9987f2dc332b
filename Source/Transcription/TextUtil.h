#pragma once

#include <string>
#include <vector>

std::string TrimWhitespace(const std::string& text);

// Fragments are trimmed, empty ones skipped, the rest joined with single spaces.
std::string JoinFragments(const std::vector<std::string>& fragments);

// Whole-fragment annotations such as "[BLANK_AUDIO]" or "(music)".
bool IsNonSpeechMarker(const std::string& text);
