#include "TextUtil.h"

namespace
{
const char* kWhitespace = " \t\r\n\f\v";
}

std::string TrimWhitespace(const std::string& text)
{
    const size_t a = text.find_first_not_of(kWhitespace);
    if (a == std::string::npos) return {};
    const size_t b = text.find_last_not_of(kWhitespace);
    return text.substr(a, b - a + 1);
}

std::string JoinFragments(const std::vector<std::string>& fragments)
{
    std::string joined;
    for (const std::string& fragment : fragments)
    {
        std::string piece = TrimWhitespace(fragment);
        if (piece.empty()) continue;
        if (!joined.empty()) joined += ' ';
        joined += piece;
    }
    return joined;
}

bool IsNonSpeechMarker(const std::string& text)
{
    if (text.size() < 2) return false;
    const char open = text.front();
    const char close = text.back();
    if (!((open == '[' && close == ']') || (open == '(' && close == ')'))) return false;
    // "[a] and [b]" is speech with annotations, not a single marker
    return text.find(close) == text.size() - 1;
}
