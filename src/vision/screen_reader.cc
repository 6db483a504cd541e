#include "screen_reader.h"

#include <cmath>
#include <cstdlib>

#include "common/errors.h"

namespace Roundwatch {

double ParseNumber(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c == ' ' || c == 'x' || c == 'X' || c == ',') {
            continue;
        }
        if ((c >= '0' && c <= '9') || c == '.') {
            cleaned.push_back(c);
        }
    }
    if (cleaned.empty()) {
        throw ReadError("No number in '" + text + "'");
    }

    char* end = nullptr;
    double value = std::strtod(cleaned.c_str(), &end);
    if (end == cleaned.c_str() || *end != '\0' || !std::isfinite(value)) {
        throw ReadError("Cannot parse number from '" + text + "'");
    }
    return value;
}

int64_t ParseCount(const std::string& text) {
    return static_cast<int64_t>(ParseNumber(text));
}

PlayerCounts ParsePlayerCounts(const std::string& text) {
    if (text.find('-') != std::string::npos) {
        throw ReadError("Negative player count in '" + text + "'");
    }
    size_t slash = text.find('/');
    if (slash == std::string::npos) {
        int64_t count = ParseCount(text);
        return PlayerCounts{count, count};
    }
    if (text.find('/', slash + 1) != std::string::npos) {
        throw ReadError("Expected current/total in '" + text + "'");
    }
    PlayerCounts counts;
    counts.current = ParseCount(text.substr(0, slash));
    counts.total = ParseCount(text.substr(slash + 1));
    return counts;
}

} // namespace Roundwatch
