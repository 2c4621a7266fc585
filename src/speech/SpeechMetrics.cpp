#include "../../include/speech/SpeechMetrics.h"
#include "../../include/core/MathUtils.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <set>

namespace dae::speech {

namespace {

const std::set<std::string> kFillerWords = {
    "um", "uh", "like", "you know", "actually", "basically", "literally", "so"
};

bool isWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '\'';
}

// Length of the UTF-8 sequence starting with lead byte c, 0 for a stray continuation byte.
size_t utf8Length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

uint32_t decodeCodePoint(const std::string& text, size_t pos, size_t len) {
    uint32_t cp = static_cast<unsigned char>(text[pos]) & (0xFF >> (len + 1));
    for (size_t i = 1; i < len; ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
    }
    return cp;
}

// Non-ASCII letters and digits are word characters; the punctuation and symbol blocks are not.
bool isWordCodePoint(uint32_t cp) {
    if (cp >= 0x00A0 && cp <= 0x00BF) return false;   // Latin-1 punctuation and signs
    if (cp == 0x00D7 || cp == 0x00F7) return false;   // multiplication, division
    if (cp >= 0x2000 && cp <= 0x206F) return false;   // general punctuation (quotes, dashes)
    if (cp >= 0x20A0 && cp <= 0x2BFF) return false;   // currency, arrows, math, symbols
    if (cp >= 0x3000 && cp <= 0x303F) return false;   // CJK punctuation
    if (cp >= 0xFE30 && cp <= 0xFE4F) return false;
    if (cp >= 0xFF00 && cp <= 0xFF0F) return false;   // fullwidth punctuation
    if (cp >= 0x1F000) return false;                  // emoji and pictographs
    return true;
}

std::string toLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

} // namespace

std::vector<std::string> tokenize(const std::string& text) {
    const std::string lowered = toLower(text);
    std::vector<std::string> tokens;
    std::string current;
    size_t pos = 0;
    while (pos < lowered.size()) {
        const unsigned char c = static_cast<unsigned char>(lowered[pos]);
        size_t len = utf8Length(c);
        if (len == 0 || pos + len > lowered.size()) len = 1;

        bool word = false;
        if (c < 0x80) {
            word = isWordChar(c);
        } else if (len > 1) {
            word = isWordCodePoint(decodeCodePoint(lowered, pos, len));
        }

        if (word) {
            current.append(lowered, pos, len);
            // Latin-1 capitals (U+00C0..U+00DE) lowercase by +0x20 on the trailing byte.
            if (len == 2 && c == 0xC3) {
                auto& trail = reinterpret_cast<unsigned char&>(current.back());
                if (trail >= 0x80 && trail <= 0x9E && trail != 0x97) trail += 0x20;
            }
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
        pos += len;
    }
    if (!current.empty()) tokens.push_back(current);

    // Apostrophes are not word characters at a \b boundary: strip them from the edges.
    std::vector<std::string> cleaned;
    cleaned.reserve(tokens.size());
    for (auto& t : tokens) {
        size_t a = 0, b = t.size();
        while (a < b && t[a] == '\'') ++a;
        while (b > a && t[b - 1] == '\'') --b;
        if (b > a) cleaned.push_back(t.substr(a, b - a));
    }
    return cleaned;
}

std::vector<std::pair<std::string, int>> countFillerWords(const std::string& text) {
    const std::string lowered = toLower(text);
    std::vector<std::pair<std::string, int>> counts;

    for (const auto& token : tokenize(lowered)) {
        if (!kFillerWords.count(token)) continue;
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const auto& entry) { return entry.first == token; });
        if (it == counts.end()) counts.emplace_back(token, 1);
        else ++it->second;
    }

    const size_t phraseCount = countOccurrences(lowered, "you know");
    if (phraseCount > 0) {
        counts.emplace_back("you know", static_cast<int>(phraseCount));
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return counts;
}

int countStutterEvents(const std::vector<std::string>& tokens) {
    int events = 0;
    for (size_t i = 1; i < tokens.size(); ++i) {
        if (tokens[i] == tokens[i - 1]) ++events;
    }
    return events;
}

core::PaceLabel classifyPace(std::optional<double> wpm) {
    if (!wpm) return core::PaceLabel::Unknown;
    if (*wpm < kPaceSlowWpm) return core::PaceLabel::Slow;
    if (*wpm > kPaceFastWpm) return core::PaceLabel::Fast;
    return core::PaceLabel::Good;
}

core::SpeechMetrics buildSpeechMetrics(const std::string& transcript, double durationSeconds) {
    const auto tokens = tokenize(transcript);
    core::SpeechMetrics metrics;
    metrics.durationSeconds = core::roundTo(durationSeconds, 2);
    metrics.wordCount = static_cast<int>(tokens.size());
    metrics.fillerWords = countFillerWords(transcript);
    for (const auto& [word, count] : metrics.fillerWords) {
        metrics.fillerWordCount += count;
    }
    metrics.stutterEvents = countStutterEvents(tokens);

    std::optional<double> wpm;
    if (durationSeconds > 0.0) {
        wpm = static_cast<double>(tokens.size()) / durationSeconds * 60.0;
    }
    metrics.paceLabel = classifyPace(wpm);
    if (wpm) metrics.wordsPerMinute = core::roundTo(*wpm, 1);
    return metrics;
}

} // namespace dae::speech
