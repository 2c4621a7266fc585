#include "../../include/speech/WordTimeline.h"
#include <algorithm>
#include <cctype>

namespace dae::speech {

bool endsSentence(const std::string& word) {
    // Trim trailing whitespace, then any closing quotes/brackets.
    size_t end = word.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(word[end - 1]))) --end;
    while (end > 0) {
        const char c = word[end - 1];
        if (c == '"' || c == '\'' || c == ')' || c == ']') {
            --end;
            continue;
        }
        break;
    }
    if (end == 0) return false;
    const char last = word[end - 1];
    return last == '.' || last == '!' || last == '?';
}

WordTimeline::WordTimeline(std::vector<core::WordToken> words)
    : m_words(std::move(words)) {
    for (auto& w : m_words) {
        w.start = std::max(0.0, w.start);
        w.end = std::max(w.start, w.end);
    }
}

double WordTimeline::gapAfter(size_t i) const {
    if (i + 1 >= m_words.size()) return 0.0;
    return std::max(0.0, m_words[i + 1].start - m_words[i].end);
}

} // namespace dae::speech
