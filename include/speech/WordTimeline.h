#ifndef DAE_SPEECH_WORDTIMELINE_H
#define DAE_SPEECH_WORDTIMELINE_H

#include <cstddef>
#include <string>
#include <vector>
#include "../core/AnalysisTypes.h"

namespace dae::speech {

/**
 * @brief True if the word ends with terminal punctuation (. ! ?), optionally
 *        followed by closing quotes or brackets.
 */
bool endsSentence(const std::string& word);

/**
 * @brief Normalized, read-only view of transcript tokens.
 *
 * Negative times are clamped to zero and a token's end is never before its
 * start. Token order is kept as produced by the transcriber.
 */
class WordTimeline {
public:
    WordTimeline() = default;
    explicit WordTimeline(std::vector<core::WordToken> words);

    size_t size() const { return m_words.size(); }
    bool empty() const { return m_words.empty(); }
    const core::WordToken& operator[](size_t i) const { return m_words[i]; }
    const std::vector<core::WordToken>& words() const { return m_words; }

    std::vector<core::WordToken>::const_iterator begin() const { return m_words.begin(); }
    std::vector<core::WordToken>::const_iterator end() const { return m_words.end(); }

    /**
     * @brief Silence between word i and word i + 1, never negative.
     */
    double gapAfter(size_t i) const;

private:
    std::vector<core::WordToken> m_words;
};

} // namespace dae::speech

#endif // DAE_SPEECH_WORDTIMELINE_H
