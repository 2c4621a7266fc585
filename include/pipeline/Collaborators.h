#ifndef DAE_PIPELINE_COLLABORATORS_H
#define DAE_PIPELINE_COLLABORATORS_H

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/AnalysisTypes.h"
#include "../core/AudioBuffer.h"
#include "../core/Result.h"
#include "../vision/ILandmarkProvider.h"

namespace dae::pipeline {

/**
 * @brief Transcript text, timed words and any notes from the transcriber.
 */
struct Transcript {
    std::string text;
    std::vector<core::WordToken> words;
    std::vector<std::string> notes;
};

/**
 * @brief Speech-to-text engine. An empty transcript is a valid outcome.
 */
class ISpeechToText {
public:
    virtual ~ISpeechToText() = default;
    virtual core::Capability capability() const = 0;

    /**
     * @brief Transcribes the media file.
     * @return Index-ordered words, or Degraded when transcription could not run.
     */
    virtual core::Result<Transcript> transcribe(const std::string& mediaPath) = 0;
};

/**
 * @brief Decodes the media's audio track to normalized mono PCM.
 */
class IAudioDecoder {
public:
    virtual ~IAudioDecoder() = default;
    virtual core::Capability capability() const = 0;

    /**
     * @brief Decodes and resamples to sampleRate.
     * @return The mono buffer, or Degraded with a diagnostic (never throws for a
     *         missing tool or an unreadable codec).
     */
    virtual core::Result<core::AudioBuffer> decode(const std::string& mediaPath, int sampleRate) = 0;
};

/**
 * @brief Reads the media duration in seconds.
 */
class IDurationProbe {
public:
    virtual ~IDurationProbe() = default;
    virtual core::Capability capability() const = 0;
    virtual core::Result<double> probe(const std::string& mediaPath) = 0;
};

/**
 * @brief Hosted coaching model. Returns structured feedback as JSON.
 *
 * context carries {pace_label, words_per_minute, filler_word_count, non_verbal}.
 * Retries and safe defaults are the implementation's concern.
 */
class ICoachingModel {
public:
    virtual ~ICoachingModel() = default;
    virtual core::Capability capability() const = 0;
    virtual nlohmann::json coach(const std::vector<core::WordToken>& words,
                                 const nlohmann::json& context) = 0;
};

/**
 * @brief The external collaborators one pipeline works with. Any may be null.
 */
struct Collaborators {
    std::shared_ptr<ISpeechToText> speech;
    std::shared_ptr<vision::ILandmarkProvider> landmarks;
    std::shared_ptr<IAudioDecoder> decoder;
    std::shared_ptr<IDurationProbe> probe;
    std::shared_ptr<ICoachingModel> coaching;
};

} // namespace dae::pipeline

#endif // DAE_PIPELINE_COLLABORATORS_H
