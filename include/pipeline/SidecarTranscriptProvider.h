#ifndef DAE_PIPELINE_SIDECARTRANSCRIPTPROVIDER_H
#define DAE_PIPELINE_SIDECARTRANSCRIPTPROVIDER_H

#include <string>
#include <nlohmann/json.hpp>
#include "Collaborators.h"

namespace dae::pipeline {

/**
 * @brief Parses a transcriber's JSON output.
 *
 * Accepts {"transcript": "...", "words": [{"word", "start", "end"}, ...]} or a
 * bare array of words. Words are trimmed and re-indexed by position; the text
 * is rebuilt from the words when absent.
 *
 * @throw nlohmann::json::exception on malformed input.
 */
Transcript parseTranscript(const nlohmann::json& doc);

/**
 * @brief Speech-to-text collaborator reading word timings produced ahead of time.
 *
 * By default the file sits next to the media as "<media>.words.json".
 */
class SidecarTranscriptProvider : public ISpeechToText {
public:
    /**
     * @param path Explicit transcript file. When empty the sidecar name is derived per media file.
     */
    explicit SidecarTranscriptProvider(std::string path = "");

    core::Capability capability() const override;
    core::Result<Transcript> transcribe(const std::string& mediaPath) override;

    static std::string sidecarPathFor(const std::string& mediaPath) { return mediaPath + ".words.json"; }

private:
    std::string m_path;
};

} // namespace dae::pipeline

#endif // DAE_PIPELINE_SIDECARTRANSCRIPTPROVIDER_H
