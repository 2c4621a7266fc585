#include "../../include/pipeline/SidecarTranscriptProvider.h"
#include <filesystem>
#include <fstream>

namespace dae::pipeline {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

Transcript parseTranscript(const nlohmann::json& doc) {
    const nlohmann::json& words = doc.is_array() ? doc : doc.at("words");

    Transcript transcript;
    std::string joined;
    for (const auto& w : words) {
        core::WordToken token;
        token.word = trim(w.at("word").get<std::string>());
        token.start = w.value("start", 0.0);
        token.end = w.value("end", token.start);
        token.index = transcript.words.size();
        if (!joined.empty()) joined += ' ';
        joined += token.word;
        transcript.words.push_back(std::move(token));
    }

    if (doc.is_object() && doc.contains("transcript") && doc["transcript"].is_string()) {
        transcript.text = trim(doc["transcript"].get<std::string>());
    } else {
        transcript.text = joined;
    }
    if (doc.is_object() && doc.contains("notes")) {
        transcript.notes = doc["notes"].get<std::vector<std::string>>();
    }
    return transcript;
}

SidecarTranscriptProvider::SidecarTranscriptProvider(std::string path)
    : m_path(std::move(path)) {
}

core::Capability SidecarTranscriptProvider::capability() const {
    if (!m_path.empty() && !std::filesystem::exists(m_path)) {
        return core::Capability::no("Transcript file not found: " + m_path + ". Transcript unavailable.");
    }
    return core::Capability::yes();
}

core::Result<Transcript> SidecarTranscriptProvider::transcribe(const std::string& mediaPath) {
    const std::string path = m_path.empty() ? sidecarPathFor(mediaPath) : m_path;

    std::ifstream in(path);
    if (!in.is_open()) {
        return core::Result<Transcript>::degraded("No transcript found for this file. Returning analysis with empty transcript.");
    }

    try {
        nlohmann::json doc;
        in >> doc;
        return parseTranscript(doc);
    } catch (const nlohmann::json::exception& e) {
        return core::Result<Transcript>::degraded(
            std::string("Transcript file could not be parsed. Returning analysis with empty transcript. (") +
            e.what() + ")");
    }
}

} // namespace dae::pipeline
