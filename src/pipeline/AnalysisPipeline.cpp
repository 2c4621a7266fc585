#include "../../include/pipeline/AnalysisPipeline.h"
#include "../../include/pipeline/TimelineMarkerBuilder.h"
#include "../../include/core/JsonContract.h"
#include "../../include/speech/SpeechMetrics.h"
#include "../../include/speech/WordTimeline.h"
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace dae::pipeline {

namespace {

const char* kAudioModule = "AudioDelivery";
const char* kNonVerbalModule = "NonVerbal";

/**
 * @brief Removes the job's input file when it goes out of scope, if the job owns it.
 */
class ScopedArtifact {
public:
    ScopedArtifact(std::string path, bool owned) : m_path(std::move(path)), m_owned(owned) {}
    ~ScopedArtifact() {
        if (!m_owned || m_path.empty()) return;
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
        if (ec) {
            std::cerr << "[Pipeline] Failed to delete temp file " << m_path << ": " << ec.message() << std::endl;
        }
    }

    ScopedArtifact(const ScopedArtifact&) = delete;
    ScopedArtifact& operator=(const ScopedArtifact&) = delete;

private:
    std::string m_path;
    bool m_owned;
};

template<typename T>
core::Capability resolveCapability(const std::shared_ptr<T>& collaborator, const std::string& missing) {
    if (!collaborator) return core::Capability::no(missing);
    return collaborator->capability();
}

void appendNotes(std::vector<std::string>& target, const std::vector<std::string>& notes) {
    target.insert(target.end(), notes.begin(), notes.end());
}

} // namespace

/**
 * @brief Constructs the pipeline, registers its analyzers and resolves collaborator capabilities.
 */
AnalysisPipeline::AnalysisPipeline(Collaborators collaborators, PipelineConfig config)
    : m_collaborators(std::move(collaborators)), m_config(config)
{
    m_capabilities.speech = resolveCapability(m_collaborators.speech,
        "No speech-to-text provider configured. Returning analysis with empty transcript.");
    m_capabilities.landmarks = resolveCapability(m_collaborators.landmarks,
        "No landmark provider configured. Non-verbal analysis was skipped.");
    m_capabilities.decoder = resolveCapability(m_collaborators.decoder,
        "No audio decoder configured. Audio tonal analysis was skipped.");
    m_capabilities.probe = resolveCapability(m_collaborators.probe,
        "No duration probe configured. Using fallback duration.");
    m_capabilities.coaching = resolveCapability(m_collaborators.coaching,
        "No coaching model configured.");

    m_modules[kAudioModule] = ModuleInfo{&m_audioDelivery, nlohmann::json::object(), true};
    m_modules[kNonVerbalModule] = ModuleInfo{&m_nonVerbal, nlohmann::json::object(), true};
}

/**
 * @brief Default destructor for the AnalysisPipeline.
 */
AnalysisPipeline::~AnalysisPipeline() = default;

/**
 * @brief Enables or disables a specific analyzer by name.
 * @param name The name of the analyzer.
 * @param enabled true to enable, false to disable.
 */
void AnalysisPipeline::enableModule(const std::string& name, bool enabled) {
    auto it = m_modules.find(name);
    if (it != m_modules.end()) {
        it->second.enabled = enabled;
    }
}

/**
 * @brief Checks if a specific analyzer is currently enabled.
 * @param name The name of the analyzer.
 * @return true if the analyzer exists and is enabled, false otherwise.
 */
bool AnalysisPipeline::isModuleEnabled(const std::string& name) const {
    auto it = m_modules.find(name);
    return it != m_modules.end() && it->second.enabled;
}

/**
 * @brief Retrieves a list of all analyzer names.
 * @return A vector of strings containing analyzer names.
 */
std::vector<std::string> AnalysisPipeline::getModuleNames() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : m_modules) {
        names.push_back(name);
    }
    return names;
}

/**
 * @brief Applies the orchestration settings present in the given object.
 * @param config The "pipeline" section of the configuration.
 */
void AnalysisPipeline::setGlobalConfig(const nlohmann::json& config) {
    if (!config.is_object()) return;
    if (config.contains("verbose")) m_config.verbose = config["verbose"].get<bool>();
    if (config.contains("sampleRate")) m_config.sampleRate = config["sampleRate"].get<int>();
    if (config.contains("targetFps")) m_config.targetFps = config["targetFps"].get<int>();
    if (config.contains("fallbackDurationSec")) m_config.fallbackDurationSec = config["fallbackDurationSec"].get<double>();
    if (config.contains("deleteInputOnExit")) m_config.deleteInputOnExit = config["deleteInputOnExit"].get<bool>();

    if (m_config.sampleRate <= 0) m_config.sampleRate = 16000;
    if (m_config.targetFps <= 0) m_config.targetFps = 5;
    if (m_config.fallbackDurationSec <= 0.0) m_config.fallbackDurationSec = 30.0;
}

/**
 * @brief Stores and applies the configuration of one analyzer.
 * @param moduleName The name of the analyzer to configure.
 * @param config The JSON object containing the analyzer's configuration.
 * @return true if the analyzer exists and accepted the configuration.
 */
bool AnalysisPipeline::setModuleConfig(const std::string& moduleName, const nlohmann::json& config) {
    auto it = m_modules.find(moduleName);
    if (it == m_modules.end()) {
        std::cerr << "[Config] Unknown module '" << moduleName << "'" << std::endl;
        return false;
    }
    it->second.config = config;
    if (!it->second.analyzer->initialize(config)) {
        std::cerr << "[Config] Invalid settings for '" << moduleName << "'" << std::endl;
        return false;
    }
    return true;
}

/**
 * @brief Runs one job from pending to a terminal state.
 *
 * Any std::exception raised while processing puts the job in error with the
 * exception's message. The input artifact is released on every exit path.
 * @param mediaPath The media file to analyze.
 * @param onStatus Optional status transition callback.
 * @param durationHint Known duration in seconds, if any.
 * @return The terminal job.
 */
AnalysisJob AnalysisPipeline::run(const std::string& mediaPath,
                                  StatusCallback onStatus,
                                  std::optional<double> durationHint) {
    AnalysisJob job(nextJobId(), mediaPath, std::move(onStatus));
    ScopedArtifact artifact(mediaPath, m_config.deleteInputOnExit);

    try {
        job.start();
        log("Job " + job.id() + " processing " + mediaPath);
        job.complete(process(mediaPath, durationHint));
        log("Job " + job.id() + " done");
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Job " << job.id() << " failed: " << e.what() << std::endl;
        job.fail(e.what());
    }
    return job;
}

/**
 * @brief Restores every analyzer's default configuration.
 */
void AnalysisPipeline::reset() {
    for (auto& [name, info] : m_modules) {
        info.analyzer->reset();
        info.config = nlohmann::json::object();
    }
}

/**
 * @brief Produces the full result for one media file.
 *
 * The transcript, landmark and audio branches run concurrently and each owns
 * its outputs until joined. Audio delivery waits for both the transcript and
 * the decoded audio.
 * @param mediaPath The media file to analyze.
 * @param durationHint Known duration in seconds, if any.
 * @return The complete job result.
 */
core::JobResult AnalysisPipeline::process(const std::string& mediaPath, std::optional<double> durationHint) {
    core::JobResult result;
    result.duration = resolveDuration(mediaPath, durationHint, result.notes);
    log("Duration resolved to " + std::to_string(result.duration) + "s");

    const bool runAudio = isModuleEnabled(kAudioModule);
    const bool runNonVerbal = isModuleEnabled(kNonVerbalModule);

    auto transcriptTask = std::async(std::launch::async, [this, &mediaPath]() {
        return transcribe(mediaPath);
    });
    auto nonVerbalTask = std::async(std::launch::async, [this, &mediaPath, runNonVerbal]() {
        return runNonVerbal ? analyzeNonVerbal(mediaPath) : vision::NonVerbalReport{};
    });
    auto audioTask = std::async(std::launch::async, [this, &mediaPath, runAudio]() {
        return runAudio ? decodeAudio(mediaPath) : AudioBranch{};
    });

    TranscriptBranch transcript = transcriptTask.get();
    AudioBranch audio = audioTask.get();

    result.transcript = transcript.transcript.text;
    result.words = transcript.transcript.words;
    appendNotes(result.notes, transcript.notes);
    appendNotes(result.notes, audio.notes);

    result.metrics.speech = speech::buildSpeechMetrics(result.transcript, result.duration);

    if (runAudio) {
        log("Running audio delivery analysis");
        audio::AudioDeliveryReport report = m_audioDelivery.analyze(
            std::move(audio.audio), speech::WordTimeline(result.words), result.duration);
        result.metrics.audioDelivery = std::move(report.metrics);
        appendNotes(result.notes, report.notes);
    }

    vision::NonVerbalReport nonVerbal = nonVerbalTask.get();
    result.metrics.nonVerbal = std::move(nonVerbal.metrics);
    appendNotes(result.notes, nonVerbal.notes);

    result.markers = TimelineMarkerBuilder::build(result.metrics);
    result.summaryFeedback = composeSummaryFeedback(result.metrics);
    result.coaching = coach(result);

    if (result.transcript.find_first_not_of(" \t\r\n") == std::string::npos) {
        result.notes.emplace_back("Transcript is empty. Speaking metrics may be limited.");
    }
    return result;
}

/**
 * @brief Resolves the media duration: hint, then probe, then the fallback.
 * @param mediaPath The media file.
 * @param durationHint Known duration in seconds, if any.
 * @param notes Receives the reason when the fallback is used.
 * @return A positive duration in seconds.
 */
double AnalysisPipeline::resolveDuration(const std::string& mediaPath, std::optional<double> durationHint,
                                         std::vector<std::string>& notes) const {
    if (durationHint && *durationHint > 0.0) {
        return *durationHint;
    }
    if (!m_capabilities.probe.available) {
        notes.push_back(m_capabilities.probe.reason);
        return m_config.fallbackDurationSec;
    }

    try {
        core::Result<double> probed = m_collaborators.probe->probe(mediaPath);
        if (probed.ok() && probed.value() > 0.0) {
            return probed.value();
        }
        notes.push_back(probed.ok() ? "Media duration is not positive. Using fallback duration." : probed.reason());
    } catch (const std::exception& e) {
        notes.push_back(std::string("Duration probe failed: ") + e.what());
    }
    return m_config.fallbackDurationSec;
}

/**
 * @brief Transcript branch. Degrades to an empty transcript with a note.
 * @param mediaPath The media file.
 * @return The transcript and the notes explaining any degradation.
 */
AnalysisPipeline::TranscriptBranch AnalysisPipeline::transcribe(const std::string& mediaPath) const {
    TranscriptBranch branch;
    if (!m_capabilities.speech.available) {
        branch.notes.push_back(m_capabilities.speech.reason);
        return branch;
    }

    try {
        core::Result<Transcript> transcript = m_collaborators.speech->transcribe(mediaPath);
        if (!transcript.ok()) {
            branch.notes.push_back(transcript.reason());
            return branch;
        }
        branch.transcript = std::move(transcript).value();
        appendNotes(branch.notes, branch.transcript.notes);
        branch.transcript.notes.clear();
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Transcription failed: " << e.what() << std::endl;
        branch.transcript = Transcript{};
        branch.notes.push_back(std::string("Transcription failed: ") + e.what());
    }
    return branch;
}

/**
 * @brief Audio branch. Degrades to no audio with a note.
 * @param mediaPath The media file.
 * @return The decoded buffer, if any, and the notes explaining its absence.
 */
AnalysisPipeline::AudioBranch AnalysisPipeline::decodeAudio(const std::string& mediaPath) const {
    AudioBranch branch;
    if (!m_capabilities.decoder.available) {
        branch.notes.push_back(m_capabilities.decoder.reason);
        return branch;
    }

    try {
        core::Result<core::AudioBuffer> decoded = m_collaborators.decoder->decode(mediaPath, m_config.sampleRate);
        if (!decoded.ok()) {
            branch.notes.push_back(decoded.reason());
            return branch;
        }
        branch.audio = std::move(decoded).value();
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Audio decoding failed: " << e.what() << std::endl;
        branch.audio.reset();
        branch.notes.push_back(std::string("Audio extraction failed: ") + e.what());
    }
    return branch;
}

/**
 * @brief Non-verbal branch. Degrades to the unknown-shaped metrics with a note.
 * @param mediaPath The media file.
 * @return The non-verbal metrics and notes.
 */
vision::NonVerbalReport AnalysisPipeline::analyzeNonVerbal(const std::string& mediaPath) const {
    if (!m_capabilities.landmarks.available) {
        vision::NonVerbalReport report;
        report.notes.push_back(m_capabilities.landmarks.reason);
        return report;
    }
    log("Running non-verbal analysis at " + std::to_string(m_config.targetFps) + " fps");
    return m_nonVerbal.analyzeVideo(*m_collaborators.landmarks, mediaPath, m_config.targetFps);
}

/**
 * @brief Hands the metrics to the coaching model, if one is available.
 * @param result The result assembled so far.
 * @return The coaching output, or an empty object.
 */
nlohmann::json AnalysisPipeline::coach(const core::JobResult& result) const {
    if (!m_capabilities.coaching.available) {
        return nlohmann::json::object();
    }

    const core::SpeechMetrics& speech = result.metrics.speech;
    nlohmann::json context = {
        {"pace_label", core::toString(speech.paceLabel)},
        {"words_per_minute", speech.wordsPerMinute ? nlohmann::json(*speech.wordsPerMinute) : nlohmann::json(nullptr)},
        {"filler_word_count", speech.fillerWordCount},
        {"non_verbal", core::JsonContract::toJson(result.metrics.nonVerbal)}
    };

    log("Requesting coaching feedback");
    nlohmann::json coaching = m_collaborators.coaching->coach(result.words, context);
    return coaching.is_object() ? coaching : nlohmann::json::object();
}

/**
 * @brief Creates a process-unique job identifier.
 */
std::string AnalysisPipeline::nextJobId() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "job_" + std::to_string(millis) + "_" + std::to_string(++m_jobCounter);
}

/**
 * @brief Prints a progress line when the pipeline is verbose.
 */
void AnalysisPipeline::log(const std::string& message) const {
    if (m_config.verbose) {
        std::cout << "[Pipeline] " << message << std::endl;
    }
}

/**
 * @brief Sets the speech-to-text collaborator.
 * @param speech The transcriber.
 * @return Reference to the builder for method chaining.
 */
PipelineBuilder& PipelineBuilder::withSpeechToText(std::shared_ptr<ISpeechToText> speech) {
    m_collaborators.speech = std::move(speech);
    return *this;
}

/**
 * @brief Sets the landmark provider collaborator.
 * @param landmarks The landmark provider.
 * @return Reference to the builder for method chaining.
 */
PipelineBuilder& PipelineBuilder::withLandmarkProvider(std::shared_ptr<vision::ILandmarkProvider> landmarks) {
    m_collaborators.landmarks = std::move(landmarks);
    return *this;
}

/**
 * @brief Sets the audio decoder collaborator.
 * @param decoder The audio decoder.
 * @return Reference to the builder for method chaining.
 */
PipelineBuilder& PipelineBuilder::withAudioDecoder(std::shared_ptr<IAudioDecoder> decoder) {
    m_collaborators.decoder = std::move(decoder);
    return *this;
}

/**
 * @brief Sets the duration probe collaborator.
 * @param probe The duration probe.
 * @return Reference to the builder for method chaining.
 */
PipelineBuilder& PipelineBuilder::withDurationProbe(std::shared_ptr<IDurationProbe> probe) {
    m_collaborators.probe = std::move(probe);
    return *this;
}

/**
 * @brief Sets the coaching model collaborator.
 * @param coaching The coaching model.
 * @return Reference to the builder for method chaining.
 */
PipelineBuilder& PipelineBuilder::withCoachingModel(std::shared_ptr<ICoachingModel> coaching) {
    m_collaborators.coaching = std::move(coaching);
    return *this;
}

/**
 * @brief Adds pitch thresholds to the AudioDelivery configuration.
 */
PipelineBuilder& PipelineBuilder::withPitch(double monotoneBelow, double dynamicFrom) {
    nlohmann::json& module = m_config["modules"][kAudioModule];
    module["enabled"] = true;
    module["config"]["Pitch"]["monotoneSemitones"] = monotoneBelow;
    module["config"]["Pitch"]["dynamicSemitones"] = dynamicFrom;
    return *this;
}

/**
 * @brief Adds the quiet threshold to the AudioDelivery configuration.
 */
PipelineBuilder& PipelineBuilder::withVolume(double tooQuietDbfs) {
    nlohmann::json& module = m_config["modules"][kAudioModule];
    module["enabled"] = true;
    module["config"]["Volume"]["tooQuietDbfs"] = tooQuietDbfs;
    return *this;
}

/**
 * @brief Enables the NonVerbal analyzer and sets the frame sampling rate.
 */
PipelineBuilder& PipelineBuilder::withNonVerbal(int targetFps) {
    m_config["modules"][kNonVerbalModule]["enabled"] = true;
    m_config["pipeline"]["targetFps"] = targetFps;
    return *this;
}

/**
 * @brief Enables or disables progress logging.
 */
PipelineBuilder& PipelineBuilder::withVerbose(bool verbose) {
    m_config["pipeline"]["verbose"] = verbose;
    return *this;
}

/**
 * @brief Merges a configuration document into the builder's configuration.
 */
PipelineBuilder& PipelineBuilder::withConfig(const nlohmann::json& config) {
    m_config.merge_patch(config);
    return *this;
}

/**
 * @brief Finalizes the construction and returns the configured AnalysisPipeline.
 * @return A unique pointer to the configured AnalysisPipeline.
 * @throw std::runtime_error if a module configuration is rejected.
 */
std::unique_ptr<AnalysisPipeline> PipelineBuilder::build() {
    auto pipeline = std::make_unique<AnalysisPipeline>(m_collaborators);

    if (m_config.contains("pipeline")) {
        pipeline->setGlobalConfig(m_config["pipeline"]);
    }

    if (m_config.contains("modules")) {
        for (const auto& [name, moduleConfig] : m_config["modules"].items()) {
            if (moduleConfig.contains("enabled")) {
                pipeline->enableModule(name, moduleConfig["enabled"].get<bool>());
            }
            if (moduleConfig.contains("config")) {
                if (!pipeline->setModuleConfig(name, moduleConfig["config"])) {
                    throw std::runtime_error("Invalid configuration for module: " + name);
                }
            }
        }
    }

    return pipeline;
}

} // namespace dae::pipeline
