#pragma once

#include "../core/IAnalyzer.h"
#include "../core/AnalysisTypes.h"
#include "../audio/AudioDeliveryAnalyzer.h"
#include "../vision/NonVerbalAnalyzer.h"
#include "AnalysisJob.h"
#include "Collaborators.h"
#include <atomic>
#include <memory>
#include <optional>
#include <vector>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace dae::pipeline {

/**
 * @brief Orchestration settings, read from the "pipeline" section of the configuration.
 */
struct PipelineConfig {
    bool verbose = false;              ///< Print progress lines to stdout.
    int sampleRate = 16000;            ///< Rate audio is decoded at.
    int targetFps = 5;                 ///< Video frames analyzed per second.
    double fallbackDurationSec = 30.0; ///< Used when the duration cannot be probed.
    bool deleteInputOnExit = false;    ///< The media file is a temporary artifact owned by the job.
};

/**
 * @brief Availability of every collaborator, resolved once when the pipeline is built.
 */
struct CapabilityReport {
    core::Capability speech;
    core::Capability landmarks;
    core::Capability decoder;
    core::Capability probe;
    core::Capability coaching;
};

/**
 * @brief Main class managing one delivery-analysis job from media file to result.
 *
 * It owns the audio and non-verbal analyzers and their configuration, holds
 * the external collaborators, and runs a job through its state machine:
 * duration probing, then transcription, landmark analysis and audio decoding
 * concurrently, then audio delivery, markers, summary and coaching.
 *
 * Every branch failure becomes a diagnostic note; only an unexpected fault in
 * orchestration puts the job in the error state. run() never throws.
 */
class AnalysisPipeline {
public:
    /**
     * @brief Constructs the pipeline and resolves every collaborator's capability.
     *
     * @param collaborators The external collaborators; any of them may be null.
     * @param config Orchestration settings.
     */
    explicit AnalysisPipeline(Collaborators collaborators, PipelineConfig config = {});

    /**
     * @brief Destroys the AnalysisPipeline instance.
     */
    ~AnalysisPipeline();

    // Module management
    /**
     * @brief Enables or disables an analyzer ("AudioDelivery" or "NonVerbal").
     *
     * A disabled analyzer keeps its default "unknown" output.
     * @param name The unique name of the analyzer.
     * @param enabled If true, the analyzer is enabled; otherwise, it is disabled (default is true).
     */
    void enableModule(const std::string& name, bool enabled = true);

    /**
     * @brief Checks if a specific analyzer is currently enabled.
     */
    bool isModuleEnabled(const std::string& name) const;

    /**
     * @brief Retrieves the names of all analyzers the pipeline manages.
     */
    std::vector<std::string> getModuleNames() const;

    // Configuration
    /**
     * @brief Applies the "pipeline" settings object on top of the current ones.
     *
     * Recognized keys: verbose, sampleRate, targetFps, fallbackDurationSec, deleteInputOnExit.
     */
    void setGlobalConfig(const nlohmann::json& config);

    /**
     * @brief Sets the configuration for a single analyzer and initializes it with it.
     *
     * @param moduleName The name of the analyzer to configure.
     * @param config The analyzer's configuration object.
     * @return false if the analyzer is unknown or rejected a value.
     */
    bool setModuleConfig(const std::string& moduleName, const nlohmann::json& config);

    const PipelineConfig& config() const { return m_config; }
    const CapabilityReport& capabilities() const { return m_capabilities; }

    // Processing
    /**
     * @brief Runs one analysis job to a terminal state.
     *
     * @param mediaPath The recorded session (audio or video).
     * @param onStatus Optional callback fired on every status transition.
     * @param durationHint Known media duration; probed when absent or not positive.
     * @return The finished job, either done with a result or in error with its message.
     */
    AnalysisJob run(const std::string& mediaPath,
                    StatusCallback onStatus = nullptr,
                    std::optional<double> durationHint = std::nullopt);

    /**
     * @brief Restores every analyzer's default configuration.
     */
    void reset();

private:
    /**
     * @brief Internal structure to hold metadata and configuration for a managed analyzer.
     */
    struct ModuleInfo {
        core::IAnalyzer* analyzer = nullptr;
        nlohmann::json config;
        bool enabled = true;
    };

    struct TranscriptBranch {
        Transcript transcript;
        std::vector<std::string> notes;
    };

    struct AudioBranch {
        std::optional<core::AudioBuffer> audio;
        std::vector<std::string> notes;
    };

    core::JobResult process(const std::string& mediaPath, std::optional<double> durationHint);
    double resolveDuration(const std::string& mediaPath, std::optional<double> durationHint,
                           std::vector<std::string>& notes) const;

    TranscriptBranch transcribe(const std::string& mediaPath) const;
    AudioBranch decodeAudio(const std::string& mediaPath) const;
    vision::NonVerbalReport analyzeNonVerbal(const std::string& mediaPath) const;
    nlohmann::json coach(const core::JobResult& result) const;

    std::string nextJobId();
    void log(const std::string& message) const;

    Collaborators m_collaborators;
    PipelineConfig m_config;
    CapabilityReport m_capabilities;

    audio::AudioDeliveryAnalyzer m_audioDelivery;
    vision::NonVerbalAnalyzer m_nonVerbal;
    std::map<std::string, ModuleInfo> m_modules;

    std::atomic<unsigned long> m_jobCounter{0};
};

/**
 * @brief Implements the Builder pattern for constructing and configuring an AnalysisPipeline easily.
 */
class PipelineBuilder {
public:
    PipelineBuilder& withSpeechToText(std::shared_ptr<ISpeechToText> speech);
    PipelineBuilder& withLandmarkProvider(std::shared_ptr<vision::ILandmarkProvider> landmarks);
    PipelineBuilder& withAudioDecoder(std::shared_ptr<IAudioDecoder> decoder);
    PipelineBuilder& withDurationProbe(std::shared_ptr<IDurationProbe> probe);
    PipelineBuilder& withCoachingModel(std::shared_ptr<ICoachingModel> coaching);

    /**
     * @brief Configures the pitch classifier thresholds, in semitones.
     * @param monotoneBelow Variation under which delivery is monotone.
     * @param dynamicFrom Variation from which delivery is dynamic.
     * @return Reference to the builder for method chaining.
     */
    PipelineBuilder& withPitch(double monotoneBelow = 1.8, double dynamicFrom = 3.0);

    /**
     * @brief Configures the loudness threshold under which a session is too quiet.
     * @param tooQuietDbfs Mean dBFS threshold.
     * @return Reference to the builder for method chaining.
     */
    PipelineBuilder& withVolume(double tooQuietDbfs = -33.0);

    /**
     * @brief Enables non-verbal analysis at the given sampling rate.
     * @param targetFps Video frames analyzed per second.
     * @return Reference to the builder for method chaining.
     */
    PipelineBuilder& withNonVerbal(int targetFps = 5);

    PipelineBuilder& withVerbose(bool verbose = true);

    /**
     * @brief Merges a configuration document: {"modules": {...}, "pipeline": {...}}.
     * @param config The JSON configuration to merge.
     * @return Reference to the builder for method chaining.
     */
    PipelineBuilder& withConfig(const nlohmann::json& config);

    /**
     * @brief Finalizes the construction and returns the fully configured AnalysisPipeline.
     * @throw std::runtime_error if a module configuration is rejected.
     */
    std::unique_ptr<AnalysisPipeline> build();

private:
    Collaborators m_collaborators;
    nlohmann::json m_config = nlohmann::json::object();
};

} // namespace dae::pipeline
