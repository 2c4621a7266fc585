#include <iostream>
#include <fstream>
#include <chrono>
#include <memory>
#include "../include/pipeline/AnalysisPipeline.h"
#include "../include/pipeline/AudioLoader.h"
#include "../include/pipeline/ExternalLandmarkProvider.h"
#include "../include/pipeline/ExternalTools.h"
#include "../include/pipeline/SidecarTranscriptProvider.h"
#include "../include/core/JsonContract.h"
#include <nlohmann/json.hpp>

namespace {

std::vector<std::string> stringList(const nlohmann::json& node, const std::vector<std::string>& fallback) {
    if (!node.is_array()) return fallback;
    return node.get<std::vector<std::string>>();
}

/**
 * @brief Creates the external collaborators described by the "providers" section.
 *
 * Recognized keys: transcript.path, decoder ("ffmpeg" | "wav" | "none"), ffmpeg,
 * probe ("ffprobe" | "none"), ffprobe, landmarks.{enabled, executable, handModels,
 * faceModels, poseModels}.
 * @param providers The "providers" configuration object (may be null).
 * @param builder The builder receiving the collaborators.
 */
void configureProviders(const nlohmann::json& providers, dae::pipeline::PipelineBuilder& builder) {
    using namespace dae::pipeline;
    const nlohmann::json cfg = providers.is_object() ? providers : nlohmann::json::object();

    std::string transcriptPath;
    if (cfg.contains("transcript") && cfg["transcript"].contains("path")) {
        transcriptPath = cfg["transcript"]["path"].get<std::string>();
    }
    builder.withSpeechToText(std::make_shared<SidecarTranscriptProvider>(transcriptPath));

    const std::string decoder = cfg.value("decoder", std::string("ffmpeg"));
    if (decoder == "ffmpeg") {
        builder.withAudioDecoder(std::make_shared<FfmpegAudioDecoder>(cfg.value("ffmpeg", std::string("ffmpeg"))));
    } else if (decoder == "wav") {
        builder.withAudioDecoder(std::make_shared<WavAudioDecoder>());
    } else {
        std::cout << "[Config] Audio decoder disabled" << std::endl;
    }

    if (cfg.value("probe", std::string("ffprobe")) == "ffprobe") {
        builder.withDurationProbe(std::make_shared<FfprobeDurationProbe>(cfg.value("ffprobe", std::string("ffprobe"))));
    }

    const nlohmann::json landmarks = cfg.value("landmarks", nlohmann::json::object());
    if (landmarks.value("enabled", true)) {
        LandmarkToolConfig tool;
        tool.executable = landmarks.value("executable", tool.executable);
        if (landmarks.contains("handModels")) tool.handModelCandidates = stringList(landmarks["handModels"], tool.handModelCandidates);
        if (landmarks.contains("faceModels")) tool.faceModelCandidates = stringList(landmarks["faceModels"], tool.faceModelCandidates);
        if (landmarks.contains("poseModels")) tool.poseModelCandidates = stringList(landmarks["poseModels"], tool.poseModelCandidates);
        builder.withLandmarkProvider(std::make_shared<ExternalLandmarkProvider>(tool));
    }
}

void printCapability(const std::string& name, const dae::core::Capability& capability) {
    std::cout << "  " << name << ": " << (capability.available ? "available" : "unavailable");
    if (!capability.available) std::cout << " (" << capability.reason << ")";
    std::cout << std::endl;
}

} // namespace

/**
 * @brief Main function for the delivery analysis executable.
 *
 * Handles argument parsing, pipeline configuration via JSON, execution of one
 * analysis job, and saving the final structured JSON output.
 * @param argc The number of command-line arguments.
 * @param argv The command-line arguments.
 * @return 0 when the job is done, 1 on job error, 2 on usage error, 3/4 on configuration errors.
 */
int main(int argc, char* argv[]) {
    std::cout << "=== Delivery Analysis Engine ===" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl << std::endl;

    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <media> <output.json> <config.json>" << std::endl;
        std::cerr << "Error: Configuration file path must be provided as the 3rd argument." << std::endl;
        return 2;
    }
    std::string inputFile = argv[1];
    std::string outputFile = argv[2];
    std::string configPath = argv[3];

    nlohmann::json cfg;
    {
        std::ifstream cfgIn(configPath);
        if (!cfgIn.is_open()) {
            std::cerr << "[Config] Could not open configuration file: " << configPath << std::endl;
            return 3;
        }
        try {
            cfgIn >> cfg;
            std::cout << "[Config] Loaded configuration from: " << configPath << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Config] Failed to parse JSON ('" << configPath << "'): " << e.what() << std::endl;
            return 4;
        }
    }

    try {
        auto startTime = std::chrono::high_resolution_clock::now();

        dae::pipeline::PipelineBuilder builder;
        builder.withVerbose(true);
        configureProviders(cfg.value("providers", nlohmann::json::object()), builder);

        nlohmann::json pipelineCfg = nlohmann::json::object();
        if (cfg.contains("modules")) pipelineCfg["modules"] = cfg["modules"];
        if (cfg.contains("pipeline")) pipelineCfg["pipeline"] = cfg["pipeline"];
        builder.withConfig(pipelineCfg);

        if (cfg.contains("modules") && cfg["modules"].is_object()) {
            for (const auto& it : cfg["modules"].items()) {
                bool enabled = it.value().value("enabled", true);
                std::cout << "[Config] Module '" << it.key() << "' is " << (enabled ? "ENABLED" : "DISABLED") << std::endl;
            }
        } else {
            std::cerr << "[Config] No 'modules' object found in configuration; using defaults for all modules." << std::endl;
        }

        auto pipeline = builder.build();

        std::cout << "\nCollaborators:" << std::endl;
        const auto& caps = pipeline->capabilities();
        printCapability("speech-to-text", caps.speech);
        printCapability("landmarks", caps.landmarks);
        printCapability("audio decoder", caps.decoder);
        printCapability("duration probe", caps.probe);
        printCapability("coaching", caps.coaching);

        std::optional<double> durationHint;
        if (cfg.contains("durationSec")) durationHint = cfg["durationSec"].get<double>();

        std::cout << "\nRunning analysis..." << std::endl;
        auto statusCallback = [](const dae::pipeline::AnalysisJob& job) {
            std::cout << "  [" << job.id() << "] " << dae::pipeline::toString(job.status()) << std::endl;
        };
        dae::pipeline::AnalysisJob job = pipeline->run(inputFile, statusCallback, durationHint);

        nlohmann::json output = job.status() == dae::pipeline::JobStatus::Done
            ? dae::core::JsonContract::createOutput(*job.result(), job.id())
            : dae::core::JsonContract::createErrorOutput(job.errorMessage(), job.id());

        auto endTime = std::chrono::high_resolution_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();
        output["processingTime"] = elapsed / 1000.0;

        if (!dae::core::JsonContract::validate(output)) {
            std::cerr << "Warning: Output validation failed! The result may not conform to the expected schema." << std::endl;
        }

        std::cout << "\nSaving results to: " << outputFile << std::endl;
        std::ofstream outFile(outputFile);
        if (!outFile.is_open()) {
            std::cerr << "Error: Could not open output file: " << outputFile << std::endl;
            return 1;
        }
        outFile << output.dump(2);
        outFile.close();

        std::cout << "\n=== Analysis Complete ===" << std::endl;
        std::cout << "Processing time: " << elapsed / 1000.0 << " seconds" << std::endl;

        if (job.status() != dae::pipeline::JobStatus::Done) {
            std::cerr << "Job failed: " << job.errorMessage() << std::endl;
            return 1;
        }

        const dae::core::JobResult& result = *job.result();
        const auto& speech = result.metrics.speech;
        const auto& audio = result.metrics.audioDelivery;
        const auto& nonVerbal = result.metrics.nonVerbal;
        std::cout << "Duration: " << result.duration << " s, words: " << speech.wordCount
                  << ", pace: " << dae::core::toString(speech.paceLabel) << std::endl;
        std::cout << "Pitch: " << dae::core::toString(audio.monotone.label)
                  << ", volume: " << dae::core::toString(audio.volume.consistency)
                  << ", pauses: " << dae::core::toString(audio.silence.quality) << std::endl;
        std::cout << "Gestures: " << dae::core::toString(nonVerbal.activityLevel)
                  << ", eye contact: " << dae::core::toString(nonVerbal.eyeContactLevel)
                  << ", posture: " << dae::core::toString(nonVerbal.postureLevel) << std::endl;
        std::cout << "Markers: " << result.markers.size() << std::endl;
        for (const auto& note : result.notes) {
            std::cout << "Note: " << note << std::endl;
        }

        std::cout << "\nOutput saved to: " << outputFile << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
