#ifndef DAE_PIPELINE_EXTERNALLANDMARKPROVIDER_H
#define DAE_PIPELINE_EXTERNALLANDMARKPROVIDER_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../core/ModelHandle.h"
#include "../vision/ILandmarkProvider.h"

namespace dae::pipeline {

/**
 * @brief Resolved landmark model files. The hand model is mandatory.
 */
struct LandmarkModels {
    std::string hand;
    std::optional<std::string> face;
    std::optional<std::string> pose;
};

/**
 * @brief Where to look for the tool and its model files.
 */
struct LandmarkToolConfig {
    std::string executable = "dae-landmarks";
    std::vector<std::string> handModelCandidates = {"models/hand_landmarker.task"};
    std::vector<std::string> faceModelCandidates = {"models/face_landmarker.task"};
    std::vector<std::string> poseModelCandidates = {"models/pose_landmarker.task"};
};

/**
 * @brief Returns the env override when it names an existing file, else the first existing candidate.
 */
std::optional<std::string> resolveModelPath(const char* envVar, const std::vector<std::string>& candidates);

/**
 * @brief Landmark provider that runs an external vision tool.
 *
 * The tool is invoked as
 *   <tool> --video <path> --fps <target> --hand-model <file> [--face-model <file>] [--pose-model <file>]
 * and prints the landmark stream as JSON on stdout (see vision::parseLandmarkFrames).
 * Model files resolve once, on first use, through an owned ModelHandle.
 */
class ExternalLandmarkProvider : public vision::ILandmarkProvider {
public:
    explicit ExternalLandmarkProvider(LandmarkToolConfig config = {});

    core::Capability capability() const override;
    core::Result<std::vector<vision::LandmarkFrame>> extract(const std::string& videoPath,
                                                             int targetFps) override;

private:
    LandmarkToolConfig m_config;
    std::optional<std::string> m_executable;
    core::ModelHandle<LandmarkModels> m_models;
};

} // namespace dae::pipeline

#endif // DAE_PIPELINE_EXTERNALLANDMARKPROVIDER_H
