#include "../../include/pipeline/ExternalLandmarkProvider.h"
#include "../../include/pipeline/ProcessRunner.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace dae::pipeline {

std::optional<std::string> resolveModelPath(const char* envVar, const std::vector<std::string>& candidates) {
    std::error_code ec;
    if (const char* env = std::getenv(envVar)) {
        if (*env && std::filesystem::exists(env, ec)) return std::string(env);
    }
    for (const auto& path : candidates) {
        if (std::filesystem::exists(path, ec)) return path;
    }
    return std::nullopt;
}

ExternalLandmarkProvider::ExternalLandmarkProvider(LandmarkToolConfig config)
    : m_config(std::move(config)),
      m_executable(ProcessRunner::findExecutable(m_config.executable)),
      m_models([this]() {
          auto hand = resolveModelPath("DAE_HAND_MODEL_PATH", m_config.handModelCandidates);
          if (!hand) throw std::runtime_error("hand landmark model not found");
          auto models = std::make_shared<LandmarkModels>();
          models->hand = *hand;
          models->face = resolveModelPath("DAE_FACE_MODEL_PATH", m_config.faceModelCandidates);
          models->pose = resolveModelPath("DAE_POSE_MODEL_PATH", m_config.poseModelCandidates);
          return std::shared_ptr<const LandmarkModels>(std::move(models));
      }) {
}

core::Capability ExternalLandmarkProvider::capability() const {
    if (!m_executable) {
        return core::Capability::no("vision tool '" + m_config.executable + "' not found");
    }
    if (!m_models.get()) {
        return core::Capability::no(m_models.error());
    }
    return core::Capability::yes();
}

core::Result<std::vector<vision::LandmarkFrame>> ExternalLandmarkProvider::extract(const std::string& videoPath,
                                                                                   int targetFps) {
    using FramesResult = core::Result<std::vector<vision::LandmarkFrame>>;

    const auto models = m_models.get();
    if (!m_executable || !models) {
        return FramesResult::degraded(capability().reason);
    }
    std::error_code ec;
    if (!std::filesystem::exists(videoPath, ec)) {
        return FramesResult::degraded("video file not found");
    }

    const int fps = std::max(1, targetFps);
    std::vector<std::string> argv = {
        *m_executable, "--video", videoPath, "--fps", std::to_string(fps), "--hand-model", models->hand
    };
    if (models->face) {
        argv.push_back("--face-model");
        argv.push_back(*models->face);
    }
    if (models->pose) {
        argv.push_back("--pose-model");
        argv.push_back(*models->pose);
    }

    const ProcessOutput out = ProcessRunner::run(argv);
    if (out.exitCode != 0) {
        return FramesResult::degraded("vision tool exited with code " + std::to_string(out.exitCode));
    }

    return vision::framesAtTargetRate(nlohmann::json::parse(out.stdoutData), fps);
}

} // namespace dae::pipeline
