#pragma once

#include <string>
#include <vector>
#include "../core/Result.h"
#include "Landmarks.h"

namespace dae::vision {

/**
 * @brief Source of per-frame hand/face/pose landmarks for a video.
 *
 * Implementations wrap an external vision model. They sample the video at
 * targetFps and timestamp every frame against its original frame index.
 */
class ILandmarkProvider {
public:
    virtual ~ILandmarkProvider() = default;

    /**
     * @brief Whether the provider can run at all (tool present, hand model found).
     */
    virtual core::Capability capability() const = 0;

    /**
     * @brief Extracts landmark frames.
     * @return The frames, or Degraded when the video or a model could not be used.
     */
    virtual core::Result<std::vector<LandmarkFrame>> extract(const std::string& videoPath,
                                                             int targetFps) = 0;
};

} // namespace dae::vision
