#ifndef DAE_VISION_LANDMARKS_H
#define DAE_VISION_LANDMARKS_H

#include <cstddef>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace dae::vision {

/** @brief Landmarks per hand in the hand model's topology. */
constexpr size_t kHandLandmarkCount = 21;
/** @brief Hand vector layout: left hand (x,y)*21 then right hand (x,y)*21. */
constexpr size_t kHandVectorSize = 2 * kHandLandmarkCount * 2;

// Face mesh indices used by the attention proxy.
constexpr size_t kFaceLeftEye = 33;
constexpr size_t kFaceRightEye = 263;
constexpr size_t kFaceNoseTip = 1;
constexpr size_t kFaceUpperLip = 13;

// Pose indices used by the sway proxy.
constexpr size_t kPoseLeftShoulder = 11;
constexpr size_t kPoseRightShoulder = 12;

/** @brief Assumed video frame rate when the container does not report one. */
constexpr double kFallbackSourceFps = 30.0;

/**
 * @brief Normalized image coordinates of one landmark.
 */
struct Point2 {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Landmarks extracted from one sampled video frame.
 *
 * The timestamp is derived from the original frame index, not the sample count.
 * faceTracked/poseTracked say whether the corresponding model ran at all;
 * face/pose are empty when it ran but detected nothing.
 */
struct LandmarkFrame {
    double timestamp = 0.0;
    long frameIndex = -1;  ///< Index in the source video, -1 when not reported.
    std::optional<std::vector<double>> hands;
    bool faceTracked = false;
    std::optional<std::vector<Point2>> face;
    bool poseTracked = false;
    std::optional<std::vector<Point2>> pose;
};

/**
 * @brief Parses the landmark stream produced by the external vision tool.
 *
 * Expected shape: {"source_fps": 29.97, "frames": [{"frame": i, "t": sec,
 * "hands": [84 floats] | null, "face_tracked": bool, "face": [[x,y],...] | null,
 * "pose_tracked": bool, "pose": [[x,y],...] | null}, ...]}. A bare array of
 * frames is accepted too. When "t" is missing it is derived from the frame
 * index and the source frame rate.
 *
 * @throw nlohmann::json::exception on malformed input.
 */
std::vector<LandmarkFrame> parseLandmarkFrames(const nlohmann::json& doc);

/**
 * @brief Source frames between two analyzed frames: round(sourceFps / targetFps), at least 1.
 *
 * A non-positive sourceFps falls back to kFallbackSourceFps; targetFps is clamped to >= 1.
 */
int frameStride(double sourceFps, int targetFps);

/**
 * @brief Keeps frames whose source index is a multiple of stride.
 *
 * Frames without a source index are kept as they are.
 */
std::vector<LandmarkFrame> sampleFrames(std::vector<LandmarkFrame> frames, int stride);

/**
 * @brief Parses a vision tool document and thins it to targetFps.
 *
 * The stride is only applied when the document reports "source_fps". Without it the
 * tool's own sampling is trusted, since the fallback rate may not match the video.
 */
std::vector<LandmarkFrame> framesAtTargetRate(const nlohmann::json& doc, int targetFps);

} // namespace dae::vision

#endif // DAE_VISION_LANDMARKS_H
