#include "../../include/vision/Landmarks.h"
#include <algorithm>
#include <cmath>

namespace dae::vision {

namespace {

std::optional<std::vector<Point2>> parsePoints(const nlohmann::json& frame, const char* key) {
    if (!frame.contains(key) || frame[key].is_null()) return std::nullopt;
    std::vector<Point2> points;
    points.reserve(frame[key].size());
    for (const auto& p : frame[key]) {
        if (p.is_array()) {
            points.push_back({p.at(0).get<double>(), p.at(1).get<double>()});
        } else {
            points.push_back({p.at("x").get<double>(), p.at("y").get<double>()});
        }
    }
    if (points.empty()) return std::nullopt;
    return points;
}

} // namespace

std::vector<LandmarkFrame> parseLandmarkFrames(const nlohmann::json& doc) {
    const nlohmann::json& frames = doc.is_array() ? doc : doc.at("frames");
    double sourceFps = doc.is_object() ? doc.value("source_fps", 0.0) : 0.0;
    if (sourceFps <= 0.0) sourceFps = kFallbackSourceFps;

    std::vector<LandmarkFrame> out;
    out.reserve(frames.size());
    for (const auto& f : frames) {
        LandmarkFrame frame;
        frame.frameIndex = f.value("frame", -1L);
        if (f.contains("t")) {
            frame.timestamp = f["t"].get<double>();
        } else if (frame.frameIndex >= 0) {
            // Whole milliseconds, as the vision models are fed.
            const auto ms = static_cast<long>(static_cast<double>(frame.frameIndex) / sourceFps * 1000.0);
            frame.timestamp = static_cast<double>(ms) / 1000.0;
        }
        if (f.contains("hands") && !f["hands"].is_null()) {
            frame.hands = f["hands"].get<std::vector<double>>();
        }
        frame.face = parsePoints(f, "face");
        frame.faceTracked = f.value("face_tracked", frame.face.has_value());
        frame.pose = parsePoints(f, "pose");
        frame.poseTracked = f.value("pose_tracked", frame.pose.has_value());
        out.push_back(std::move(frame));
    }
    return out;
}

int frameStride(double sourceFps, int targetFps) {
    const double fps = sourceFps > 0.0 ? sourceFps : kFallbackSourceFps;
    const int target = std::max(1, targetFps);
    return std::max(1, static_cast<int>(std::lround(fps / target)));
}

std::vector<LandmarkFrame> sampleFrames(std::vector<LandmarkFrame> frames, int stride) {
    if (stride <= 1) return frames;
    frames.erase(std::remove_if(frames.begin(), frames.end(),
                                [stride](const LandmarkFrame& f) {
                                    return f.frameIndex >= 0 && f.frameIndex % stride != 0;
                                }),
                 frames.end());
    return frames;
}

std::vector<LandmarkFrame> framesAtTargetRate(const nlohmann::json& doc, int targetFps) {
    std::vector<LandmarkFrame> frames = parseLandmarkFrames(doc);
    const double sourceFps = doc.is_object() ? doc.value("source_fps", 0.0) : 0.0;
    if (sourceFps <= 0.0) return frames;
    return sampleFrames(std::move(frames), frameStride(sourceFps, targetFps));
}

} // namespace dae::vision
