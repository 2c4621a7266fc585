#include <iostream>
#include <cmath>
#include <vector>
#include <nlohmann/json.hpp>
#include "../include/vision/EventSegmenter.h"
#include "../include/vision/GestureEnergyEstimator.h"
#include "../include/vision/AttentionEstimator.h"
#include "../include/vision/PostureStabilityEstimator.h"
#include "../include/vision/NonVerbalAnalyzer.h"
#include "../include/vision/Landmarks.h"

using dae::vision::LandmarkFrame;
using dae::vision::Point2;

static std::vector<Point2> make_face(double noseX) {
    std::vector<Point2> face(300, Point2{0.5, 0.5});
    face[dae::vision::kFaceLeftEye] = {0.4, 0.4};
    face[dae::vision::kFaceRightEye] = {0.6, 0.4};
    face[dae::vision::kFaceNoseTip] = {noseX, 0.5};
    face[dae::vision::kFaceUpperLip] = {0.5, 0.6};
    return face;
}

static std::vector<Point2> make_pose(double shoulderX) {
    std::vector<Point2> pose(33, Point2{0.5, 0.5});
    pose[dae::vision::kPoseLeftShoulder] = {shoulderX - 0.1, 0.4};
    pose[dae::vision::kPoseRightShoulder] = {shoulderX + 0.1, 0.4};
    return pose;
}

bool test_event_segmenter_min_duration() {
    dae::vision::BooleanSignal signal;
    for (int i = 0; i <= 5; ++i) signal.push_back({i * 0.5, true});
    signal.push_back({3.0, false});
    for (int i = 0; i <= 2; ++i) signal.push_back({3.5 + i * 0.5, true});  // 1.0s run

    auto events = dae::vision::segmentEvents(signal, 2.0);
    if (events.size() != 1) {
        std::cerr << "Expected 1 event, got " << events.size() << std::endl;
        return false;
    }
    const auto& e = events.front();
    if (e.start != 0.0 || e.end != 2.5) return false;
    return e.startHms == "00:00:00.00" && e.endHms == "00:00:02.50";
}

bool test_gesture_identical_vectors_are_unknown() {
    std::vector<LandmarkFrame> frames(10);
    for (size_t i = 0; i < frames.size(); ++i) {
        frames[i].timestamp = i * 0.2;
        frames[i].hands = std::vector<double>(dae::vision::kHandVectorSize, 0.25);
    }
    dae::vision::GestureEnergyEstimator gesture;
    auto still = gesture.analyze(frames);
    if (still.avgVelocity != 0.0 || still.gestureEnergy != 0.0) return false;
    if (still.activityLevel != dae::core::Level::Unknown) {
        std::cerr << "Frozen hands must be unknown, got " << dae::core::toString(still.activityLevel) << std::endl;
        return false;
    }

    // All-zero vectors mean no hand was detected.
    for (auto& f : frames) f.hands = std::vector<double>(dae::vision::kHandVectorSize, 0.0);
    auto none = gesture.analyze(frames);
    return none.transitions == 0 && none.activityLevel == dae::core::Level::Unknown;
}

bool test_gesture_energy_levels() {
    std::vector<LandmarkFrame> frames(6);
    for (size_t i = 0; i < frames.size(); ++i) {
        frames[i].timestamp = i * 0.2;
        frames[i].hands = std::vector<double>(4, i % 2 == 0 ? 0.2 : 0.3);
    }
    // A hand-less frame in the middle does not break the chain.
    frames[3].hands.reset();

    dae::vision::GestureEnergyEstimator gesture;
    auto result = gesture.analyze(frames);
    if (result.transitions != 4) {
        std::cerr << "Expected 4 transitions, got " << result.transitions << std::endl;
        return false;
    }
    // Velocities: 0.1, 0.1, 0.0 (frame 2 -> 4), 0.1
    if (std::abs(result.avgVelocity - 0.075) > 1e-6) {
        std::cerr << "avg_velocity " << result.avgVelocity << std::endl;
        return false;
    }
    if (std::abs(result.gestureEnergy - 2.25) > 1e-6) return false;
    return result.activityLevel == dae::core::Level::Low;
}

bool test_attention_proxy_and_levels() {
    dae::vision::AttentionEstimator attention;
    if (!attention.isAttentive(make_face(0.5))) return false;
    if (attention.isAttentive(make_face(0.6))) return false;
    // A face without the required indices is given the benefit of the doubt.
    if (!attention.isAttentive(std::vector<Point2>(10))) return false;

    std::vector<LandmarkFrame> frames(4);
    for (size_t i = 0; i < frames.size(); ++i) {
        frames[i].timestamp = i * 0.5;
        frames[i].faceTracked = true;
        frames[i].face = make_face(i == 3 ? 0.65 : 0.5);
    }
    auto result = attention.analyze(frames);
    if (result.faceSamples != 4 || result.attentiveFrames != 3) return false;
    if (std::abs(result.eyeContactPct - 75.0) > 1e-9 || std::abs(result.eyeContactScore - 7.5) > 1e-9) return false;
    if (result.eyeContactLevel != dae::core::Level::High) return false;

    auto empty = attention.analyze(std::vector<LandmarkFrame>(3));
    return empty.faceSamples == 0 && empty.eyeContactLevel == dae::core::Level::Unknown;
}

bool test_posture_sway_and_stability() {
    std::vector<LandmarkFrame> frames(5);
    for (size_t i = 0; i < frames.size(); ++i) {
        frames[i].timestamp = i * 0.5;
        frames[i].poseTracked = true;
        frames[i].pose = make_pose(0.5 + (i % 2) * 0.05);
    }
    dae::vision::PostureStabilityEstimator posture;
    auto result = posture.analyze(frames);
    if (result.poseSamples != 5 || result.transitions != 4 || result.highSway.size() != 4) return false;
    if (result.highSway.front().timestamp != 0.5 || !result.highSway.front().flag) return false;
    // Mean sway 0.05 -> 10 - 4 = 6.
    if (std::abs(result.postureStability - 6.0) > 1e-6) {
        std::cerr << "posture_stability " << result.postureStability << std::endl;
        return false;
    }
    if (result.postureLevel != dae::core::PostureLevel::Moderate) return false;

    std::vector<LandmarkFrame> single(1);
    single[0].poseTracked = true;
    single[0].pose = make_pose(0.5);
    return posture.analyze(single).postureLevel == dae::core::PostureLevel::Unknown;
}

bool test_non_verbal_fuses_gaze_away_events() {
    std::vector<LandmarkFrame> frames;
    for (int i = 0; i <= 12; ++i) {
        LandmarkFrame f;
        f.timestamp = i * 0.5;
        f.hands = std::vector<double>(4, i % 2 == 0 ? 0.2 : 0.3);
        f.faceTracked = true;
        const bool away = f.timestamp >= 1.5 && f.timestamp <= 4.0;
        f.face = make_face(away ? 0.65 : 0.5);
        f.poseTracked = true;
        f.pose = make_pose(0.5);
        frames.push_back(std::move(f));
    }

    dae::vision::NonVerbalAnalyzer analyzer;
    auto m = analyzer.analyze(frames);
    if (m.samples != 13) return false;
    if (m.activityLevel != dae::core::Level::Moderate) {
        std::cerr << "activity " << dae::core::toString(m.activityLevel) << std::endl;
        return false;
    }
    if (m.postureLevel != dae::core::PostureLevel::Stable || !m.postureEvents.empty()) return false;
    if (m.gazeAwayEvents.size() != 1 || m.gazeAwayEvents[0].start != 1.5 || m.gazeAwayEvents[0].end != 4.0) {
        std::cerr << "Unexpected gaze-away spans" << std::endl;
        return false;
    }
    if (m.nonVerbalEvents.size() != 1) return false;
    const auto& e = m.nonVerbalEvents.front();
    return e.type == "gaze_away" && e.severity == dae::core::EventSeverity::Medium
        && e.message == "Looked away for ~2.5s." && e.timestampHms == "00:00:01.50";
}

bool test_non_verbal_events_sorted_with_gesture_advisory() {
    dae::vision::NonVerbalAnalyzer analyzer;
    dae::core::EventSpan longSway{3.0, 8.0, "00:00:03.00", "00:00:08.00"};
    dae::core::EventSpan gaze{1.0, 3.5, "00:00:01.00", "00:00:03.50"};

    auto events = analyzer.buildEvents({gaze}, {longSway}, dae::core::Level::Low);
    if (events.size() != 3) return false;
    if (events[0].type != "low_gesture" || events[0].timestamp != 0.0) return false;
    if (events[1].type != "gaze_away" || events[2].type != "high_sway") return false;
    return events[2].severity == dae::core::EventSeverity::High;
}

bool test_landmark_parsing_and_stride() {
    nlohmann::json doc = {
        {"source_fps", 30},
        {"frames", nlohmann::json::array({
            {{"frame", 0}, {"hands", std::vector<double>(4, 0.1)}, {"face", {{0.1, 0.2}, {0.3, 0.4}}}},
            {{"frame", 3}, {"pose_tracked", false}},
            {{"frame", 6}, {"pose", nlohmann::json::array({{{"x", 0.5}, {"y", 0.6}}})}}
        })}
    };
    auto frames = dae::vision::parseLandmarkFrames(doc);
    if (frames.size() != 3) return false;
    if (!frames[0].faceTracked || !frames[0].face || frames[0].face->size() != 2) return false;
    if (std::abs(frames[1].timestamp - 0.1) > 1e-9 || frames[1].poseTracked) return false;
    if (!frames[2].poseTracked || std::abs(frames[2].timestamp - 0.2) > 1e-9) return false;

    const int stride = dae::vision::frameStride(30.0, 5);
    if (stride != 6 || dae::vision::frameStride(0.0, 5) != 6 || dae::vision::frameStride(24.0, 60) != 1) {
        return false;
    }
    auto sampled = dae::vision::sampleFrames(frames, stride);
    return sampled.size() == 2 && sampled[0].frameIndex == 0 && sampled[1].frameIndex == 6;
}

bool test_landmark_tool_sampling_is_trusted_without_source_fps() {
    // A 25 fps video sampled by the tool at 5 fps: indices 0, 5, ..., 60.
    nlohmann::json frames = nlohmann::json::array();
    for (int i = 0; i <= 60; i += 5) {
        frames.push_back({{"frame", i}, {"hands", std::vector<double>(4, 0.1)}});
    }
    auto kept = dae::vision::framesAtTargetRate({{"frames", frames}}, 5);
    if (kept.size() != 13 || kept.back().frameIndex != 60) {
        std::cerr << "Expected all 13 frames kept, got " << kept.size() << std::endl;
        return false;
    }

    // With a reported rate the stream is thinned to the target.
    auto thinned = dae::vision::framesAtTargetRate({{"source_fps", 25.0}, {"frames", frames}}, 1);
    return thinned.size() == 3 && thinned[1].frameIndex == 25 && thinned[2].frameIndex == 50;
}
