#include "gesture_classifier.hpp"
#include <algorithm>
#include <array>
#include <iostream>

namespace hand_detector {

namespace {

struct FingerJoints {
    HandLandmark pip;
    HandLandmark tip;
};

constexpr std::array<FingerJoints, 5> kFingerJoints = {{
    {HandLandmark::THUMB_MCP, HandLandmark::THUMB_TIP},
    {HandLandmark::INDEX_FINGER_PIP, HandLandmark::INDEX_FINGER_TIP},
    {HandLandmark::MIDDLE_FINGER_PIP, HandLandmark::MIDDLE_FINGER_TIP},
    {HandLandmark::RING_FINGER_PIP, HandLandmark::RING_FINGER_TIP},
    {HandLandmark::PINKY_PIP, HandLandmark::PINKY_TIP},
}};

bool all_points_finite(const HandLandmarks& hand) {
    return std::all_of(hand.points.begin(), hand.points.end(),
                       [](const Point& p) { return p.is_finite(); });
}

} // namespace

const char* pose_to_string(Pose pose) {
    switch (pose) {
        case Pose::POINTING: return "POINTING";
        case Pose::OTHER: return "OTHER";
        case Pose::NO_HAND: return "NO_HAND";
    }
    return "UNKNOWN";
}

bool GestureConfig::validate() const noexcept {
    if (extension_margin < 0.0f || extension_margin > 1.0f) return false;
    if (min_confidence < 0.0f || min_confidence > 1.0f) return false;
    if (gesture_history < 1) return false;
    return true;
}

CoordinateMapper::CoordinateMapper()
    : scale_x_(1.0f), scale_y_(1.0f), display_width_(0), display_height_(0), mirror_(false) {}

CoordinateMapper::CoordinateMapper(uint32_t frame_width, uint32_t frame_height,
                                   uint32_t display_width, uint32_t display_height,
                                   bool mirror)
    : scale_x_(frame_width ? static_cast<float>(display_width) / frame_width : 1.0f),
      scale_y_(frame_height ? static_cast<float>(display_height) / frame_height : 1.0f),
      display_width_(display_width),
      display_height_(display_height),
      mirror_(mirror) {}

Point CoordinateMapper::map(const Point& frame_point) const {
    float x = frame_point.x * scale_x_;
    float y = frame_point.y * scale_y_;
    if (mirror_) {
        x = static_cast<float>(display_width_) - x;
    }
    return Point(x, y);
}

bool is_finger_extended(const HandLandmarks& hand, Finger finger, float margin) {
    const FingerJoints& joints = kFingerJoints[static_cast<int>(finger)];
    const Point& wrist = hand.at(HandLandmark::WRIST);
    float tip_dist = hand.at(joints.tip).distance(wrist);
    float pip_dist = hand.at(joints.pip).distance(wrist);
    return tip_dist > pip_dist * (1.0f + margin);
}

Pose classify_hand(const HandLandmarks& hand, float margin) {
    bool index = is_finger_extended(hand, Finger::INDEX, margin);
    bool middle = is_finger_extended(hand, Finger::MIDDLE, margin);
    bool ring = is_finger_extended(hand, Finger::RING, margin);
    bool pinky = is_finger_extended(hand, Finger::PINKY, margin);
    return (index && !middle && !ring && !pinky) ? Pose::POINTING : Pose::OTHER;
}

PoseClassification classify(const std::vector<HandLandmarks>& hands,
                            const CoordinateMapper& mapper,
                            const GestureConfig& config) {
    if (hands.empty()) {
        return PoseClassification::no_hand();
    }

    auto best = std::max_element(hands.begin(), hands.end(),
                                 [](const HandLandmarks& a, const HandLandmarks& b) {
                                     return a.confidence < b.confidence;
                                 });
    const HandLandmarks& hand = *best;

    if (!std::isfinite(hand.confidence) || hand.confidence < config.min_confidence) {
        if (config.verbose) {
            std::cerr << "[Landmarks] Hand confidence " << hand.confidence << " below threshold\n";
        }
        return PoseClassification::no_hand();
    }
    if (!all_points_finite(hand)) {
        if (config.verbose) {
            std::cerr << "[Landmarks][WARN] Non-finite landmark data, treating as no hand\n";
        }
        return PoseClassification::no_hand();
    }

    if (classify_hand(hand, config.extension_margin) != Pose::POINTING) {
        return PoseClassification::other();
    }
    return PoseClassification::pointing(mapper.map(hand.at(HandLandmark::INDEX_FINGER_TIP)));
}

GestureStabilizer::GestureStabilizer(int window_size)
    : window_size_(std::max(1, window_size)) {}

PoseClassification GestureStabilizer::push(const PoseClassification& current) {
    window_.push_back(current);
    while (static_cast<int>(window_.size()) > window_size_) {
        window_.pop_front();
    }
    // A frame without a hand is never smoothed into a pointing one
    if (window_size_ == 1 || current.pose == Pose::NO_HAND) {
        return current;
    }

    std::array<int, 3> counts{0, 0, 0};
    for (const auto& c : window_) {
        counts[static_cast<int>(c.pose)]++;
    }

    // Newest entry wins ties
    Pose voted = current.pose;
    int best = counts[static_cast<int>(voted)];
    for (auto it = window_.rbegin(); it != window_.rend(); ++it) {
        int n = counts[static_cast<int>(it->pose)];
        if (n > best) {
            best = n;
            voted = it->pose;
        }
    }

    // The fingertip always comes from this frame: a pointing vote over a
    // frame that is not pointing stays OTHER
    if (voted == Pose::POINTING && current.is_pointing() && current.fingertip) {
        return current;
    }
    return voted == Pose::NO_HAND ? PoseClassification::no_hand() : PoseClassification::other();
}

void GestureStabilizer::reset() {
    window_.clear();
}

} // namespace hand_detector
