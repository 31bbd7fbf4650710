#pragma once

#include "hand_detector.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace hand_detector {

// Pose of the tracked hand for one frame
enum class Pose {
    POINTING,  // Index extended, middle/ring/pinky curled
    OTHER,     // A hand is visible in any other pose
    NO_HAND    // Nothing usable this frame
};

const char* pose_to_string(Pose pose);

// Classification result. fingertip is set iff pose == POINTING and is
// already expressed in display pixels.
struct PoseClassification {
    Pose pose{Pose::NO_HAND};
    std::optional<Point> fingertip;

    static PoseClassification no_hand() { return PoseClassification{}; }
    static PoseClassification other() { return PoseClassification{Pose::OTHER, std::nullopt}; }
    static PoseClassification pointing(const Point& tip) { return PoseClassification{Pose::POINTING, tip}; }

    bool is_pointing() const { return pose == Pose::POINTING; }
};

// Gesture classification parameters
struct GestureConfig {
    float extension_margin{0.10f};  // Tip must be this much farther from the wrist than the PIP joint
    float min_confidence{0.5f};     // Hands scored below this are treated as absent
    int gesture_history{3};         // Majority vote window (1 = no smoothing)
    bool verbose{false};

    [[nodiscard]] bool validate() const noexcept;
};

// Linear camera-frame -> display transform. Optionally mirrors x.
class CoordinateMapper {
public:
    CoordinateMapper();
    CoordinateMapper(uint32_t frame_width, uint32_t frame_height,
                     uint32_t display_width, uint32_t display_height,
                     bool mirror = false);

    Point map(const Point& frame_point) const;

    uint32_t display_width() const { return display_width_; }
    uint32_t display_height() const { return display_height_; }

private:
    float scale_x_;
    float scale_y_;
    uint32_t display_width_;
    uint32_t display_height_;
    bool mirror_;
};

// Distance test against the wrist: a finger is extended when its tip lies
// farther from the wrist than its PIP joint by more than `margin` (relative).
bool is_finger_extended(const HandLandmarks& hand, Finger finger, float margin);

// Pose of a single hand, ignoring confidence. Thumb state is not considered.
Pose classify_hand(const HandLandmarks& hand, float margin);

// Per-frame classification. Uses the most confident hand when several are
// reported; missing, non-finite or low-confidence data yields NO_HAND.
PoseClassification classify(const std::vector<HandLandmarks>& hands,
                            const CoordinateMapper& mapper,
                            const GestureConfig& config);

// Sliding-window majority vote over the last K classifications. A NO_HAND
// frame passes through unchanged and a fingertip is only ever reported for
// the frame that produced it.
class GestureStabilizer {
public:
    explicit GestureStabilizer(int window_size = 3);

    // Add this frame's classification and return the voted result
    PoseClassification push(const PoseClassification& current);

    void reset();
    size_t size() const { return window_.size(); }
    int window_size() const { return window_size_; }

private:
    int window_size_;
    std::deque<PoseClassification> window_;
};

} // namespace hand_detector
