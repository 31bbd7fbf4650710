#pragma once

#include "camera.hpp"
#include <array>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace hand_detector {

// Represents a 2D point in camera-frame or display pixels
struct Point {
    float x;
    float y;

    Point() : x(0.0f), y(0.0f) {}
    Point(float x_, float y_) : x(x_), y(y_) {}

    // Distance to another point
    float distance(const Point& other) const {
        float dx = x - other.x;
        float dy = y - other.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    bool is_finite() const { return std::isfinite(x) && std::isfinite(y); }
};

// Hand landmark indices (21 landmarks per hand, MediaPipe order)
enum class HandLandmark {
    WRIST = 0,
    THUMB_CMC = 1,
    THUMB_MCP = 2,
    THUMB_IP = 3,
    THUMB_TIP = 4,
    INDEX_FINGER_MCP = 5,
    INDEX_FINGER_PIP = 6,
    INDEX_FINGER_DIP = 7,
    INDEX_FINGER_TIP = 8,
    MIDDLE_FINGER_MCP = 9,
    MIDDLE_FINGER_PIP = 10,
    MIDDLE_FINGER_DIP = 11,
    MIDDLE_FINGER_TIP = 12,
    RING_FINGER_MCP = 13,
    RING_FINGER_PIP = 14,
    RING_FINGER_DIP = 15,
    RING_FINGER_TIP = 16,
    PINKY_MCP = 17,
    PINKY_PIP = 18,
    PINKY_DIP = 19,
    PINKY_TIP = 20
};

constexpr int kNumLandmarks = 21;

// Fingers in landmark order; the thumb never takes part in classification
enum class Finger {
    THUMB = 0,
    INDEX = 1,
    MIDDLE = 2,
    RING = 3,
    PINKY = 4
};

// One detected hand: a complete set of labelled landmarks in frame pixels
struct HandLandmarks {
    std::array<Point, kNumLandmarks> points;
    float confidence;  // Hand presence score (0.0 - 1.0)
    bool is_left_hand;

    HandLandmarks() : confidence(0.0f), is_left_hand(false) {}

    const Point& at(HandLandmark lm) const { return points[static_cast<int>(lm)]; }
    Point& at(HandLandmark lm) { return points[static_cast<int>(lm)]; }
};

// Skeleton edges used for drawing the tracked hand
extern const std::array<std::pair<int, int>, 21> kHandConnections;

// Source of per-frame landmarks. Returns an empty vector when no hand is
// visible; implementations must not throw into the frame loop.
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    virtual bool init() = 0;
    virtual std::vector<HandLandmarks> detect(const camera::Frame& frame) = 0;
    virtual std::string name() const = 0;
};

// Detection statistics
struct DetectionStats {
    uint64_t frames_processed{0};
    uint64_t hands_detected{0};
    double avg_process_time_ms{0.0};
    uint64_t last_detection_timestamp{0};

    void reset() noexcept {
        frames_processed = 0;
        hands_detected = 0;
        avg_process_time_ms = 0.0;
        last_detection_timestamp = 0;
    }
};

} // namespace hand_detector
