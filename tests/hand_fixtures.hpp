#pragma once

#include "hand_detector.hpp"

namespace test_support {

struct FingerState {
    bool index = true;
    bool middle = false;
    bool ring = false;
    bool pinky = false;
    bool thumb = false;
};

// Upright synthetic hand in frame pixels. With the index finger extended its
// tip lands exactly on `index_tip`; the wrist sits 120 px below it.
inline hand_detector::HandLandmarks make_hand(hand_detector::Point index_tip,
                                              FingerState fingers = FingerState{},
                                              float confidence = 0.9f) {
    using hand_detector::HandLandmark;
    using hand_detector::Point;

    hand_detector::HandLandmarks hand;
    hand.confidence = confidence;
    const Point wrist(index_tip.x + 20.0f, index_tip.y + 120.0f);
    hand.at(HandLandmark::WRIST) = wrist;

    hand.at(HandLandmark::THUMB_CMC) = Point(wrist.x - 30.0f, wrist.y - 20.0f);
    hand.at(HandLandmark::THUMB_MCP) = Point(wrist.x - 50.0f, wrist.y - 40.0f);
    hand.at(HandLandmark::THUMB_IP) = Point(wrist.x - 55.0f, wrist.y - 45.0f);
    hand.at(HandLandmark::THUMB_TIP) = fingers.thumb ? Point(wrist.x - 70.0f, wrist.y - 70.0f)
                                                     : Point(wrist.x - 20.0f, wrist.y - 40.0f);

    auto finger = [&](HandLandmark mcp, float dx, bool extended) {
        int base = static_cast<int>(mcp);
        hand.points[base + 0] = Point(wrist.x + dx, wrist.y - 50.0f);
        hand.points[base + 1] = Point(wrist.x + dx, wrist.y - 80.0f);
        hand.points[base + 2] = Point(wrist.x + dx, extended ? wrist.y - 100.0f : wrist.y - 60.0f);
        hand.points[base + 3] = Point(wrist.x + dx, extended ? wrist.y - 120.0f : wrist.y - 40.0f);
    };
    finger(HandLandmark::INDEX_FINGER_MCP, -20.0f, fingers.index);
    finger(HandLandmark::MIDDLE_FINGER_MCP, 0.0f, fingers.middle);
    finger(HandLandmark::RING_FINGER_MCP, 20.0f, fingers.ring);
    finger(HandLandmark::PINKY_MCP, 40.0f, fingers.pinky);
    return hand;
}

inline hand_detector::HandLandmarks make_pointing_hand(hand_detector::Point index_tip, float confidence = 0.9f) {
    return make_hand(index_tip, FingerState{}, confidence);
}

inline hand_detector::HandLandmarks make_open_hand(hand_detector::Point index_tip) {
    return make_hand(index_tip, FingerState{true, true, true, true, true});
}

inline hand_detector::HandLandmarks make_fist(hand_detector::Point index_tip) {
    return make_hand(index_tip, FingerState{false, false, false, false, false});
}

} // namespace test_support
