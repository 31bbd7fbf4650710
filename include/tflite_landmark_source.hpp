/**
 * @file tflite_landmark_source.hpp
 * @brief TensorFlow Lite hand landmark source
 *
 * Palm detection followed by the 21-point hand landmark model. When the
 * previous frame produced a confident hand, its landmark bounding box is
 * reused as the region of interest and palm detection is skipped.
 */

#pragma once

#include "camera.hpp"
#include "hand_detector.hpp"
#include <memory>
#include <string>
#include <vector>

namespace hand_detector {

/**
 * @brief TensorFlow Lite model configuration
 */
struct TFLiteConfig {
    std::string model_path{"models/hand_landmark_lite.tflite"};
    std::string palm_model_path{"models/palm_detection_lite.tflite"};
    float min_detection_confidence{0.8f};  // Palm score needed to start tracking a hand
    float min_tracking_confidence{0.7f};   // Landmark presence needed to keep tracking
    int num_threads{4};
    int max_hands{1};
    bool verbose{false};

    [[nodiscard]] bool validate() const noexcept;
};

/**
 * @brief Axis-aligned region of interest in frame pixels
 */
struct RegionOfInterest {
    int x{0};
    int y{0};
    int width{0};
    int height{0};
    float score{0.0f};

    bool empty() const { return width <= 0 || height <= 0; }
};

/**
 * @brief Bounding box of a hand's landmarks grown by `margin` (relative),
 * squared and clamped to the frame. Used for landmark tracking.
 */
RegionOfInterest roi_from_landmarks(const HandLandmarks& hand, uint32_t frame_width,
                                    uint32_t frame_height, float margin);

/**
 * @brief Number of usable palm detections given the model's count output
 * and the number of slots in its scores and boxes tensors. A non-finite or
 * negative count yields 0.
 */
int palm_count(float reported, int score_slots, int box_slots);

// Forward declaration
struct TFLiteLandmarkSourceImpl;

/**
 * @brief LandmarkSource backed by TensorFlow Lite
 *
 * Without TFLite support compiled in, init() fails and detect() always
 * reports no hand.
 */
class TFLiteLandmarkSource : public LandmarkSource {
public:
    TFLiteLandmarkSource();
    explicit TFLiteLandmarkSource(const TFLiteConfig& config);
    ~TFLiteLandmarkSource() override;

    bool init() override;
    std::vector<HandLandmarks> detect(const camera::Frame& frame) override;
    std::string name() const override { return "tflite"; }

    DetectionStats get_stats() const;
    void reset_stats();
    const std::string& get_error() const { return last_error_; }

    /**
     * @brief Check if TFLite support is compiled in
     */
    static bool is_available() {
#ifdef HAVE_TFLITE
        return true;
#else
        return false;
#endif
    }

private:
    std::vector<RegionOfInterest> detect_palms(const camera::Frame& frame);
    bool detect_landmarks(const camera::Frame& frame, const RegionOfInterest& roi, HandLandmarks& hand);

    std::unique_ptr<TFLiteLandmarkSourceImpl> impl_;
    TFLiteConfig config_;
    std::string last_error_;

    // Disable copy
    TFLiteLandmarkSource(const TFLiteLandmarkSource&) = delete;
    TFLiteLandmarkSource& operator=(const TFLiteLandmarkSource&) = delete;
};

} // namespace hand_detector
