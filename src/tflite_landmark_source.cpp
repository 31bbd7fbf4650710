/**
 * @file tflite_landmark_source.cpp
 * @brief TensorFlow Lite hand landmark source
 *
 * Pipeline per frame:
 *  1. Region of interest: the tracked hand from the previous frame, or palm
 *     detection when nothing is tracked
 *  2. Crop + bilinear resize into the landmark model input
 *  3. 21 landmarks mapped back to frame pixels, presence score and handedness
 */

#include "tflite_landmark_source.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <optional>

#ifdef HAVE_TFLITE
#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/kernels/register.h>
#include <tensorflow/lite/model.h>
#endif

namespace hand_detector {

struct TFLiteLandmarkSourceImpl {
    bool initialized = false;
#ifdef HAVE_TFLITE
    std::unique_ptr<::tflite::FlatBufferModel> palm_model;
    std::unique_ptr<::tflite::Interpreter> palm_interpreter;
    std::unique_ptr<::tflite::FlatBufferModel> landmark_model;
    std::unique_ptr<::tflite::Interpreter> landmark_interpreter;
#endif
    std::optional<HandLandmarks> tracked;
    DetectionStats stats;
};

namespace {

// Palm box -> whole hand: the hand extends mostly above the palm
constexpr float kPalmToHandScale = 2.6f;
constexpr float kPalmShiftUp = 0.5f;
constexpr float kTrackingMargin = 0.25f;

RegionOfInterest clamp_square(float cx, float cy, float side, uint32_t fw, uint32_t fh, float score) {
    RegionOfInterest roi;
    int s = std::max(1, static_cast<int>(side));
    roi.x = std::max(0, static_cast<int>(cx - side * 0.5f));
    roi.y = std::max(0, static_cast<int>(cy - side * 0.5f));
    roi.width = std::min(s, static_cast<int>(fw) - roi.x);
    roi.height = std::min(s, static_cast<int>(fh) - roi.y);
    roi.score = score;
    return roi;
}

#ifdef HAVE_TFLITE
// Bilinear resize of an RGB888 crop into a model input buffer
template <typename T>
void resize_crop_bilinear(const camera::Frame& frame, const RegionOfInterest& roi,
                          T* dst, int dw, int dh, float scale) {
    const int sw = roi.width;
    const int sh = roi.height;
    auto src_at = [&](int x, int y, int c) -> float {
        x = std::clamp(x, 0, sw - 1);
        y = std::clamp(y, 0, sh - 1);
        size_t idx = static_cast<size_t>(roi.y + y) * frame.stride + static_cast<size_t>(roi.x + x) * 3 + c;
        return frame.data[idx];
    };
    for (int y = 0; y < dh; ++y) {
        float fy = (y + 0.5f) * sh / dh - 0.5f;
        int sy = static_cast<int>(std::floor(fy));
        float wy = fy - sy;
        for (int x = 0; x < dw; ++x) {
            float fx = (x + 0.5f) * sw / dw - 0.5f;
            int sx = static_cast<int>(std::floor(fx));
            float wx = fx - sx;
            for (int c = 0; c < 3; ++c) {
                float v = (1 - wy) * ((1 - wx) * src_at(sx, sy, c) + wx * src_at(sx + 1, sy, c)) +
                          wy * ((1 - wx) * src_at(sx, sy + 1, c) + wx * src_at(sx + 1, sy + 1, c));
                dst[(static_cast<size_t>(y) * dw + x) * 3 + c] =
                    static_cast<T>(std::max(0.f, std::min(255.f, v)) * scale);
            }
        }
    }
}

bool fill_input(::tflite::Interpreter& interp, const camera::Frame& frame, const RegionOfInterest& roi) {
    TfLiteTensor* input = interp.input_tensor(0);
    if (!input || input->dims->size < 3) return false;
    int ih = input->dims->data[1];
    int iw = input->dims->data[2];
    if (input->type == kTfLiteUInt8) {
        resize_crop_bilinear<uint8_t>(frame, roi, input->data.uint8, iw, ih, 1.0f);
        return true;
    }
    if (input->type == kTfLiteFloat32) {
        resize_crop_bilinear<float>(frame, roi, input->data.f, iw, ih, 1.0f / 255.0f);
        return true;
    }
    return false;
}

float as_probability(float v) {
    if (v >= 0.0f && v <= 1.0f) return v;
    return 1.0f / (1.0f + std::exp(-v));
}
#endif

} // namespace

bool TFLiteConfig::validate() const noexcept {
    if (min_detection_confidence < 0.0f || min_detection_confidence > 1.0f) return false;
    if (min_tracking_confidence < 0.0f || min_tracking_confidence > 1.0f) return false;
    if (num_threads < 1 || max_hands < 1) return false;
    return true;
}

RegionOfInterest roi_from_landmarks(const HandLandmarks& hand, uint32_t frame_width,
                                    uint32_t frame_height, float margin) {
    float min_x = hand.points[0].x, max_x = hand.points[0].x;
    float min_y = hand.points[0].y, max_y = hand.points[0].y;
    for (const auto& p : hand.points) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    float side = std::max(max_x - min_x, max_y - min_y) * (1.0f + 2.0f * margin);
    return clamp_square((min_x + max_x) * 0.5f, (min_y + max_y) * 0.5f, side,
                        frame_width, frame_height, hand.confidence);
}

int palm_count(float reported, int score_slots, int box_slots) {
    if (!std::isfinite(reported) || reported <= 0.0f) return 0;
    int capacity = std::max(0, std::min(score_slots, box_slots));
    if (reported >= static_cast<float>(capacity)) return capacity;
    return static_cast<int>(reported);
}

TFLiteLandmarkSource::TFLiteLandmarkSource() : impl_(std::make_unique<TFLiteLandmarkSourceImpl>()) {}

TFLiteLandmarkSource::TFLiteLandmarkSource(const TFLiteConfig& config)
    : impl_(std::make_unique<TFLiteLandmarkSourceImpl>()), config_(config) {}

TFLiteLandmarkSource::~TFLiteLandmarkSource() = default;

bool TFLiteLandmarkSource::init() {
    impl_->initialized = false;
#ifndef HAVE_TFLITE
    last_error_ = "TensorFlow Lite support not compiled in";
    std::cerr << "[Landmarks][ERROR] " << last_error_ << std::endl;
    return false;
#else
    if (!config_.validate()) {
        last_error_ = "Invalid TFLite configuration";
        std::cerr << "[Landmarks][ERROR] " << last_error_ << std::endl;
        return false;
    }
    ::tflite::ops::builtin::BuiltinOpResolver resolver;

    impl_->palm_model = ::tflite::FlatBufferModel::BuildFromFile(config_.palm_model_path.c_str());
    if (!impl_->palm_model) {
        last_error_ = "Failed to load palm model: " + config_.palm_model_path;
        std::cerr << "[Landmarks][ERROR] " << last_error_ << std::endl;
        return false;
    }
    ::tflite::InterpreterBuilder builder_palm(*impl_->palm_model, resolver);
    builder_palm(&impl_->palm_interpreter);
    if (!impl_->palm_interpreter || impl_->palm_interpreter->AllocateTensors() != kTfLiteOk) {
        last_error_ = "Failed to create palm interpreter";
        std::cerr << "[Landmarks][ERROR] " << last_error_ << std::endl;
        return false;
    }
    impl_->palm_interpreter->SetNumThreads(config_.num_threads);

    impl_->landmark_model = ::tflite::FlatBufferModel::BuildFromFile(config_.model_path.c_str());
    if (!impl_->landmark_model) {
        last_error_ = "Failed to load landmark model: " + config_.model_path;
        std::cerr << "[Landmarks][ERROR] " << last_error_ << std::endl;
        return false;
    }
    ::tflite::InterpreterBuilder builder_landmark(*impl_->landmark_model, resolver);
    builder_landmark(&impl_->landmark_interpreter);
    if (!impl_->landmark_interpreter || impl_->landmark_interpreter->AllocateTensors() != kTfLiteOk) {
        last_error_ = "Failed to create landmark interpreter";
        std::cerr << "[Landmarks][ERROR] " << last_error_ << std::endl;
        return false;
    }
    impl_->landmark_interpreter->SetNumThreads(config_.num_threads);

    impl_->initialized = true;
    std::cerr << "[Landmarks] TFLite models loaded: " << config_.palm_model_path << ", "
              << config_.model_path << " (" << config_.num_threads << " threads)" << std::endl;
    return true;
#endif
}

std::vector<RegionOfInterest> TFLiteLandmarkSource::detect_palms(const camera::Frame& frame) {
    std::vector<RegionOfInterest> palms;
#ifdef HAVE_TFLITE
    RegionOfInterest full{0, 0, static_cast<int>(frame.width), static_cast<int>(frame.height), 1.0f};
    if (!fill_input(*impl_->palm_interpreter, frame, full)) {
        std::cerr << "[Landmarks][ERROR] Unsupported palm model input tensor" << std::endl;
        return palms;
    }
    if (impl_->palm_interpreter->Invoke() != kTfLiteOk) {
        std::cerr << "[Landmarks][ERROR] Palm detection inference failed" << std::endl;
        return palms;
    }
    if (impl_->palm_interpreter->outputs().size() < 3) {
        std::cerr << "[Landmarks][ERROR] Palm model must output boxes, scores and count" << std::endl;
        return palms;
    }

    // Box format: [ymin, xmin, ymax, xmax] normalized
    const TfLiteTensor* boxes_tensor = impl_->palm_interpreter->output_tensor(0);
    const TfLiteTensor* scores_tensor = impl_->palm_interpreter->output_tensor(1);
    const TfLiteTensor* count_tensor = impl_->palm_interpreter->output_tensor(2);
    if (boxes_tensor->dims->size < 2 || scores_tensor->dims->size < 1 ||
        count_tensor->bytes < sizeof(float)) {
        std::cerr << "[Landmarks][ERROR] Unexpected palm model output shape" << std::endl;
        return palms;
    }
    const float* boxes = boxes_tensor->data.f;
    const float* scores = scores_tensor->data.f;
    int score_slots = scores_tensor->dims->data[scores_tensor->dims->size - 1];
    int box_slots = static_cast<int>(boxes_tensor->bytes / (4 * sizeof(float)));
    int num = palm_count(count_tensor->data.f[0], score_slots, box_slots);
    float fw = static_cast<float>(frame.width);
    float fh = static_cast<float>(frame.height);
    for (int i = 0; i < num; ++i) {
        float score = scores[i];
        if (score < config_.min_detection_confidence) continue;
        float xmin = boxes[i * 4 + 1] * fw;
        float ymin = boxes[i * 4 + 0] * fh;
        float xmax = boxes[i * 4 + 3] * fw;
        float ymax = boxes[i * 4 + 2] * fh;
        float w = xmax - xmin;
        float h = ymax - ymin;
        if (w <= 0.0f || h <= 0.0f) continue;
        float cx = (xmin + xmax) * 0.5f;
        float cy = (ymin + ymax) * 0.5f - h * kPalmShiftUp;
        palms.push_back(clamp_square(cx, cy, std::max(w, h) * kPalmToHandScale, frame.width, frame.height, score));
    }
    std::sort(palms.begin(), palms.end(),
              [](const RegionOfInterest& a, const RegionOfInterest& b) { return a.score > b.score; });
    if (config_.verbose) {
        std::cerr << "[Landmarks] Palm candidates: " << palms.size() << std::endl;
    }
#else
    (void)frame;
#endif
    return palms;
}

bool TFLiteLandmarkSource::detect_landmarks(const camera::Frame& frame, const RegionOfInterest& roi,
                                            HandLandmarks& hand) {
#ifdef HAVE_TFLITE
    if (roi.empty()) return false;
    ::tflite::Interpreter& interp = *impl_->landmark_interpreter;
    if (!fill_input(interp, frame, roi)) {
        std::cerr << "[Landmarks][ERROR] Unsupported landmark model input tensor" << std::endl;
        return false;
    }
    if (interp.Invoke() != kTfLiteOk) {
        std::cerr << "[Landmarks][ERROR] Landmark inference failed" << std::endl;
        return false;
    }

    TfLiteTensor* input = interp.input_tensor(0);
    float in_h = static_cast<float>(input->dims->data[1]);
    float in_w = static_cast<float>(input->dims->data[2]);

    // 21 x (x, y, z), either normalized or in model input pixels
    const float* lm = interp.output_tensor(0)->data.f;
    float max_coord = 0.0f;
    for (int i = 0; i < kNumLandmarks; ++i) {
        max_coord = std::max(max_coord, std::max(std::fabs(lm[i * 3]), std::fabs(lm[i * 3 + 1])));
    }
    bool pixel_units = max_coord > 1.5f;
    for (int i = 0; i < kNumLandmarks; ++i) {
        float nx = pixel_units ? lm[i * 3 + 0] / in_w : lm[i * 3 + 0];
        float ny = pixel_units ? lm[i * 3 + 1] / in_h : lm[i * 3 + 1];
        hand.points[i] = Point(roi.x + nx * roi.width, roi.y + ny * roi.height);
    }

    hand.confidence = roi.score;
    if (interp.outputs().size() > 1) {
        TfLiteTensor* conf = interp.output_tensor(1);
        if (conf && conf->type == kTfLiteFloat32) {
            hand.confidence = as_probability(conf->data.f[0]);
        }
    }
    if (interp.outputs().size() > 2) {
        TfLiteTensor* handed = interp.output_tensor(2);
        if (handed && handed->type == kTfLiteFloat32) {
            int n = 1;
            for (int d = 0; d < handed->dims->size; ++d) n *= handed->dims->data[d];
            if (n >= 2) {
                hand.is_left_hand = handed->data.f[0] > handed->data.f[1];
            } else {
                hand.is_left_hand = as_probability(handed->data.f[0]) < 0.5f;
            }
        }
    }
    return true;
#else
    (void)frame;
    (void)roi;
    (void)hand;
    return false;
#endif
}

std::vector<HandLandmarks> TFLiteLandmarkSource::detect(const camera::Frame& frame) {
    std::vector<HandLandmarks> hands;
    if (!impl_->initialized || frame.empty() || frame.format != camera::PixelFormat::RGB888) {
        return hands;
    }
    auto t0 = std::chrono::steady_clock::now();

    std::vector<RegionOfInterest> rois;
    bool tracking = impl_->tracked.has_value();
    if (tracking) {
        rois.push_back(roi_from_landmarks(*impl_->tracked, frame.width, frame.height, kTrackingMargin));
    } else {
        rois = detect_palms(frame);
    }

    for (const auto& roi : rois) {
        if (static_cast<int>(hands.size()) >= config_.max_hands) break;
        HandLandmarks hand;
        if (detect_landmarks(frame, roi, hand) && hand.confidence >= config_.min_tracking_confidence) {
            hands.push_back(hand);
        }
    }

    // Lost the tracked hand: fall back to palm detection on this frame
    if (hands.empty() && tracking) {
        for (const auto& roi : detect_palms(frame)) {
            if (static_cast<int>(hands.size()) >= config_.max_hands) break;
            HandLandmarks hand;
            if (detect_landmarks(frame, roi, hand) && hand.confidence >= config_.min_tracking_confidence) {
                hands.push_back(hand);
            }
        }
    }

    if (hands.empty()) {
        impl_->tracked.reset();
    } else {
        impl_->tracked = hands.front();
    }

    auto t1 = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    DetectionStats& st = impl_->stats;
    st.frames_processed++;
    st.hands_detected += hands.size();
    st.avg_process_time_ms += (ms - st.avg_process_time_ms) / static_cast<double>(st.frames_processed);
    if (!hands.empty()) st.last_detection_timestamp = frame.timestamp_ns;
    if (config_.verbose) {
        std::cerr << "[Landmarks] " << hands.size() << " hand(s) in " << ms << " ms"
                  << (tracking ? " (tracking)" : "") << std::endl;
    }
    return hands;
}

DetectionStats TFLiteLandmarkSource::get_stats() const {
    return impl_->stats;
}

void TFLiteLandmarkSource::reset_stats() {
    impl_->stats.reset();
}

} // namespace hand_detector
