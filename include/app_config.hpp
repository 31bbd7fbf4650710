#pragma once

#include "button_layout.hpp"
#include "camera.hpp"
#include "gesture_classifier.hpp"
#include "tflite_landmark_source.hpp"
#include "touch_state_machine.hpp"
#include <string>
#include <vector>

namespace pipeline {

/**
 * @brief Frame loop and UI settings
 */
struct PipelineConfig {
    uint32_t display_width{0};       // 0 = use the connected mode
    uint32_t display_height{0};
    std::string history_name{"default"};
    bool autosave_history{true};     // Save the history log on exit
    bool mirror_landmarks{false};    // Mirror landmark x when mapping (camera does not mirror)
    bool show_instructions{true};
    std::string theme{"dark"};       // "dark" or "light"
    int stats_interval{300};         // Frames between stdout summaries, 0 = off
    bool verbose{false};

    [[nodiscard]] bool validate() const noexcept;
};

} // namespace pipeline

namespace config {

/**
 * @brief Whole-application configuration
 *
 * File format: one `key value` pair per line, `#` starts a comment line.
 * String values run to the end of the line.
 */
struct AppConfig {
    camera::CameraConfig camera;
    hand_detector::GestureConfig gesture;
    layout::LayoutConfig layout;
    touch::TouchConfig touch;
    pipeline::PipelineConfig pipeline;
    hand_detector::TFLiteConfig model;

    // Returns false if the file cannot be read or the result fails validate()
    bool load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;

    [[nodiscard]] bool validate() const noexcept;

    // TOUCHCALC_MODEL_PATH, TOUCHCALC_PALM_MODEL_PATH, TOUCHCALC_CAMERA_CMD, TOUCHCALC_HISTORY
    void apply_env();
};

std::string trim_ws(const std::string& s);

/**
 * @brief Load KEY=VALUE pairs from the first readable .env file
 *
 * Surrounding quotes are stripped from values. Variables already present
 * in the process environment are kept.
 *
 * @return Path of the file loaded, empty if none was readable
 */
std::string load_dotenv(const std::vector<std::string>& candidates);

// cwd/.env, exe_dir/.env, exe parent/.env, cwd grandparent/.env
std::vector<std::string> default_dotenv_candidates();

} // namespace config
