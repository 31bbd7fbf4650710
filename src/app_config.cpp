#include "app_config.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace pipeline {

bool PipelineConfig::validate() const noexcept {
    if (history_name.empty()) return false;
    if (theme != "dark" && theme != "light") return false;
    if (stats_interval < 0) return false;
    return true;
}

} // namespace pipeline

namespace config {

namespace {

std::string rest_of_line(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    return trim_ws(rest);
}

void set_from_env(const char* name, std::string& target) {
    if (const char* v = std::getenv(name); v && *v) {
        target = v;
        std::cerr << "[Config] " << name << " = " << target << "\n";
    }
}

} // namespace

std::string trim_ws(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool AppConfig::validate() const noexcept {
    if (camera.width == 0 || camera.height == 0 || camera.framerate == 0) return false;
    if (!gesture.validate()) return false;
    if (!layout.validate()) return false;
    if (!touch.validate()) return false;
    if (!pipeline.validate()) return false;
    if (!model.validate()) return false;
    // A press must land inside the button it is hovering
    if (touch.touch_threshold * 2.0f >= static_cast<float>(layout.button_width)) return false;
    return true;
}

bool AppConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config][ERROR] Failed to open: " << path << "\n";
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim_ws(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        long long ms = 0;
        // Camera
        if (key == "camera_width") iss >> camera.width;
        else if (key == "camera_height") iss >> camera.height;
        else if (key == "camera_framerate") iss >> camera.framerate;
        else if (key == "mirror") iss >> camera.mirror;
        else if (key == "camera_command") camera.command = rest_of_line(iss);
        // Gesture
        else if (key == "extension_margin") iss >> gesture.extension_margin;
        else if (key == "min_confidence") iss >> gesture.min_confidence;
        else if (key == "gesture_history") iss >> gesture.gesture_history;
        // Layout
        else if (key == "panel_width") iss >> layout.panel_width;
        else if (key == "button_width") iss >> layout.button_width;
        else if (key == "button_height") iss >> layout.button_height;
        else if (key == "button_gutter") iss >> layout.button_gutter;
        else if (key == "grid_inset") iss >> layout.grid_inset;
        else if (key == "grid_top") iss >> layout.grid_top;
        // Touch
        else if (key == "touch_threshold") iss >> touch.touch_threshold;
        else if (key == "cooldown_ms") { if (iss >> ms) touch.cooldown = std::chrono::milliseconds(ms); }
        else if (key == "press_flash_ms") { if (iss >> ms) touch.press_flash = std::chrono::milliseconds(ms); }
        // Pipeline
        else if (key == "display_width") iss >> pipeline.display_width;
        else if (key == "display_height") iss >> pipeline.display_height;
        else if (key == "history_name") pipeline.history_name = rest_of_line(iss);
        else if (key == "autosave_history") iss >> pipeline.autosave_history;
        else if (key == "mirror_landmarks") iss >> pipeline.mirror_landmarks;
        else if (key == "show_instructions") iss >> pipeline.show_instructions;
        else if (key == "theme") iss >> pipeline.theme;
        else if (key == "stats_interval") iss >> pipeline.stats_interval;
        // Landmark model
        else if (key == "model_path") model.model_path = rest_of_line(iss);
        else if (key == "palm_model_path") model.palm_model_path = rest_of_line(iss);
        else if (key == "min_detection_confidence") iss >> model.min_detection_confidence;
        else if (key == "min_tracking_confidence") iss >> model.min_tracking_confidence;
        else if (key == "num_threads") iss >> model.num_threads;
        else if (key == "max_hands") iss >> model.max_hands;
        else if (key == "verbose") {
            bool v = false;
            iss >> v;
            camera.verbose = gesture.verbose = pipeline.verbose = model.verbose = v;
        }
        else {
            std::cerr << "[Config][WARN] " << path << ":" << line_no << " unknown key '" << key << "'\n";
            continue;
        }

        if (iss.fail()) {
            std::cerr << "[Config][WARN] " << path << ":" << line_no << " bad value for '" << key << "'\n";
        }
    }

    if (!validate()) {
        std::cerr << "[Config][ERROR] Invalid configuration in " << path << "\n";
        return false;
    }
    return true;
}

bool AppConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config][ERROR] Failed to save to: " << path << "\n";
        return false;
    }

    file << "# Touch calculator configuration\n";
    file << "# Camera\n";
    file << "camera_width " << camera.width << "\n";
    file << "camera_height " << camera.height << "\n";
    file << "camera_framerate " << camera.framerate << "\n";
    file << "mirror " << camera.mirror << "\n";
    if (!camera.command.empty())
        file << "camera_command " << camera.command << "\n";
    file << "\n# Gesture\n";
    file << "extension_margin " << gesture.extension_margin << "\n";
    file << "min_confidence " << gesture.min_confidence << "\n";
    file << "gesture_history " << gesture.gesture_history << "\n";
    file << "\n# Layout\n";
    file << "panel_width " << layout.panel_width << "\n";
    file << "button_width " << layout.button_width << "\n";
    file << "button_height " << layout.button_height << "\n";
    file << "button_gutter " << layout.button_gutter << "\n";
    file << "grid_inset " << layout.grid_inset << "\n";
    file << "grid_top " << layout.grid_top << "\n";
    file << "\n# Touch\n";
    file << "touch_threshold " << touch.touch_threshold << "\n";
    file << "cooldown_ms " << touch.cooldown.count() << "\n";
    file << "press_flash_ms " << touch.press_flash.count() << "\n";
    file << "\n# Pipeline\n";
    file << "display_width " << pipeline.display_width << "\n";
    file << "display_height " << pipeline.display_height << "\n";
    file << "history_name " << pipeline.history_name << "\n";
    file << "autosave_history " << pipeline.autosave_history << "\n";
    file << "mirror_landmarks " << pipeline.mirror_landmarks << "\n";
    file << "show_instructions " << pipeline.show_instructions << "\n";
    file << "theme " << pipeline.theme << "\n";
    file << "stats_interval " << pipeline.stats_interval << "\n";
    file << "\n# Landmark model\n";
    file << "model_path " << model.model_path << "\n";
    file << "palm_model_path " << model.palm_model_path << "\n";
    file << "min_detection_confidence " << model.min_detection_confidence << "\n";
    file << "min_tracking_confidence " << model.min_tracking_confidence << "\n";
    file << "num_threads " << model.num_threads << "\n";
    file << "max_hands " << model.max_hands << "\n";
    file << "\nverbose " << pipeline.verbose << "\n";

    file.flush();
    if (!file) {
        std::cerr << "[Config][ERROR] Write failed: " << path << "\n";
        return false;
    }
    return true;
}

void AppConfig::apply_env() {
    set_from_env("TOUCHCALC_MODEL_PATH", model.model_path);
    set_from_env("TOUCHCALC_PALM_MODEL_PATH", model.palm_model_path);
    set_from_env("TOUCHCALC_CAMERA_CMD", camera.command);
    set_from_env("TOUCHCALC_HISTORY", pipeline.history_name);
}

std::string load_dotenv(const std::vector<std::string>& candidates) {
    for (const auto& p : candidates) {
        FILE* f = std::fopen(p.c_str(), "r");
        if (!f) continue;
        std::cerr << "[Config] Loading .env from: " << p << "\n";
        char line[4096];
        while (std::fgets(line, sizeof(line), f)) {
            std::string s = trim_ws(line);
            if (s.empty() || s[0] == '#') continue;
            auto eq = s.find('=');
            if (eq == std::string::npos) continue;
            std::string key = trim_ws(s.substr(0, eq));
            std::string val = trim_ws(s.substr(eq + 1));
            if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                                    (val.front() == '\'' && val.back() == '\''))) {
                val = val.substr(1, val.size() - 2);
            }
            if (key.empty()) continue;
            if (std::getenv(key.c_str())) {
                std::cerr << "[Config] Keeping existing env var: " << key << "\n";
                continue;
            }
            setenv(key.c_str(), val.c_str(), 0);
        }
        std::fclose(f);
        return p;  // stop after first readable .env
    }
    return "";
}

std::vector<std::string> default_dotenv_candidates() {
    std::vector<std::string> candidates;
    char exe_path_buf[4096] = {0};
    ssize_t rn = readlink("/proc/self/exe", exe_path_buf, sizeof(exe_path_buf) - 1);
    if (rn > 0) {
        std::string exe(exe_path_buf, static_cast<size_t>(rn));
        auto last_slash = exe.find_last_of('/');
        std::string exe_dir = last_slash == std::string::npos ? std::string(".") : exe.substr(0, last_slash);
        candidates.push_back(exe_dir + "/.env");
        auto ppos = exe_dir.find_last_of('/');
        if (ppos != std::string::npos) {
            candidates.push_back(exe_dir.substr(0, ppos) + "/.env");
        }
    }
    char cwd_buf[4096] = {0};
    if (getcwd(cwd_buf, sizeof(cwd_buf))) {
        std::string cwd(cwd_buf);
        candidates.insert(candidates.begin(), cwd + "/.env");
        auto pos = cwd.find_last_of('/');
        if (pos != std::string::npos) {
            std::string parent = cwd.substr(0, pos);
            auto pos2 = parent.find_last_of('/');
            if (pos2 != std::string::npos) {
                candidates.push_back(parent.substr(0, pos2) + "/.env");
            }
        }
    }
    return candidates;
}

} // namespace config
