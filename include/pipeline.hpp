#pragma once
#include "app_config.hpp"
#include "calculation_history.hpp"
#include "calculator_engine.hpp"
#include "camera.hpp"
#include "renderer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace pipeline
{

    // Latest-frame handoff between the camera thread and the frame loop.
    // publish() replaces any unread frame; take() swaps the newest one out.
    class FrameSlot
    {
    public:
        void publish(camera::Frame &&frame);

        // Non-blocking; false if no frame arrived since the last take
        bool take(camera::Frame &out);

        // Wait up to `timeout` for a frame. False on timeout or once closed and drained.
        bool wait_take(camera::Frame &out, std::chrono::milliseconds timeout);

        // No more frames will be published
        void close();
        bool closed() const;

        uint64_t published() const;
        uint64_t dropped() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        camera::Frame frame_;
        bool has_frame_{false};
        bool closed_{false};
        uint64_t published_{0};
        uint64_t dropped_{0};
    };

    enum class KeyCommand
    {
        NONE,
        QUIT,
        TOGGLE_THEME,
        TOGGLE_INSTRUCTIONS,
        RESET_HISTORY,
        CLEAR,
        DELETE
    };

    // q t i r c d, Backspace/DEL for delete. Case-insensitive.
    KeyCommand key_to_command(int key);

    struct ProcessorStats
    {
        uint64_t frames_processed = 0;
        uint64_t frames_with_hand = 0;
        uint64_t presses = 0;
        double avg_process_time_ms = 0.0;
    };

    // Per-frame application logic: landmarks -> pose -> touch -> calculator.
    // Owns all calculator state; no I/O apart from logging.
    class FrameProcessor
    {
    public:
        FrameProcessor(const config::AppConfig &cfg,
                       uint32_t display_width, uint32_t display_height,
                       uint32_t frame_width, uint32_t frame_height);

        // Handle one frame of landmarks (camera-frame pixels)
        std::optional<touch::PressEvent> process(const std::vector<hand_detector::HandLandmarks> &hands,
                                                 touch::Clock::time_point now);

        // Returns false when the command asks to quit
        bool apply_command(KeyCommand cmd);

        renderer::ViewModel view(touch::Clock::time_point now) const;

        const layout::ButtonLayout &layout() const { return layout_; }
        const calculator::CalculatorEngine &engine() const { return engine_; }
        calculator::HistoryLog &history() { return history_; }
        const calculator::HistoryLog &history() const { return history_; }
        const touch::TouchState &touch_state() const { return touch_state_; }
        const hand_detector::PoseClassification &last_pose() const { return pose_; }
        const ProcessorStats &stats() const { return stats_; }
        renderer::ThemeKind theme() const { return theme_; }
        bool show_instructions() const { return show_instructions_; }

    private:
        config::AppConfig config_;
        layout::ButtonLayout layout_;
        hand_detector::CoordinateMapper mapper_;
        hand_detector::GestureStabilizer stabilizer_;
        touch::TouchStateMachine touch_;
        touch::TouchState touch_state_;
        calculator::CalculatorEngine engine_;
        calculator::HistoryLog history_;

        hand_detector::PoseClassification pose_;
        std::vector<hand_detector::Point> skeleton_;
        renderer::ThemeKind theme_;
        bool show_instructions_;
        ProcessorStats stats_;
    };

    // Camera thread + frame loop: capture -> landmarks -> FrameProcessor -> render
    class Pipeline
    {
    public:
        Pipeline(const config::AppConfig &cfg,
                 hand_detector::LandmarkSource &source,
                 renderer::FrameSink &sink);
        ~Pipeline();

        // Runs until stop(), `q`, or the camera stream ends. Returns a process exit code.
        int run();

        // Safe to call from a signal handler
        void stop();
        bool is_running() const { return running_; }

        // Read key commands from stdin (on by default)
        void set_keyboard_enabled(bool enabled) { keyboard_ = enabled; }

        const FrameProcessor *processor() const { return processor_.get(); }
        const std::string &get_error() const { return last_error_; }

    private:
        void camera_thread_fn();
        void handle_keys();
        void print_stats(std::ostream &out) const;

        config::AppConfig config_;
        hand_detector::LandmarkSource &source_;
        renderer::FrameSink &sink_;
        camera::Camera camera_;
        FrameSlot slot_;
        std::unique_ptr<FrameProcessor> processor_;

        std::atomic<bool> running_{false};
        bool keyboard_{true};
        std::thread camera_thread_;
        std::string last_error_;

        Pipeline(const Pipeline &) = delete;
        Pipeline &operator=(const Pipeline &) = delete;
    };

} // namespace pipeline
