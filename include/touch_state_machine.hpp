#pragma once

#include "button_layout.hpp"
#include "gesture_classifier.hpp"
#include <chrono>
#include <optional>

namespace touch {

using Clock = std::chrono::steady_clock;

enum class TouchPhase {
    IDLE,     // No hand, not pointing, or pointing outside every button
    HOVER,    // Pointing inside a button's rectangle
    PRESSED   // A press was emitted this frame
};

const char* phase_to_string(TouchPhase phase);

struct TouchConfig {
    float touch_threshold{30.0f};                      // Max fingertip distance from button centre for a press (px)
    std::chrono::milliseconds cooldown{300};           // Minimum time between two presses
    std::chrono::milliseconds press_flash{200};        // How long the renderer highlights a press

    [[nodiscard]] bool validate() const noexcept;
};

// Per-process touch state, advanced once per frame
struct TouchState {
    TouchPhase phase{TouchPhase::IDLE};
    std::optional<layout::ButtonId> hovered;
    std::optional<layout::ButtonId> last_pressed;
    std::optional<Clock::time_point> last_press_time;

    void reset() { *this = TouchState{}; }
};

struct PressEvent {
    layout::ButtonId id;
    Clock::time_point time;
};

// Two-tier hit test: the button rectangle gives hover, proximity to the
// button centre (strictly below touch_threshold) gives a press. Presses are
// suppressed while the cooldown since the previous press is running.
class TouchStateMachine {
public:
    explicit TouchStateMachine(const TouchConfig& config = TouchConfig{});

    std::optional<PressEvent> advance(TouchState& state,
                                      const hand_detector::PoseClassification& pose,
                                      const layout::ButtonLayout& layout,
                                      Clock::time_point now) const;

    bool in_cooldown(const TouchState& state, Clock::time_point now) const;

    // True while the last press of `id` should still be drawn highlighted
    bool is_flashing(const TouchState& state, layout::ButtonId id, Clock::time_point now) const;

    const TouchConfig& config() const { return config_; }

private:
    TouchConfig config_;
};

} // namespace touch
