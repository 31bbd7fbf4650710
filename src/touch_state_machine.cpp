#include "touch_state_machine.hpp"

namespace touch {

const char* phase_to_string(TouchPhase phase) {
    switch (phase) {
        case TouchPhase::IDLE: return "IDLE";
        case TouchPhase::HOVER: return "HOVER";
        case TouchPhase::PRESSED: return "PRESSED";
    }
    return "UNKNOWN";
}

bool TouchConfig::validate() const noexcept {
    if (!(touch_threshold > 0.0f)) return false;
    if (cooldown.count() < 0) return false;
    if (press_flash.count() < 0) return false;
    return true;
}

TouchStateMachine::TouchStateMachine(const TouchConfig& config) : config_(config) {}

bool TouchStateMachine::in_cooldown(const TouchState& state, Clock::time_point now) const {
    if (!state.last_press_time) return false;
    return (now - *state.last_press_time) < config_.cooldown;
}

bool TouchStateMachine::is_flashing(const TouchState& state, layout::ButtonId id,
                                    Clock::time_point now) const {
    if (!state.last_pressed || *state.last_pressed != id || !state.last_press_time) return false;
    return (now - *state.last_press_time) < config_.press_flash;
}

std::optional<PressEvent> TouchStateMachine::advance(TouchState& state,
                                                     const hand_detector::PoseClassification& pose,
                                                     const layout::ButtonLayout& layout,
                                                     Clock::time_point now) const {
    if (!pose.is_pointing() || !pose.fingertip) {
        state.phase = TouchPhase::IDLE;
        state.hovered.reset();
        return std::nullopt;
    }

    const hand_detector::Point& tip = *pose.fingertip;
    const layout::Button* button = layout.hit_test(tip);
    if (!button) {
        state.phase = TouchPhase::IDLE;
        state.hovered.reset();
        return std::nullopt;
    }

    state.phase = TouchPhase::HOVER;
    state.hovered = button->id;

    if (tip.distance(button->center()) >= config_.touch_threshold) {
        return std::nullopt;
    }
    if (in_cooldown(state, now)) {
        return std::nullopt;
    }

    state.phase = TouchPhase::PRESSED;
    state.last_pressed = button->id;
    state.last_press_time = now;
    return PressEvent{button->id, now};
}

} // namespace touch
