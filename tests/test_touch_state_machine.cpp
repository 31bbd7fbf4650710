#include <gtest/gtest.h>
#include "touch_state_machine.hpp"

using namespace touch;
using hand_detector::Point;
using hand_detector::PoseClassification;
using layout::ButtonId;
using std::chrono::milliseconds;

class TouchStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        layout_ = layout::ButtonLayout::build(1280, 720);
        t0_ = Clock::time_point{} + std::chrono::seconds(100);
    }

    Point centre(ButtonId id) const { return layout_.find(id)->center(); }

    std::optional<PressEvent> step(const PoseClassification& pose, milliseconds at) {
        return machine_.advance(state_, pose, layout_, t0_ + at);
    }

    layout::ButtonLayout layout_;
    TouchStateMachine machine_;
    TouchState state_;
    Clock::time_point t0_;
};

TEST_F(TouchStateMachineTest, StartsIdle) {
    EXPECT_EQ(state_.phase, TouchPhase::IDLE);
    EXPECT_FALSE(state_.hovered.has_value());
    EXPECT_FALSE(state_.last_press_time.has_value());
}

TEST_F(TouchStateMachineTest, PressAtCentre) {
    auto press = step(PoseClassification::pointing(centre(ButtonId::DIGIT_7)), milliseconds(0));
    ASSERT_TRUE(press.has_value());
    EXPECT_EQ(press->id, ButtonId::DIGIT_7);
    EXPECT_EQ(press->time, t0_);
    EXPECT_EQ(state_.phase, TouchPhase::PRESSED);
    EXPECT_EQ(state_.last_pressed, ButtonId::DIGIT_7);
}

TEST_F(TouchStateMachineTest, HoverOutsideThreshold) {
    // CLEAR is 80x60 at (900, 200); a corner is inside the rect but >30 px from the centre
    auto press = step(PoseClassification::pointing(Point(902, 202)), milliseconds(0));
    EXPECT_FALSE(press.has_value());
    EXPECT_EQ(state_.phase, TouchPhase::HOVER);
    EXPECT_EQ(state_.hovered, ButtonId::CLEAR);
}

TEST_F(TouchStateMachineTest, ThresholdIsStrict) {
    Point c = centre(ButtonId::DIGIT_5);
    EXPECT_FALSE(step(PoseClassification::pointing(Point(c.x + 30.0f, c.y)), milliseconds(0)).has_value());
    EXPECT_EQ(state_.phase, TouchPhase::HOVER);
    EXPECT_TRUE(step(PoseClassification::pointing(Point(c.x + 29.5f, c.y)), milliseconds(10)).has_value());
}

TEST_F(TouchStateMachineTest, NotPointingIsIdle) {
    step(PoseClassification::pointing(centre(ButtonId::DIGIT_1)), milliseconds(0));
    step(PoseClassification::other(), milliseconds(50));
    EXPECT_EQ(state_.phase, TouchPhase::IDLE);
    EXPECT_FALSE(state_.hovered.has_value());

    step(PoseClassification::no_hand(), milliseconds(60));
    EXPECT_EQ(state_.phase, TouchPhase::IDLE);
    // The last press is remembered for the cooldown and the press flash
    EXPECT_EQ(state_.last_pressed, ButtonId::DIGIT_1);
}

TEST_F(TouchStateMachineTest, OutsideAnyButtonIsIdle) {
    auto press = step(PoseClassification::pointing(Point(200, 300)), milliseconds(0));
    EXPECT_FALSE(press.has_value());
    EXPECT_EQ(state_.phase, TouchPhase::IDLE);
    EXPECT_FALSE(state_.hovered.has_value());
}

TEST_F(TouchStateMachineTest, CooldownSuppressesRepeatPress) {
    auto tip = PoseClassification::pointing(centre(ButtonId::DIGIT_3));
    ASSERT_TRUE(step(tip, milliseconds(0)).has_value());
    EXPECT_FALSE(step(tip, milliseconds(33)).has_value());
    EXPECT_EQ(state_.phase, TouchPhase::HOVER);
    EXPECT_FALSE(step(tip, milliseconds(299)).has_value());
    EXPECT_TRUE(step(tip, milliseconds(300)).has_value());
}

TEST_F(TouchStateMachineTest, CooldownIsGlobal) {
    ASSERT_TRUE(step(PoseClassification::pointing(centre(ButtonId::DIGIT_3)), milliseconds(0)).has_value());
    EXPECT_FALSE(step(PoseClassification::pointing(centre(ButtonId::ADD)), milliseconds(100)).has_value());
    EXPECT_EQ(state_.hovered, ButtonId::ADD);
    auto press = step(PoseClassification::pointing(centre(ButtonId::ADD)), milliseconds(350));
    ASSERT_TRUE(press.has_value());
    EXPECT_EQ(press->id, ButtonId::ADD);
}

TEST_F(TouchStateMachineTest, PressesAreSpacedByCooldown) {
    auto tip = PoseClassification::pointing(centre(ButtonId::DIGIT_9));
    std::vector<Clock::time_point> presses;
    for (int frame = 0; frame < 60; ++frame) {
        if (auto p = step(tip, milliseconds(frame * 33)))
            presses.push_back(p->time);
    }
    ASSERT_GE(presses.size(), 2u);
    for (size_t i = 1; i < presses.size(); ++i) {
        EXPECT_GE(presses[i] - presses[i - 1], milliseconds(300));
    }
}

TEST_F(TouchStateMachineTest, PressFlash) {
    ASSERT_TRUE(step(PoseClassification::pointing(centre(ButtonId::EQUALS)), milliseconds(0)).has_value());
    EXPECT_TRUE(machine_.is_flashing(state_, ButtonId::EQUALS, t0_ + milliseconds(150)));
    EXPECT_FALSE(machine_.is_flashing(state_, ButtonId::ADD, t0_ + milliseconds(150)));
    EXPECT_FALSE(machine_.is_flashing(state_, ButtonId::EQUALS, t0_ + milliseconds(200)));
}

TEST_F(TouchStateMachineTest, ResetClearsState) {
    step(PoseClassification::pointing(centre(ButtonId::DIGIT_2)), milliseconds(0));
    state_.reset();
    EXPECT_EQ(state_.phase, TouchPhase::IDLE);
    EXPECT_FALSE(state_.last_pressed.has_value());
    EXPECT_FALSE(machine_.in_cooldown(state_, t0_ + milliseconds(1)));
}

TEST(TouchConfigTest, CustomThresholdAndCooldown) {
    TouchConfig cfg;
    cfg.touch_threshold = 10.0f;
    cfg.cooldown = milliseconds(0);
    ASSERT_TRUE(cfg.validate());
    TouchStateMachine machine(cfg);
    TouchState state;
    auto lay = layout::ButtonLayout::build(1280, 720);
    Point c = lay.find(ButtonId::DIGIT_8)->center();
    auto now = Clock::now();

    EXPECT_FALSE(machine.advance(state, PoseClassification::pointing(Point(c.x + 15, c.y)), lay, now).has_value());
    EXPECT_TRUE(machine.advance(state, PoseClassification::pointing(c), lay, now).has_value());
    EXPECT_TRUE(machine.advance(state, PoseClassification::pointing(c), lay, now).has_value());

    cfg.touch_threshold = 0.0f;
    EXPECT_FALSE(cfg.validate());
    cfg.touch_threshold = 10.0f;
    cfg.cooldown = milliseconds(-1);
    EXPECT_FALSE(cfg.validate());
}

TEST(TouchPhaseTest, Names) {
    EXPECT_STREQ(phase_to_string(TouchPhase::IDLE), "IDLE");
    EXPECT_STREQ(phase_to_string(TouchPhase::HOVER), "HOVER");
    EXPECT_STREQ(phase_to_string(TouchPhase::PRESSED), "PRESSED");
}
