#pragma once

#include "hand_detector.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace layout {

// Identifiers for every calculator key
enum class ButtonId {
    DIGIT_0, DIGIT_1, DIGIT_2, DIGIT_3, DIGIT_4,
    DIGIT_5, DIGIT_6, DIGIT_7, DIGIT_8, DIGIT_9,
    DECIMAL,
    ADD,
    SUBTRACT,
    MULTIPLY,
    DIVIDE,
    EQUALS,
    CLEAR,
    DEL,
    TOGGLE_SIGN,
    PERCENT
};

enum class ButtonCategory {
    DIGIT,     // 0-9 and the decimal point
    OPERATOR,  // + - × ÷
    COMMAND,   // C, del, ±, %
    EQUALS
};

// Display label ("7", "÷", "±", "del", ...)
const char* button_label(ButtonId id);
ButtonCategory button_category(ButtonId id);
bool is_digit(ButtonId id);
int digit_value(ButtonId id);  // -1 for non-digits
ButtonId digit_button(int value);

// Axis-aligned rectangle, half-open: [x, x + width) x [y, y + height)
struct Rect {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    bool contains(float px, float py) const {
        return px >= static_cast<float>(x) && px < static_cast<float>(x + width) &&
               py >= static_cast<float>(y) && py < static_cast<float>(y + height);
    }
    hand_detector::Point center() const {
        return hand_detector::Point(x + width * 0.5f, y + height * 0.5f);
    }
    int right() const { return x + width; }
    int bottom() const { return y + height; }
};

struct Button {
    ButtonId id;
    std::string label;
    ButtonCategory category;
    Rect rect;

    hand_detector::Point center() const { return rect.center(); }
};

// Panel and grid geometry
struct LayoutConfig {
    int panel_width{400};    // Calculator panel at the right edge of the display
    int button_width{80};
    int button_height{60};
    int button_gutter{8};    // Gap between neighbouring buttons
    int grid_inset{20};      // Grid offset from the panel's left edge
    int grid_top{200};       // Grid offset from the top of the display

    [[nodiscard]] bool validate() const noexcept;
};

// Fixed 4x5 calculator grid:
//   C  ±  %  ÷
//   7  8  9  ×
//   4  5  6  −
//   1  2  3  +
//   0  0  .  =
class ButtonLayout {
public:
    ButtonLayout() = default;

    // Compute geometry for the given display size
    static ButtonLayout build(uint32_t display_width, uint32_t display_height,
                              const LayoutConfig& config = LayoutConfig{});

    // Button whose rectangle contains the point, nullptr for gutters and outside points
    const Button* hit_test(const hand_detector::Point& point) const;

    const Button* find(ButtonId id) const;
    const std::vector<Button>& buttons() const { return buttons_; }

    const Rect& panel_rect() const { return panel_; }
    const Rect& display_rect() const { return display_; }
    uint32_t display_width() const { return display_width_; }
    uint32_t display_height() const { return display_height_; }
    const LayoutConfig& config() const { return config_; }

private:
    std::vector<Button> buttons_;
    Rect panel_;
    Rect display_;
    uint32_t display_width_{0};
    uint32_t display_height_{0};
    LayoutConfig config_;
};

} // namespace layout
