#include "button_layout.hpp"
#include <algorithm>
#include <array>

namespace layout {

namespace {

// Grid cells in row-major order; ZERO spans two columns in the last row
struct Cell {
    ButtonId id;
    int row;
    int col;
    int span;
};

constexpr std::array<Cell, 19> kGrid = {{
    {ButtonId::CLEAR, 0, 0, 1},
    {ButtonId::TOGGLE_SIGN, 0, 1, 1},
    {ButtonId::PERCENT, 0, 2, 1},
    {ButtonId::DIVIDE, 0, 3, 1},
    {ButtonId::DIGIT_7, 1, 0, 1},
    {ButtonId::DIGIT_8, 1, 1, 1},
    {ButtonId::DIGIT_9, 1, 2, 1},
    {ButtonId::MULTIPLY, 1, 3, 1},
    {ButtonId::DIGIT_4, 2, 0, 1},
    {ButtonId::DIGIT_5, 2, 1, 1},
    {ButtonId::DIGIT_6, 2, 2, 1},
    {ButtonId::SUBTRACT, 2, 3, 1},
    {ButtonId::DIGIT_1, 3, 0, 1},
    {ButtonId::DIGIT_2, 3, 1, 1},
    {ButtonId::DIGIT_3, 3, 2, 1},
    {ButtonId::ADD, 3, 3, 1},
    {ButtonId::DIGIT_0, 4, 0, 2},
    {ButtonId::DECIMAL, 4, 2, 1},
    {ButtonId::EQUALS, 4, 3, 1},
}};

} // namespace

const char* button_label(ButtonId id) {
    switch (id) {
        case ButtonId::DIGIT_0: return "0";
        case ButtonId::DIGIT_1: return "1";
        case ButtonId::DIGIT_2: return "2";
        case ButtonId::DIGIT_3: return "3";
        case ButtonId::DIGIT_4: return "4";
        case ButtonId::DIGIT_5: return "5";
        case ButtonId::DIGIT_6: return "6";
        case ButtonId::DIGIT_7: return "7";
        case ButtonId::DIGIT_8: return "8";
        case ButtonId::DIGIT_9: return "9";
        case ButtonId::DECIMAL: return ".";
        case ButtonId::ADD: return "+";
        case ButtonId::SUBTRACT: return "−";
        case ButtonId::MULTIPLY: return "×";
        case ButtonId::DIVIDE: return "÷";
        case ButtonId::EQUALS: return "=";
        case ButtonId::CLEAR: return "C";
        case ButtonId::DEL: return "del";
        case ButtonId::TOGGLE_SIGN: return "±";
        case ButtonId::PERCENT: return "%";
    }
    return "?";
}

ButtonCategory button_category(ButtonId id) {
    switch (id) {
        case ButtonId::ADD:
        case ButtonId::SUBTRACT:
        case ButtonId::MULTIPLY:
        case ButtonId::DIVIDE:
            return ButtonCategory::OPERATOR;
        case ButtonId::EQUALS:
            return ButtonCategory::EQUALS;
        case ButtonId::CLEAR:
        case ButtonId::DEL:
        case ButtonId::TOGGLE_SIGN:
        case ButtonId::PERCENT:
            return ButtonCategory::COMMAND;
        default:
            return ButtonCategory::DIGIT;
    }
}

bool is_digit(ButtonId id) {
    return digit_value(id) >= 0;
}

int digit_value(ButtonId id) {
    int v = static_cast<int>(id) - static_cast<int>(ButtonId::DIGIT_0);
    return (v >= 0 && v <= 9) ? v : -1;
}

ButtonId digit_button(int value) {
    return static_cast<ButtonId>(static_cast<int>(ButtonId::DIGIT_0) + std::clamp(value, 0, 9));
}

bool LayoutConfig::validate() const noexcept {
    if (panel_width <= 0) return false;
    if (button_width <= 0 || button_height <= 0) return false;
    if (button_gutter < 0 || grid_inset < 0 || grid_top < 0) return false;
    return true;
}

ButtonLayout ButtonLayout::build(uint32_t display_width, uint32_t display_height,
                                 const LayoutConfig& config) {
    ButtonLayout out;
    out.display_width_ = display_width;
    out.display_height_ = display_height;
    out.config_ = config;

    int panel_x = std::max(0, static_cast<int>(display_width) - config.panel_width);
    out.panel_ = Rect{panel_x, 0, static_cast<int>(display_width) - panel_x, static_cast<int>(display_height)};
    out.display_ = Rect{panel_x + config.grid_inset, 50,
                        std::max(0, static_cast<int>(display_width) - config.grid_inset - (panel_x + config.grid_inset)),
                        100};

    int start_x = panel_x + config.grid_inset;
    int start_y = config.grid_top;
    int step_x = config.button_width + config.button_gutter;
    int step_y = config.button_height + config.button_gutter;

    out.buttons_.reserve(kGrid.size());
    for (const Cell& cell : kGrid) {
        Button b;
        b.id = cell.id;
        b.label = button_label(cell.id);
        b.category = button_category(cell.id);
        b.rect.x = start_x + cell.col * step_x;
        b.rect.y = start_y + cell.row * step_y;
        b.rect.width = config.button_width * cell.span + config.button_gutter * (cell.span - 1);
        b.rect.height = config.button_height;
        out.buttons_.push_back(b);
    }
    return out;
}

const Button* ButtonLayout::hit_test(const hand_detector::Point& point) const {
    if (!point.is_finite()) return nullptr;
    for (const auto& b : buttons_) {
        if (b.rect.contains(point.x, point.y)) {
            return &b;
        }
    }
    return nullptr;
}

const Button* ButtonLayout::find(ButtonId id) const {
    for (const auto& b : buttons_) {
        if (b.id == id) return &b;
    }
    return nullptr;
}

} // namespace layout
