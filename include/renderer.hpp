#pragma once

#include "button_layout.hpp"
#include "gesture_classifier.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace renderer {

enum class ThemeKind { DARK, LIGHT };

// Palette, colors as 0x00RRGGBB
struct Theme {
    const char* name;
    uint32_t bg;
    uint32_t panel;
    uint32_t button;
    uint32_t button_hover;
    uint32_t button_pressed;
    uint32_t number_button;
    uint32_t operator_button;
    uint32_t special_button;
    uint32_t text;
    uint32_t accent;
    uint32_t success;
    uint32_t error;
    uint32_t display_bg;
};

const Theme& theme_for(ThemeKind kind);
ThemeKind toggle_theme(ThemeKind kind);

// Mapped scan-out buffer to draw into
struct Surface {
    void* map{nullptr};
    uint32_t stride{0};   // bytes per row
    uint32_t width{0};
    uint32_t height{0};
};

// Output device the frame loop draws into
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Map the next buffer; false if no buffer is available
    virtual bool begin_frame(Surface& surface) = 0;
    // Present the buffer returned by begin_frame()
    virtual bool end_frame() = 0;

    virtual uint32_t width() const = 0;
    virtual uint32_t height() const = 0;
};

// Everything the renderer needs for one frame
struct ViewModel {
    // Camera background (RGB888), drawn scaled to the surface when present
    const uint8_t* camera_rgb{nullptr};
    uint32_t camera_width{0};
    uint32_t camera_height{0};

    const layout::ButtonLayout* layout{nullptr};
    std::optional<layout::ButtonId> hovered;
    std::optional<layout::ButtonId> flashing;  // Pressed recently enough to highlight

    std::string display_text{"0"};
    bool display_error{false};
    std::string pending_operator;             // Label of the pending operator, empty if none
    std::vector<std::string> history;         // Newest last

    hand_detector::Pose pose{hand_detector::Pose::NO_HAND};
    std::optional<hand_detector::Point> fingertip;  // Display pixels
    bool touching{false};
    std::vector<hand_detector::Point> skeleton;     // 21 display-space landmarks or empty

    bool show_instructions{true};
    ThemeKind theme{ThemeKind::DARK};
};

// Status line text: "TOUCHING", "POINTING", "HAND" or "NO HAND"
std::string status_text(const ViewModel& view);

// Draw the whole frame. Returns false when the surface is not mapped.
bool render_frame(const Surface& surface, const ViewModel& view);

} // namespace renderer
