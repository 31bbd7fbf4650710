#include "renderer.hpp"
#include "draw_ticker.hpp"

#include <algorithm>
#include <iostream>

namespace renderer
{

    namespace
    {
        const Theme kDarkTheme = {
            "dark",
            0x001E1E23, // bg
            0x00323237, // panel
            0x0046464B, // button
            0x005A5A5F, // button_hover
            0x006E6E73, // button_pressed
            0x003C3C41, // number_button
            0x00FF9500, // operator_button
            0x00646464, // special_button
            0x00FFFFFF, // text
            0x0000FFFF, // accent
            0x0000FF00, // success
            0x00FF6464, // error
            0x00141419, // display_bg
        };

        const Theme kLightTheme = {
            "light",
            0x00F0F0F5,
            0x00DCDCE1,
            0x00C8C8CD,
            0x00B4B4B9,
            0x00A0A0A5,
            0x00D2D2D7,
            0x00FF9500,
            0x0096969B,
            0x00000000,
            0x00FF6400,
            0x00009600,
            0x00C80000,
            0x00FAFAFF,
        };

        constexpr size_t kMaxDisplayChars = 15;
        constexpr size_t kMaxHistoryChars = 28;
        constexpr size_t kHistoryLines = 4;
        constexpr int kHistoryTop = 550;

        const char *const kInstructions[] = {
            "HOW TO USE:",
            "1. Point with INDEX finger",
            "2. Touch buttons to press them",
            "3. Keep other fingers closed",
            "",
            "KEYBOARD SHORTCUTS:",
            "Q: Quit  T: Theme  I: Instructions",
            "R: Reset History  C: Clear  D: Del",
        };

        std::string tail_chars(const std::string &s, size_t n)
        {
            return s.size() > n ? s.substr(s.size() - n) : s;
        }

        void draw_button(const Surface &s, const Theme &theme, const layout::Button &b,
                         bool hovered, bool flashing)
        {
            uint32_t base = theme.special_button;
            switch (b.category)
            {
            case layout::ButtonCategory::DIGIT:
                base = theme.number_button;
                break;
            case layout::ButtonCategory::OPERATOR:
            case layout::ButtonCategory::EQUALS:
                base = theme.operator_button;
                break;
            case layout::ButtonCategory::COMMAND:
                base = theme.special_button;
                break;
            }
            uint32_t fill = flashing ? theme.button_pressed : (hovered ? theme.button_hover : base);
            draw_ticker::fill_rect(s.map, s.stride, s.width, s.height,
                                   b.rect.x, b.rect.y, b.rect.width, b.rect.height, fill);
            draw_ticker::draw_rect(s.map, s.stride, s.width, s.height,
                                   b.rect.x, b.rect.y, b.rect.width, b.rect.height,
                                   hovered ? theme.accent : theme.text, hovered ? 3 : 2);

            bool light_text = b.category == layout::ButtonCategory::OPERATOR ||
                              b.category == layout::ButtonCategory::EQUALS;
            const int scale = 3;
            int tw = draw_ticker::text_width(b.label, scale);
            int tx = b.rect.x + (b.rect.width - tw) / 2;
            int ty = b.rect.y + (b.rect.height - draw_ticker::kGlyphHeight * scale) / 2;
            draw_ticker::draw_text(s.map, s.stride, s.width, s.height, tx, ty, b.label,
                                   light_text ? 0x00FFFFFF : theme.text, scale);
        }

        void draw_panel(const Surface &s, const Theme &theme, const ViewModel &view)
        {
            const layout::ButtonLayout &lay = *view.layout;
            const layout::Rect &panel = lay.panel_rect();
            draw_ticker::fill_rect(s.map, s.stride, s.width, s.height, panel.x, panel.y, panel.width, panel.height, theme.panel);
            draw_ticker::draw_rect(s.map, s.stride, s.width, s.height, panel.x, panel.y, panel.width, panel.height, theme.accent, 2);

            draw_ticker::draw_text(s.map, s.stride, s.width, s.height, panel.x + 20, 20,
                                   "VIRTUAL TOUCH CALCULATOR", theme.accent, 2);

            // Display, right aligned
            const layout::Rect &disp = lay.display_rect();
            draw_ticker::fill_rect(s.map, s.stride, s.width, s.height, disp.x, disp.y, disp.width, disp.height, theme.display_bg);
            draw_ticker::draw_rect(s.map, s.stride, s.width, s.height, disp.x, disp.y, disp.width, disp.height, theme.accent, 3);
            std::string text = tail_chars(view.display_text, kMaxDisplayChars);
            int scale = text.size() <= 8 ? 4 : 3;
            int tw = draw_ticker::text_width(text, scale);
            int tx = disp.right() - 10 - tw;
            int ty = disp.y + (disp.height - draw_ticker::kGlyphHeight * scale) / 2;
            draw_ticker::draw_text(s.map, s.stride, s.width, s.height, tx, ty, text,
                                   view.display_error ? theme.error : theme.text, scale);

            if (!view.pending_operator.empty())
            {
                draw_ticker::draw_text(s.map, s.stride, s.width, s.height, panel.x + 25, disp.bottom() + 15,
                                       "OPERATION: " + view.pending_operator, theme.accent, 2);
            }

            for (const auto &b : lay.buttons())
            {
                bool hovered = view.hovered && *view.hovered == b.id;
                bool flashing = view.flashing && *view.flashing == b.id;
                draw_button(s, theme, b, hovered, flashing);
            }

            draw_ticker::draw_text(s.map, s.stride, s.width, s.height, panel.x + 20, kHistoryTop,
                                   "RECENT CALCULATIONS:", theme.accent, 2);
            size_t first = view.history.size() > kHistoryLines ? view.history.size() - kHistoryLines : 0;
            int row = 0;
            for (size_t i = first; i < view.history.size(); ++i, ++row)
            {
                std::string line = view.history[i];
                if (line.size() > kMaxHistoryChars)
                    line = line.substr(0, kMaxHistoryChars - 3) + "...";
                draw_ticker::draw_text(s.map, s.stride, s.width, s.height, panel.x + 25, kHistoryTop + 30 + row * 25,
                                       line, theme.text, 2);
            }
        }

        void draw_instructions(const Surface &s, const Theme &theme)
        {
            const int scale = 2;
            const int line_h = 30;
            int box_w = 0;
            for (const char *line : kInstructions)
                box_w = std::max(box_w, draw_ticker::text_width(line, scale));
            box_w += 20;
            int count = static_cast<int>(sizeof(kInstructions) / sizeof(kInstructions[0]));
            int box_h = count * line_h + 20;
            draw_ticker::fill_rect(s.map, s.stride, s.width, s.height, 10, 10, box_w, box_h, theme.panel);
            draw_ticker::draw_rect(s.map, s.stride, s.width, s.height, 10, 10, box_w, box_h, theme.accent, 2);
            for (int i = 0; i < count; ++i)
            {
                std::string line = kInstructions[i];
                bool heading = !line.empty() && line.back() == ':';
                draw_ticker::draw_text(s.map, s.stride, s.width, s.height, 20, 25 + i * line_h, line,
                                       heading ? theme.accent : theme.text, scale);
            }
        }

        void draw_hand(const Surface &s, const Theme &theme, const ViewModel &view)
        {
            if (view.skeleton.size() == static_cast<size_t>(hand_detector::kNumLandmarks))
            {
                for (const auto &edge : hand_detector::kHandConnections)
                {
                    const auto &a = view.skeleton[edge.first];
                    const auto &b = view.skeleton[edge.second];
                    draw_ticker::draw_line(s.map, s.stride, s.width, s.height,
                                           static_cast<int>(a.x), static_cast<int>(a.y),
                                           static_cast<int>(b.x), static_cast<int>(b.y), theme.accent, 2);
                }
                const int tip = static_cast<int>(hand_detector::HandLandmark::INDEX_FINGER_TIP);
                for (int i = 0; i < hand_detector::kNumLandmarks; ++i)
                {
                    int x = static_cast<int>(view.skeleton[i].x);
                    int y = static_cast<int>(view.skeleton[i].y);
                    if (i == tip)
                    {
                        draw_ticker::draw_circle(s.map, s.stride, s.width, s.height, x, y, 12, theme.success, 0);
                        draw_ticker::draw_circle(s.map, s.stride, s.width, s.height, x, y, 12, 0x00FFFFFF, 3);
                    }
                    else
                    {
                        draw_ticker::draw_circle(s.map, s.stride, s.width, s.height, x, y, 6, theme.accent, 0);
                    }
                }
            }
            if (view.fingertip)
            {
                draw_ticker::draw_circle(s.map, s.stride, s.width, s.height,
                                         static_cast<int>(view.fingertip->x), static_cast<int>(view.fingertip->y),
                                         25, theme.success, 2);
            }
        }

        void draw_status(const Surface &s, const Theme &theme, const ViewModel &view)
        {
            uint32_t color = theme.error;
            if (view.touching)
                color = theme.success;
            else if (view.pose != hand_detector::Pose::NO_HAND)
                color = theme.accent;
            int h = static_cast<int>(s.height);
            draw_ticker::draw_text(s.map, s.stride, s.width, s.height, 10, h - 55,
                                   "STATUS: " + status_text(view), color, 2);
            if (view.hovered)
            {
                draw_ticker::draw_text(s.map, s.stride, s.width, s.height, 10, h - 28,
                                       std::string("HOVERING: ") + layout::button_label(*view.hovered), theme.accent, 2);
            }
        }
    } // namespace

    const Theme &theme_for(ThemeKind kind)
    {
        return kind == ThemeKind::LIGHT ? kLightTheme : kDarkTheme;
    }

    ThemeKind toggle_theme(ThemeKind kind)
    {
        return kind == ThemeKind::DARK ? ThemeKind::LIGHT : ThemeKind::DARK;
    }

    std::string status_text(const ViewModel &view)
    {
        if (view.touching)
            return "TOUCHING";
        switch (view.pose)
        {
        case hand_detector::Pose::POINTING:
            return "POINTING";
        case hand_detector::Pose::OTHER:
            return "HAND";
        case hand_detector::Pose::NO_HAND:
            break;
        }
        return "NO HAND";
    }

    bool render_frame(const Surface &surface, const ViewModel &view)
    {
        if (!surface.map || surface.width == 0 || surface.height == 0)
        {
            std::cerr << "[Display][ERROR] render_frame called without a mapped surface\n";
            return false;
        }
        const Theme &theme = theme_for(view.theme);

        if (view.camera_rgb && view.camera_width && view.camera_height)
            draw_ticker::blit_rgb(surface.map, surface.stride, surface.width, surface.height,
                                  view.camera_rgb, view.camera_width, view.camera_height);
        else
            draw_ticker::clear_buffer(surface.map, surface.stride, surface.width, surface.height, theme.bg);

        draw_hand(surface, theme, view);
        if (view.layout)
            draw_panel(surface, theme, view);
        if (view.show_instructions)
            draw_instructions(surface, theme);
        draw_status(surface, theme, view);
        return true;
    }

} // namespace renderer
