#include <gtest/gtest.h>
#include "draw_ticker.hpp"
#include "renderer.hpp"
#include <vector>

namespace {

// In-memory XRGB8888 buffer
struct Canvas {
    Canvas(uint32_t w, uint32_t h) : width(w), height(h), stride(w * 4), pixels(static_cast<size_t>(w) * h, 0) {}

    uint32_t at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
    renderer::Surface surface() { return renderer::Surface{pixels.data(), stride, width, height}; }

    uint32_t width;
    uint32_t height;
    uint32_t stride;
    std::vector<uint32_t> pixels;
};

} // namespace

TEST(DrawTickerTest, ClearAndPutPixel) {
    Canvas c(8, 4);
    draw_ticker::clear_buffer(c.pixels.data(), c.stride, c.width, c.height, 0x00112233);
    for (uint32_t p : c.pixels) EXPECT_EQ(p, 0x00112233u);

    draw_ticker::put_pixel(c.pixels.data(), c.stride, c.width, c.height, 3, 2, 0x00FF0000);
    EXPECT_EQ(c.at(3, 2), 0x00FF0000u);
    EXPECT_EQ(c.at(2, 2), 0x00112233u);
}

TEST(DrawTickerTest, DrawingIsClipped) {
    Canvas c(8, 4);
    draw_ticker::put_pixel(c.pixels.data(), c.stride, c.width, c.height, -1, 0, 0x00FFFFFF);
    draw_ticker::put_pixel(c.pixels.data(), c.stride, c.width, c.height, 8, 0, 0x00FFFFFF);
    draw_ticker::put_pixel(c.pixels.data(), c.stride, c.width, c.height, 0, 4, 0x00FFFFFF);
    for (uint32_t p : c.pixels) EXPECT_EQ(p, 0u);

    draw_ticker::fill_rect(c.pixels.data(), c.stride, c.width, c.height, 6, 2, 10, 10, 0x00ABCDEF);
    int filled = 0;
    for (uint32_t p : c.pixels) filled += p == 0x00ABCDEFu;
    EXPECT_EQ(filled, 4);
    EXPECT_EQ(c.at(7, 3), 0x00ABCDEFu);
    EXPECT_EQ(c.at(5, 3), 0u);
}

TEST(DrawTickerTest, Rgb565Buffer) {
    std::vector<uint16_t> buf(4 * 2, 0);
    draw_ticker::put_pixel(buf.data(), 4 * 2, 4, 2, 1, 1, 0x00FF0000);
    EXPECT_EQ(buf[5], 0xF800);
    draw_ticker::put_pixel(buf.data(), 4 * 2, 4, 2, 2, 1, 0x00FFFFFF);
    EXPECT_EQ(buf[6], 0xFFFF);
}

TEST(DrawTickerTest, TextWidth) {
    EXPECT_EQ(draw_ticker::text_width("", 3), 0);
    EXPECT_EQ(draw_ticker::text_width("7", 1), 5);
    EXPECT_EQ(draw_ticker::text_width("123", 2), (3 * 6 - 1) * 2);
    // Operator symbols are one glyph each
    EXPECT_EQ(draw_ticker::text_width("12 × 3", 1), draw_ticker::text_width("12 x 3", 1));
}

TEST(DrawTickerTest, DrawTextStaysInsideGlyphBox) {
    Canvas c(40, 20);
    draw_ticker::draw_text(c.pixels.data(), c.stride, c.width, c.height, 2, 3, "8", 0x00FFFFFF, 2);
    int lit = 0;
    for (int y = 0; y < static_cast<int>(c.height); ++y) {
        for (int x = 0; x < static_cast<int>(c.width); ++x) {
            if (c.at(x, y) == 0) continue;
            ++lit;
            EXPECT_GE(x, 2);
            EXPECT_LT(x, 2 + draw_ticker::kGlyphWidth * 2);
            EXPECT_GE(y, 3);
            EXPECT_LT(y, 3 + draw_ticker::kGlyphHeight * 2);
        }
    }
    EXPECT_GT(lit, 0);
}

TEST(DrawTickerTest, FilledCircle) {
    Canvas c(21, 21);
    draw_ticker::draw_circle(c.pixels.data(), c.stride, c.width, c.height, 10, 10, 5, 0x0000FF00, 0);
    EXPECT_EQ(c.at(10, 10), 0x0000FF00u);
    EXPECT_EQ(c.at(15, 10), 0x0000FF00u);
    EXPECT_EQ(c.at(0, 0), 0u);

    Canvas ring(21, 21);
    draw_ticker::draw_circle(ring.pixels.data(), ring.stride, ring.width, ring.height, 10, 10, 5, 0x0000FF00, 1);
    EXPECT_EQ(ring.at(10, 10), 0u);
    EXPECT_EQ(ring.at(15, 10), 0x0000FF00u);
}

TEST(DrawTickerTest, BlitScalesSource) {
    // 2x1 source: red, blue
    const uint8_t rgb[] = {255, 0, 0, 0, 0, 255};
    Canvas c(4, 2);
    draw_ticker::blit_rgb(c.pixels.data(), c.stride, c.width, c.height, rgb, 2, 1);
    EXPECT_EQ(c.at(0, 0), 0x00FF0000u);
    EXPECT_EQ(c.at(1, 1), 0x00FF0000u);
    EXPECT_EQ(c.at(2, 0), 0x000000FFu);
    EXPECT_EQ(c.at(3, 1), 0x000000FFu);
}

TEST(ThemeTest, ToggleAndLookup) {
    using renderer::ThemeKind;
    EXPECT_EQ(renderer::toggle_theme(ThemeKind::DARK), ThemeKind::LIGHT);
    EXPECT_EQ(renderer::toggle_theme(ThemeKind::LIGHT), ThemeKind::DARK);
    EXPECT_STREQ(renderer::theme_for(ThemeKind::DARK).name, "dark");
    EXPECT_STREQ(renderer::theme_for(ThemeKind::LIGHT).name, "light");
    EXPECT_NE(renderer::theme_for(ThemeKind::DARK).bg, renderer::theme_for(ThemeKind::LIGHT).bg);
}

TEST(StatusTextTest, AllStates) {
    renderer::ViewModel view;
    EXPECT_EQ(renderer::status_text(view), "NO HAND");
    view.pose = hand_detector::Pose::OTHER;
    EXPECT_EQ(renderer::status_text(view), "HAND");
    view.pose = hand_detector::Pose::POINTING;
    EXPECT_EQ(renderer::status_text(view), "POINTING");
    view.touching = true;
    EXPECT_EQ(renderer::status_text(view), "TOUCHING");
}

TEST(RenderFrameTest, RejectsUnmappedSurface) {
    renderer::ViewModel view;
    EXPECT_FALSE(renderer::render_frame(renderer::Surface{}, view));
}

TEST(RenderFrameTest, DrawsBackgroundAndPanel) {
    Canvas c(1280, 720);
    auto lay = layout::ButtonLayout::build(1280, 720);
    renderer::ViewModel view;
    view.layout = &lay;
    view.show_instructions = false;
    ASSERT_TRUE(renderer::render_frame(c.surface(), view));

    const renderer::Theme& dark = renderer::theme_for(renderer::ThemeKind::DARK);
    EXPECT_EQ(c.at(400, 300), dark.bg);
    EXPECT_EQ(c.at(1100, 700), dark.panel);
    // Top-left pixel of the 7 key's fill, inside its 2 px outline
    const layout::Rect& seven = lay.find(layout::ButtonId::DIGIT_7)->rect;
    EXPECT_EQ(c.at(seven.x + 3, seven.y + 3), dark.number_button);
    const layout::Rect& plus = lay.find(layout::ButtonId::ADD)->rect;
    EXPECT_EQ(c.at(plus.x + 3, plus.y + 3), dark.operator_button);
}

TEST(RenderFrameTest, HoverAndFlashColors) {
    Canvas c(1280, 720);
    auto lay = layout::ButtonLayout::build(1280, 720);
    renderer::ViewModel view;
    view.layout = &lay;
    view.show_instructions = false;
    view.theme = renderer::ThemeKind::LIGHT;
    view.hovered = layout::ButtonId::DIGIT_5;
    view.flashing = layout::ButtonId::EQUALS;
    ASSERT_TRUE(renderer::render_frame(c.surface(), view));

    const renderer::Theme& light = renderer::theme_for(renderer::ThemeKind::LIGHT);
    const layout::Rect& five = lay.find(layout::ButtonId::DIGIT_5)->rect;
    EXPECT_EQ(c.at(five.x + 4, five.y + 4), light.button_hover);
    EXPECT_EQ(c.at(five.x, five.y), light.accent);
    const layout::Rect& eq = lay.find(layout::ButtonId::EQUALS)->rect;
    EXPECT_EQ(c.at(eq.x + 3, eq.y + 3), light.button_pressed);
}

TEST(RenderFrameTest, CameraBackground) {
    Canvas c(64, 48);
    std::vector<uint8_t> rgb(4 * 4 * 3, 0);
    for (size_t i = 0; i < rgb.size(); i += 3) rgb[i + 2] = 200;
    renderer::ViewModel view;
    view.camera_rgb = rgb.data();
    view.camera_width = 4;
    view.camera_height = 4;
    view.show_instructions = false;
    ASSERT_TRUE(renderer::render_frame(c.surface(), view));
    EXPECT_EQ(c.at(32, 30), 0x000000C8u);
}
