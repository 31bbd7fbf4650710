#pragma once
#include <cstdint>
#include <string>

// Software drawing into a mapped scan-out buffer. All functions take the
// mapping pointer, its stride in bytes and the visible width/height, clip
// against the buffer and accept colors as 0x00RRGGBB (converted to RGB565
// for 16bpp buffers).
namespace draw_ticker
{

    constexpr int kGlyphWidth = 5;
    constexpr int kGlyphHeight = 7;
    constexpr int kGlyphAdvance = 6; // glyph plus one column of spacing

    // Clear the mapped buffer to a color (0x00RRGGBB)
    void clear_buffer(void *map, uint32_t stride, uint32_t width, uint32_t height, uint32_t color);

    // Write one pixel; out-of-bounds coordinates are ignored
    void put_pixel(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x, int y, uint32_t color);

    // Draw a solid line from (x0,y0) to (x1,y1) with given color and thickness.
    void draw_line(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x0, int y0, int x1, int y1, uint32_t color, int thickness);

    void fill_rect(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x, int y, int w, int h, uint32_t color);

    // Rectangle outline drawn inwards from the rectangle edge
    void draw_rect(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x, int y, int w, int h, uint32_t color, int thickness);

    // Circle outline (thickness > 0) or filled disc (thickness <= 0)
    void draw_circle(void *map, uint32_t stride, uint32_t width, uint32_t height,
                     int cx, int cy, int radius, uint32_t color, int thickness);

    // Render UTF-8 text with the built-in 5x7 font. Lowercase letters are
    // drawn as capitals; ± × ÷ − have their own glyphs, other characters
    // outside the font render as '?'. (x, y) is the top-left corner.
    void draw_text(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x, int y, const std::string &text, uint32_t color, int scale);

    // Width in pixels of text drawn at the given scale
    int text_width(const std::string &text, int scale);

    // Scale an RGB888 image onto the whole buffer (nearest neighbour)
    void blit_rgb(void *map, uint32_t stride, uint32_t width, uint32_t height,
                  const uint8_t *rgb, uint32_t src_width, uint32_t src_height);

} // namespace draw_ticker
