#include "draw_ticker.hpp"
#include <algorithm>
#include <array>
#include <cstdlib>
#include <vector>

namespace draw_ticker
{

    namespace
    {
        struct Glyph
        {
            char32_t code;
            std::array<uint8_t, kGlyphHeight> rows; // 5 bits per row, MSB = leftmost column
        };

        // clang-format off
        const std::array<Glyph, 64> kFont = {{
            {U' ', {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
            {U'0', {0x0E, 0x11, 0x13, 0x15, 0x19, 0x11, 0x0E}},
            {U'1', {0x04, 0x0C, 0x04, 0x04, 0x04, 0x04, 0x0E}},
            {U'2', {0x0E, 0x11, 0x01, 0x02, 0x04, 0x08, 0x1F}},
            {U'3', {0x1F, 0x02, 0x04, 0x02, 0x01, 0x11, 0x0E}},
            {U'4', {0x02, 0x06, 0x0A, 0x12, 0x1F, 0x02, 0x02}},
            {U'5', {0x1F, 0x10, 0x1E, 0x01, 0x01, 0x11, 0x0E}},
            {U'6', {0x06, 0x08, 0x10, 0x1E, 0x11, 0x11, 0x0E}},
            {U'7', {0x1F, 0x01, 0x02, 0x04, 0x08, 0x08, 0x08}},
            {U'8', {0x0E, 0x11, 0x11, 0x0E, 0x11, 0x11, 0x0E}},
            {U'9', {0x0E, 0x11, 0x11, 0x0F, 0x01, 0x02, 0x0C}},
            {U'A', {0x0E, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}},
            {U'B', {0x1E, 0x11, 0x11, 0x1E, 0x11, 0x11, 0x1E}},
            {U'C', {0x0E, 0x11, 0x10, 0x10, 0x10, 0x11, 0x0E}},
            {U'D', {0x1C, 0x12, 0x11, 0x11, 0x11, 0x12, 0x1C}},
            {U'E', {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x1F}},
            {U'F', {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x10}},
            {U'G', {0x0E, 0x11, 0x10, 0x17, 0x11, 0x11, 0x0F}},
            {U'H', {0x11, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}},
            {U'I', {0x0E, 0x04, 0x04, 0x04, 0x04, 0x04, 0x0E}},
            {U'J', {0x07, 0x02, 0x02, 0x02, 0x02, 0x12, 0x0C}},
            {U'K', {0x11, 0x12, 0x14, 0x18, 0x14, 0x12, 0x11}},
            {U'L', {0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x1F}},
            {U'M', {0x11, 0x1B, 0x15, 0x15, 0x11, 0x11, 0x11}},
            {U'N', {0x11, 0x11, 0x19, 0x15, 0x13, 0x11, 0x11}},
            {U'O', {0x0E, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}},
            {U'P', {0x1E, 0x11, 0x11, 0x1E, 0x10, 0x10, 0x10}},
            {U'Q', {0x0E, 0x11, 0x11, 0x11, 0x15, 0x12, 0x0D}},
            {U'R', {0x1E, 0x11, 0x11, 0x1E, 0x14, 0x12, 0x11}},
            {U'S', {0x0F, 0x10, 0x10, 0x0E, 0x01, 0x01, 0x1E}},
            {U'T', {0x1F, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04}},
            {U'U', {0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}},
            {U'V', {0x11, 0x11, 0x11, 0x11, 0x11, 0x0A, 0x04}},
            {U'W', {0x11, 0x11, 0x11, 0x15, 0x15, 0x15, 0x0A}},
            {U'X', {0x11, 0x11, 0x0A, 0x04, 0x0A, 0x11, 0x11}},
            {U'Y', {0x11, 0x11, 0x11, 0x0A, 0x04, 0x04, 0x04}},
            {U'Z', {0x1F, 0x01, 0x02, 0x04, 0x08, 0x10, 0x1F}},
            {U'.', {0x00, 0x00, 0x00, 0x00, 0x00, 0x0C, 0x0C}},
            {U',', {0x00, 0x00, 0x00, 0x00, 0x0C, 0x04, 0x08}},
            {U':', {0x00, 0x0C, 0x0C, 0x00, 0x0C, 0x0C, 0x00}},
            {U'-', {0x00, 0x00, 0x00, 0x1F, 0x00, 0x00, 0x00}},
            {U'+', {0x00, 0x04, 0x04, 0x1F, 0x04, 0x04, 0x00}},
            {U'=', {0x00, 0x00, 0x1F, 0x00, 0x1F, 0x00, 0x00}},
            {U'/', {0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x00}},
            {U'*', {0x00, 0x04, 0x15, 0x0E, 0x15, 0x04, 0x00}},
            {U'%', {0x18, 0x19, 0x02, 0x04, 0x08, 0x13, 0x03}},
            {U'(', {0x02, 0x04, 0x08, 0x08, 0x08, 0x04, 0x02}},
            {U')', {0x08, 0x04, 0x02, 0x02, 0x02, 0x04, 0x08}},
            {U'!', {0x04, 0x04, 0x04, 0x04, 0x04, 0x00, 0x04}},
            {U'?', {0x0E, 0x11, 0x01, 0x02, 0x04, 0x00, 0x04}},
            {U'\'', {0x04, 0x04, 0x08, 0x00, 0x00, 0x00, 0x00}},
            {U'_', {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x1F}},
            {U'>', {0x08, 0x04, 0x02, 0x01, 0x02, 0x04, 0x08}},
            {U'<', {0x02, 0x04, 0x08, 0x10, 0x08, 0x04, 0x02}},
            {U'[', {0x0E, 0x08, 0x08, 0x08, 0x08, 0x08, 0x0E}},
            {U']', {0x0E, 0x02, 0x02, 0x02, 0x02, 0x02, 0x0E}},
            {U'#', {0x0A, 0x0A, 0x1F, 0x0A, 0x1F, 0x0A, 0x0A}},
            {U'"', {0x0A, 0x0A, 0x00, 0x00, 0x00, 0x00, 0x00}},
            {U'|', {0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04}},
            {U'@', {0x0E, 0x11, 0x17, 0x15, 0x17, 0x10, 0x0E}},
            {0x00B1, {0x04, 0x04, 0x1F, 0x04, 0x04, 0x00, 0x1F}}, // ±
            {0x00D7, {0x00, 0x11, 0x0A, 0x04, 0x0A, 0x11, 0x00}}, // ×
            {0x00F7, {0x00, 0x04, 0x00, 0x1F, 0x00, 0x04, 0x00}}, // ÷
            {0x2212, {0x00, 0x00, 0x00, 0x1F, 0x00, 0x00, 0x00}}, // −
        }};
        // clang-format on

        const Glyph *find_glyph(char32_t code)
        {
            if (code >= U'a' && code <= U'z')
                code = code - U'a' + U'A';
            for (const auto &g : kFont)
            {
                if (g.code == code)
                    return &g;
            }
            return nullptr;
        }

        // Minimal UTF-8 decoder (1-3 byte sequences); malformed bytes decode as '?'
        std::vector<char32_t> decode_utf8(const std::string &text)
        {
            std::vector<char32_t> out;
            out.reserve(text.size());
            size_t i = 0;
            while (i < text.size())
            {
                unsigned char c = static_cast<unsigned char>(text[i]);
                if (c < 0x80)
                {
                    out.push_back(c);
                    i += 1;
                }
                else if ((c & 0xE0) == 0xC0 && i + 1 < text.size())
                {
                    out.push_back(((c & 0x1F) << 6) | (static_cast<unsigned char>(text[i + 1]) & 0x3F));
                    i += 2;
                }
                else if ((c & 0xF0) == 0xE0 && i + 2 < text.size())
                {
                    out.push_back(((c & 0x0F) << 12) |
                                  ((static_cast<unsigned char>(text[i + 1]) & 0x3F) << 6) |
                                  (static_cast<unsigned char>(text[i + 2]) & 0x3F));
                    i += 3;
                }
                else
                {
                    out.push_back(U'?');
                    i += 1;
                }
            }
            return out;
        }
    } // namespace

    // Helper: write a pixel in a framebuffer-agnostic way.
    static inline void write_pixel_generic(void *map, uint32_t stride, uint32_t width, uint32_t height,
                                           int x, int y, uint32_t color)
    {
        if (x < 0 || x >= (int)width || y < 0 || y >= (int)height)
            return;

        uint8_t *base = reinterpret_cast<uint8_t *>(map) + static_cast<size_t>(y) * stride;
        // Heuristic bytes per pixel (may be larger due to stride padding)
        uint32_t bpp_bytes = stride / width;
        if (bpp_bytes >= 4)
        {
            uint32_t *px = reinterpret_cast<uint32_t *>(base);
            px[x] = color; // assume 0x00RRGGBB
        }
        else if (bpp_bytes >= 2)
        {
            // Convert 0x00RRGGBB to RGB565
            uint8_t r = (color >> 16) & 0xFF;
            uint8_t g = (color >> 8) & 0xFF;
            uint8_t b = color & 0xFF;
            uint16_t r5 = static_cast<uint16_t>((r * 31) / 255) & 0x1F;
            uint16_t g6 = static_cast<uint16_t>((g * 63) / 255) & 0x3F;
            uint16_t b5 = static_cast<uint16_t>((b * 31) / 255) & 0x1F;
            uint16_t val = static_cast<uint16_t>((r5 << 11) | (g6 << 5) | b5);
            uint16_t *px = reinterpret_cast<uint16_t *>(base);
            px[x] = val;
        }
        else
        {
            base[x] = static_cast<uint8_t>(color & 0xFF);
        }
    }

    void put_pixel(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x, int y, uint32_t color)
    {
        write_pixel_generic(map, stride, width, height, x, y, color);
    }

    void clear_buffer(void *map, uint32_t stride, uint32_t width, uint32_t height, uint32_t color)
    {
        fill_rect(map, stride, width, height, 0, 0, static_cast<int>(width), static_cast<int>(height), color);
    }

    void fill_rect(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x, int y, int w, int h, uint32_t color)
    {
        int x0 = std::max(0, x);
        int y0 = std::max(0, y);
        int x1 = std::min(static_cast<int>(width), x + w);
        int y1 = std::min(static_cast<int>(height), y + h);
        for (int yy = y0; yy < y1; ++yy)
        {
            for (int xx = x0; xx < x1; ++xx)
            {
                write_pixel_generic(map, stride, width, height, xx, yy, color);
            }
        }
    }

    void draw_rect(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x, int y, int w, int h, uint32_t color, int thickness)
    {
        int t = std::max(1, std::min(thickness, std::min(w, h) / 2 + 1));
        fill_rect(map, stride, width, height, x, y, w, t, color);
        fill_rect(map, stride, width, height, x, y + h - t, w, t, color);
        fill_rect(map, stride, width, height, x, y, t, h, color);
        fill_rect(map, stride, width, height, x + w - t, y, t, h, color);
    }

    void draw_line(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x0, int y0, int x1, int y1, uint32_t color, int thickness)
    {
        int dx = std::abs(x1 - x0);
        int sx = x0 < x1 ? 1 : -1;
        int dy = -std::abs(y1 - y0);
        int sy = y0 < y1 ? 1 : -1;
        int err = dx + dy;
        int half = std::max(0, thickness / 2);

        while (true)
        {
            for (int ty = -half; ty <= half; ++ty)
            {
                for (int tx = -half; tx <= half; ++tx)
                {
                    write_pixel_generic(map, stride, width, height, x0 + tx, y0 + ty, color);
                }
            }
            if (x0 == x1 && y0 == y1)
                break;
            int e2 = 2 * err;
            if (e2 >= dy)
            {
                err += dy;
                x0 += sx;
            }
            if (e2 <= dx)
            {
                err += dx;
                y0 += sy;
            }
        }
    }

    void draw_circle(void *map, uint32_t stride, uint32_t width, uint32_t height,
                     int cx, int cy, int radius, uint32_t color, int thickness)
    {
        if (radius <= 0)
            return;
        int outer2 = radius * radius;
        int inner = thickness > 0 ? std::max(0, radius - thickness) : 0;
        int inner2 = inner * inner;
        for (int dy = -radius; dy <= radius; ++dy)
        {
            for (int dx = -radius; dx <= radius; ++dx)
            {
                int d2 = dx * dx + dy * dy;
                if (d2 > outer2)
                    continue;
                if (thickness > 0 && d2 < inner2)
                    continue;
                write_pixel_generic(map, stride, width, height, cx + dx, cy + dy, color);
            }
        }
    }

    int text_width(const std::string &text, int scale)
    {
        int n = static_cast<int>(decode_utf8(text).size());
        if (n == 0)
            return 0;
        int s = std::max(1, scale);
        return (n * kGlyphAdvance - 1) * s;
    }

    void draw_text(void *map, uint32_t stride, uint32_t width, uint32_t height,
                   int x, int y, const std::string &text, uint32_t color, int scale)
    {
        int s = std::max(1, scale);
        int pen_x = x;
        for (char32_t code : decode_utf8(text))
        {
            const Glyph *g = find_glyph(code);
            if (!g)
                g = find_glyph(U'?');
            for (int row = 0; row < kGlyphHeight; ++row)
            {
                uint8_t bits = g->rows[row];
                for (int col = 0; col < kGlyphWidth; ++col)
                {
                    if (bits & (0x10 >> col))
                        fill_rect(map, stride, width, height, pen_x + col * s, y + row * s, s, s, color);
                }
            }
            pen_x += kGlyphAdvance * s;
        }
    }

    void blit_rgb(void *map, uint32_t stride, uint32_t width, uint32_t height,
                  const uint8_t *rgb, uint32_t src_width, uint32_t src_height)
    {
        if (!rgb || src_width == 0 || src_height == 0 || width == 0 || height == 0)
            return;
        for (uint32_t y = 0; y < height; ++y)
        {
            uint32_t sy = std::min(src_height - 1, static_cast<uint32_t>(static_cast<uint64_t>(y) * src_height / height));
            for (uint32_t x = 0; x < width; ++x)
            {
                uint32_t sx = std::min(src_width - 1, static_cast<uint32_t>(static_cast<uint64_t>(x) * src_width / width));
                const uint8_t *p = rgb + (static_cast<size_t>(sy) * src_width + sx) * 3;
                uint32_t color = (static_cast<uint32_t>(p[0]) << 16) | (static_cast<uint32_t>(p[1]) << 8) | p[2];
                write_pixel_generic(map, stride, width, height, static_cast<int>(x), static_cast<int>(y), color);
            }
        }
    }

} // namespace draw_ticker
