#pragma once
#include <cstdint>
#include <vector>

enum class Ink : std::uint8_t
{
    Black = 0,
    White = 1
};

// 1-bit raster surface. Every write is clipped to the canvas.
class Bitmap
{
private:
    int width;
    int height;
    std::vector<std::uint8_t> pixels;

public:
    Bitmap(int width, int height, Ink fill = Ink::White);

    int getWidth() const noexcept { return width; }
    int getHeight() const noexcept { return height; }
    std::vector<std::uint8_t> const& data() const noexcept { return pixels; }

    bool contains(int x, int y) const noexcept;
    Ink get(int x, int y) const;
    void set(int x, int y, Ink ink);

    // Half-open spans: [x1, x2) x [y1, y2).
    void fillRect(int x1, int y1, int x2, int y2, Ink ink);
    void hline(int x1, int x2, int y, Ink ink);
    void vline(int x, int y1, int y2, Ink ink, bool dashed = false);
    void checkerboard(int x1, int y1, int x2, int y2);

    bool operator==(Bitmap const& other) const = default;
};
