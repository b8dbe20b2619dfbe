#include <algorithm>
#include <stdexcept>
#include "Bitmap.hpp"

Bitmap::Bitmap(int w, int h, Ink fill)
    : width(w)
    , height(h)
    , pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), static_cast<std::uint8_t>(fill))
{
    if (w <= 0 || h <= 0)
        throw std::invalid_argument("Bitmap dimensions must be positive");
}

bool Bitmap::contains(int x, int y) const noexcept
{
    return x >= 0 && x < width && y >= 0 && y < height;
}

Ink Bitmap::get(int x, int y) const
{
    if (!contains(x, y))
        throw std::out_of_range("Bitmap::get outside canvas");
    return static_cast<Ink>(pixels[static_cast<std::size_t>(y) * width + x]);
}

void Bitmap::set(int x, int y, Ink ink)
{
    if (!contains(x, y))
        return;
    pixels[static_cast<std::size_t>(y) * width + x] = static_cast<std::uint8_t>(ink);
}

void Bitmap::fillRect(int x1, int y1, int x2, int y2, Ink ink)
{
    for (int py = std::max(0, y1); py < std::min(height, y2); ++py)
        for (int px = std::max(0, x1); px < std::min(width, x2); ++px)
            set(px, py, ink);
}

void Bitmap::hline(int x1, int x2, int y, Ink ink)
{
    fillRect(x1, y, x2, y + 1, ink);
}

void Bitmap::vline(int x, int y1, int y2, Ink ink, bool dashed)
{
    for (int py = std::max(0, y1); py < std::min(height, y2); ++py)
    {
        if (dashed && (py / 4) % 2 == 1)
            continue;
        set(x, py, ink);
    }
}

void Bitmap::checkerboard(int x1, int y1, int x2, int y2)
{
    for (int py = std::max(0, y1); py < std::min(height, y2); ++py)
    {
        for (int px = std::max(0, x1); px < std::min(width, x2); ++px)
        {
            bool border = py == y1 || py == y2 - 1 || px == x1 || px == x2 - 1;
            if (border || (px + py) % 2 == 0)
                set(px, py, Ink::Black);
            else
                set(px, py, Ink::White);
        }
    }
}
