#pragma once
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include "Bitmap.hpp"

struct Glyph
{
    int width = 0;
    std::vector<std::vector<bool>> rows;    // GLYPH_HEIGHT rows of `width` pixels
};

struct TextSize
{
    int width = 0;
    int height = 0;
};

// Fixed-pixel font: a table of character grids, rasterised at an integer scale.
class BitmapFont
{
private:
    std::map<char, Glyph> glyphs;

    void synthesizeMissing();
    void checkCoverage() const;

public:
    static constexpr int GLYPH_WIDTH = 7;
    static constexpr int GLYPH_HEIGHT = 11;
    static constexpr int CHAR_SPACING = 1;

    // Every label the renderer draws unsanitized uses only these.
    static constexpr std::string_view REQUIRED_CHARACTERS =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ :->#";

    // The table is a JSON array of {"char", "width", "pixels": ["X  X", ...]}.
    static BitmapFont fromJson(std::string const& text);
    static BitmapFont load(std::string const& path);

    // Process-wide font, installed once before any render.
    static void initialize(std::string const& path);
    static void install(BitmapFont font);
    static BitmapFont const& instance();
    static bool initialized();

    [[nodiscard]] bool has(char c) const;
    [[nodiscard]] Glyph const& glyph(char c) const;
    [[nodiscard]] TextSize measure(std::string const& text, int scale = 1) const;

    // Returns the width drawn, equal to measure(text, scale).width.
    int draw(Bitmap& surface, std::string const& text, int x, int y, int scale, Ink ink) const;

    // Replaces characters the font cannot draw with spaces.
    [[nodiscard]] std::string sanitize(std::string const& text) const;
    // Longest prefix of `text` no wider than maxWidth.
    [[nodiscard]] std::string fit(std::string const& text, int maxWidth, int scale) const;
};
