#include <fstream>
#include <sstream>
#include <memory>
#include <mutex>
#include <cctype>
#include <nlohmann/json.hpp>
#include "Errors.hpp"
#include "BitmapFont.hpp"

namespace
{
    std::unique_ptr<BitmapFont const> installedFont;
    std::mutex installMutex;

    Glyph glyphFromRows(std::vector<std::string> const& rows)
    {
        Glyph g;
        g.width = BitmapFont::GLYPH_WIDTH;
        for (const auto& row : rows)
        {
            std::vector<bool> bits(BitmapFont::GLYPH_WIDTH, false);
            for (std::size_t i = 0; i < row.size() && i < bits.size(); ++i)
                bits[i] = row[i] == 'X';
            g.rows.push_back(std::move(bits));
        }
        return g;
    }

    // Punctuation needed by labels but not carried by the font table.
    const std::map<char, std::vector<std::string>> PUNCTUATION = {
        {' ', {"", "", "", "", "", "", "", "", "", "", ""}},
        {':', {"", "", "   X", "   X", "", "", "   X", "   X", "", "", ""}},
        {'-', {"", "", "", "", " XXXXX", "", "", "", "", "", ""}},
        {'>', {"", " X", "  X", "   X", "    X", "   X", "  X", " X", "", "", ""}},
        {'#', {"", "  X X", "  X X", " XXXXX", "  X X", " XXXXX", "  X X", "  X X", "", "", ""}},
    };
}

BitmapFont BitmapFont::fromJson(std::string const& text)
{
    nlohmann::json table;
    try
    {
        table = nlohmann::json::parse(text);
    }
    catch (nlohmann::json::parse_error const& e)
    {
        throw FontError(std::string("Font table is not valid JSON: ") + e.what());
    }

    if (!table.is_array())
        throw FontError("Font table must be a JSON array");

    BitmapFont font;
    for (const auto& entry : table)
    {
        if (!entry.is_object() || !entry.contains("char") || !entry.contains("width") || !entry.contains("pixels"))
            throw FontError("Font entry needs char, width and pixels");

        const auto& ch = entry["char"];
        if (!ch.is_string() || ch.get<std::string>().size() != 1)
            throw FontError("Font entry char must be a single character");
        char c = ch.get<std::string>()[0];

        if (!entry["width"].is_number_integer())
            throw FontError(std::string("Width of '") + c + "' must be an integer");
        int width = entry["width"].get<int>();
        if (width <= 0 || width > 16)
            throw FontError(std::string("Width of '") + c + "' out of range");

        const auto& pixels = entry["pixels"];
        if (!pixels.is_array() || pixels.size() != static_cast<std::size_t>(GLYPH_HEIGHT))
            throw FontError(std::string("Glyph '") + c + "' must have " + std::to_string(GLYPH_HEIGHT) + " rows");

        Glyph g;
        g.width = width;
        for (const auto& row : pixels)
        {
            if (!row.is_string())
                throw FontError(std::string("Glyph '") + c + "' has a non-string row");

            auto text = row.get<std::string>();
            if (text.size() > static_cast<std::size_t>(width))
                throw FontError(std::string("Glyph '") + c + "' row wider than its width");

            std::vector<bool> bits(static_cast<std::size_t>(width), false);
            for (std::size_t i = 0; i < text.size(); ++i)
                bits[i] = text[i] == 'X';
            g.rows.push_back(std::move(bits));
        }

        if (!font.glyphs.emplace(c, std::move(g)).second)
            throw FontError(std::string("Duplicate glyph '") + c + "'");
    }

    font.synthesizeMissing();
    font.checkCoverage();
    return font;
}

BitmapFont BitmapFont::load(std::string const& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw FontError("Could not open font table " + path);

    std::stringstream ss;
    ss << file.rdbuf();
    return fromJson(ss.str());
}

void BitmapFont::synthesizeMissing()
{
    for (char c = 'A'; c <= 'Z'; ++c)
    {
        if (glyphs.count(c))
            continue;

        auto lower = glyphs.find(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        if (lower != glyphs.end())
            glyphs.emplace(c, lower->second);
    }

    for (const auto& [c, rows] : PUNCTUATION)
    {
        if (!glyphs.count(c))
            glyphs.emplace(c, glyphFromRows(rows));
    }
}

void BitmapFont::checkCoverage() const
{
    for (char c : REQUIRED_CHARACTERS)
    {
        if (!has(c))
            throw FontError(std::string("Font table has no glyph for '") + c + "'");
    }
}

void BitmapFont::initialize(std::string const& path)
{
    install(load(path));
}

void BitmapFont::install(BitmapFont font)
{
    auto owned = std::make_unique<BitmapFont const>(std::move(font));

    std::lock_guard<std::mutex> lock(installMutex);
    if (installedFont)
        throw std::logic_error("BitmapFont already initialized");
    installedFont = std::move(owned);
}

BitmapFont const& BitmapFont::instance()
{
    std::lock_guard<std::mutex> lock(installMutex);
    if (!installedFont)
        throw std::logic_error("BitmapFont used before initialize()");
    return *installedFont;
}

bool BitmapFont::initialized()
{
    std::lock_guard<std::mutex> lock(installMutex);
    return installedFont != nullptr;
}

bool BitmapFont::has(char c) const
{
    return glyphs.count(c) > 0;
}

Glyph const& BitmapFont::glyph(char c) const
{
    auto it = glyphs.find(c);
    if (it == glyphs.end())
        throw GlyphError(c);
    return it->second;
}

TextSize BitmapFont::measure(std::string const& text, int scale) const
{
    if (text.empty())
        return {0, 0};

    int width = 0;
    for (char c : text)
        width += glyph(c).width * scale;
    width += static_cast<int>(text.size() - 1) * CHAR_SPACING * scale;

    return {width, GLYPH_HEIGHT * scale};
}

int BitmapFont::draw(Bitmap& surface, std::string const& text, int x, int y, int scale, Ink ink) const
{
    int cursor = x;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        Glyph const& g = glyph(text[i]);

        for (int row = 0; row < GLYPH_HEIGHT; ++row)
        {
            for (int col = 0; col < g.width; ++col)
            {
                if (!g.rows[row][col])
                    continue;
                int px = cursor + col * scale;
                int py = y + row * scale;
                surface.fillRect(px, py, px + scale, py + scale, ink);
            }
        }

        cursor += g.width * scale;
        if (i + 1 < text.size())
            cursor += CHAR_SPACING * scale;
    }

    return cursor - x;
}

std::string BitmapFont::sanitize(std::string const& text) const
{
    std::string out = text;
    for (auto& c : out)
    {
        if (!has(c))
            c = ' ';
    }
    return out;
}

std::string BitmapFont::fit(std::string const& text, int maxWidth, int scale) const
{
    std::string out = text;
    while (!out.empty() && measure(out, scale).width > maxWidth)
        out.pop_back();
    return out;
}
