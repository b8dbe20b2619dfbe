#pragma once
#include <string>
#include <vector>
#include <date/tz.h>
#include "Types.hpp"
#include "Bitmap.hpp"
#include "BitmapFont.hpp"
#include "TimeAxis.hpp"

enum class BarStyle
{
    Solid,
    Outline,
    Dotted
};

enum class Anchor
{
    Left,
    Center,
    Right
};

// A segment clipped to the window and mapped to pixel columns.
struct PlacedSegment
{
    int x1;
    int x2;
    date::sys_seconds departure;
    date::sys_seconds arrival;
    Segment const* segment;
};

class TimelineRenderer
{
public:
    static constexpr int WIDTH = 800;
    static constexpr int HEIGHT = 480;
    static constexpr int LEFT_MARGIN = 50;
    static constexpr int RIGHT_MARGIN = 40;
    static constexpr int TOP_MARGIN = 20;
    static constexpr int BOTTOM_MARGIN = 40;
    static constexpr int CHART_BOTTOM = HEIGHT - BOTTOM_MARGIN;
    static constexpr int FONT_SCALE = 2;
    // Station codes (scale 1) + gap + train name (scale 2) + padding.
    static constexpr int BAR_HEIGHT = BitmapFont::GLYPH_HEIGHT + 2 + BitmapFont::GLYPH_HEIGHT * FONT_SCALE + 4;
    static constexpr int MIN_ROW_HEIGHT = 60;
    static constexpr int TEXT_PADDING = 2;
    static constexpr int LABEL_PADDING = 4;
    static constexpr int TRAIN_PADDING = 8;

    TimelineRenderer(BitmapFont const& font, date::time_zone const* zone);

    [[nodiscard]] Bitmap render(RenderRequest const& request) const;

    [[nodiscard]] TimeAxis axisFor(date::sys_seconds now) const;
    [[nodiscard]] std::string clockLabel(date::sys_seconds t) const;
    [[nodiscard]] std::string stampLabel(date::sys_seconds t) const;

    static int rowCapacity();
    static int barTopFor(int yCenter) { return yCenter - BAR_HEIGHT / 2; }
    static BarStyle barStyleFor(TrainStatus status);
    static std::string trainLabel(Train const& train);
    static std::vector<PlacedSegment> placeSegments(Train const& train, TimeAxis const& axis);

private:
    BitmapFont const& font;
    date::time_zone const* zone;

    void checkStations(RenderRequest const& request) const;
    void drawText(Bitmap& canvas, std::string const& text, int x, int y, Anchor anchor, int scale, Ink ink) const;
    void drawGrid(Bitmap& canvas, TimeAxis const& axis) const;
    void drawNowMarker(Bitmap& canvas, TimeAxis const& axis, date::sys_seconds now) const;
    void drawHeader(Bitmap& canvas, RenderRequest const& request) const;
    void drawBar(Bitmap& canvas, int x1, int y1, int x2, int y2, BarStyle style) const;
    void drawBuffers(Bitmap& canvas, std::vector<PlacedSegment> const& placed, TimeAxis const& axis,
                     RenderRequest const& request, int barTop) const;
    void drawTimeLabels(Bitmap& canvas, std::vector<PlacedSegment> const& placed, TimeAxis const& axis, int barTop) const;
    void drawStationLabels(Bitmap& canvas, std::vector<PlacedSegment> const& placed, BarStyle style, int barTop) const;
    void drawTrainName(Bitmap& canvas, Train const& train, std::vector<PlacedSegment> const& placed,
                       BarStyle style, int barTop) const;
    void drawTrain(Bitmap& canvas, Train const& train, std::vector<PlacedSegment> const& placed,
                   TimeAxis const& axis, RenderRequest const& request, int yCenter) const;
};
