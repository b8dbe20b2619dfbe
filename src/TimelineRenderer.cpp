#include <algorithm>
#include <cstdio>
#include <set>
#include "Errors.hpp"
#include "SegmentExtractor.hpp"
#include "TimelineRenderer.hpp"

using namespace std::chrono;

namespace
{
    const char* const MONTHS[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                  "jul", "aug", "sep", "oct", "nov", "dec"};

    Ink inverse(Ink ink)
    {
        return ink == Ink::Black ? Ink::White : Ink::Black;
    }

    Ink textInkFor(BarStyle style)
    {
        return style == BarStyle::Solid ? Ink::White : Ink::Black;
    }
}

TimelineRenderer::TimelineRenderer(BitmapFont const& f, date::time_zone const* z)
    : font(f)
    , zone(z)
{
}

TimeAxis TimelineRenderer::axisFor(date::sys_seconds now) const
{
    return TimeAxis(TimeAxis::alignWindowStart(now, zone), WIDTH, LEFT_MARGIN, RIGHT_MARGIN);
}

int TimelineRenderer::rowCapacity()
{
    return (CHART_BOTTOM - TOP_MARGIN) / MIN_ROW_HEIGHT;
}

BarStyle TimelineRenderer::barStyleFor(TrainStatus status)
{
    switch (status)
    {
        case TrainStatus::Predeparture: return BarStyle::Outline;
        case TrainStatus::Completed:    return BarStyle::Dotted;
        case TrainStatus::Active:
        case TrainStatus::Unknown:
        default:                        return BarStyle::Solid;
    }
}

std::string TimelineRenderer::clockLabel(date::sys_seconds t) const
{
    auto local = zone->to_local(t);
    date::hh_mm_ss tod{local - date::floor<date::days>(local)};

    int hour = static_cast<int>(tod.hours().count()) % 12;
    if (hour == 0) hour = 12;

    char buf[8];
    std::snprintf(buf, sizeof(buf), "%d:%02d", hour, static_cast<int>(tod.minutes().count()));
    return buf;
}

std::string TimelineRenderer::stampLabel(date::sys_seconds t) const
{
    auto local = zone->to_local(t);
    auto day = date::floor<date::days>(local);
    date::year_month_day ymd{day};
    date::hh_mm_ss tod{local - day};

    int hour24 = static_cast<int>(tod.hours().count());
    int hour = hour24 % 12;
    if (hour == 0) hour = 12;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s %u %d %d:%02d%s",
                  MONTHS[static_cast<unsigned>(ymd.month()) - 1],
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(ymd.year()),
                  hour,
                  static_cast<int>(tod.minutes().count()),
                  hour24 < 12 ? "am" : "pm");
    return buf;
}

std::string TimelineRenderer::trainLabel(Train const& train)
{
    std::string route = train.routeName.empty() ? "Train" : train.routeName;
    if (route == "Northeast Regional")
        route = "NE Regional";

    if (train.trainNum.empty())
        return route;
    return route + " " + train.trainNum;
}

std::vector<PlacedSegment> TimelineRenderer::placeSegments(Train const& train, TimeAxis const& axis)
{
    std::vector<PlacedSegment> placed;
    auto start = axis.windowStart();
    auto end = axis.windowEnd();

    for (const auto& seg : train.segments)
    {
        auto dep = seg.from.effectiveTime().utc;
        auto arr = seg.to.effectiveTime().utc;

        auto visibleDep = std::max(dep, start);
        auto visibleArr = std::min(arr, end);
        if (visibleArr <= start || visibleDep >= end)
            continue;

        int x1 = axis.toX(visibleDep);
        // Legs running past the window are extended to the canvas edge.
        int x2 = arr >= end ? WIDTH : axis.toX(visibleArr);
        if (x2 <= x1)
            x2 = x1 + 1;

        placed.push_back({x1, x2, dep, arr, &seg});
    }

    return placed;
}

void TimelineRenderer::checkStations(RenderRequest const& request) const
{
    std::set<std::string> header;
    for (const auto& code : request.stations)
        header.insert(SegmentExtractor::normalizeCode(code));

    for (const auto& train : request.trains)
    {
        for (const auto& seg : train.segments)
        {
            for (const auto* stop : {&seg.from, &seg.to})
            {
                if (!header.count(SegmentExtractor::normalizeCode(stop->stationCode)))
                {
                    throw RenderInvariantError("Station " + stop->stationCode + " of train " + train.trainId
                                               + " is not in the requested station list");
                }
            }
        }
    }
}

void TimelineRenderer::drawText(Bitmap& canvas, std::string const& text, int x, int y,
                                Anchor anchor, int scale, Ink ink) const
{
    int width = font.measure(text, scale).width;
    if (anchor == Anchor::Center)
        x -= width / 2;
    else if (anchor == Anchor::Right)
        x -= width;

    font.draw(canvas, text, x, y, scale, ink);
}

void TimelineRenderer::drawGrid(Bitmap& canvas, TimeAxis const& axis) const
{
    canvas.hline(0, WIDTH, CHART_BOTTOM, Ink::Black);

    for (auto marker = axis.windowStart(); marker <= axis.windowEnd(); marker += TimeAxis::ALIGNMENT)
    {
        int x = axis.toX(marker);
        for (int py = TOP_MARGIN; py < CHART_BOTTOM; ++py)
        {
            if (py % 3 == 0)
                canvas.set(x, py, Ink::Black);
        }

        drawText(canvas, clockLabel(marker), x, CHART_BOTTOM + 8, Anchor::Center, FONT_SCALE, Ink::Black);
    }
}

void TimelineRenderer::drawNowMarker(Bitmap& canvas, TimeAxis const& axis, date::sys_seconds now) const
{
    canvas.vline(axis.toX(now), TOP_MARGIN, CHART_BOTTOM, Ink::Black, true);
}

void TimelineRenderer::drawHeader(Bitmap& canvas, RenderRequest const& request) const
{
    const int y = 4;

    std::string route;
    for (const auto& code : request.stations)
    {
        if (!route.empty())
            route += " > ";
        route += SegmentExtractor::normalizeCode(code);
    }
    route = font.sanitize(route);

    int routeWidth = font.measure(route).width;
    canvas.fillRect(2, y - 1, 4 + routeWidth + 2, y + BitmapFont::GLYPH_HEIGHT + 1, Ink::White);
    drawText(canvas, route, 4, y, Anchor::Left, 1, Ink::Black);

    std::string stamp = stampLabel(request.now);
    if (request.dataAge)
        stamp += " - data " + std::to_string(duration_cast<minutes>(*request.dataAge).count()) + "m";
    stamp = font.sanitize(stamp);

    int right = WIDTH - 4;
    int stampWidth = font.measure(stamp).width;
    canvas.fillRect(right - stampWidth - 2, y - 1, right + 2, y + BitmapFont::GLYPH_HEIGHT + 1, Ink::White);
    drawText(canvas, stamp, right, y, Anchor::Right, 1, Ink::Black);
}

void TimelineRenderer::drawBar(Bitmap& canvas, int x1, int y1, int x2, int y2, BarStyle style) const
{
    switch (style)
    {
        case BarStyle::Solid:
            canvas.fillRect(x1, y1, x2, y2, Ink::Black);
            break;

        case BarStyle::Outline:
            canvas.fillRect(x1, y1, x2, y2, Ink::White);
            canvas.fillRect(x1, y1, x2, y1 + 2, Ink::Black);
            canvas.fillRect(x1, y2 - 2, x2, y2, Ink::Black);
            canvas.fillRect(x1, y1, x1 + 2, y2, Ink::Black);
            canvas.fillRect(x2 - 2, y1, x2, y2, Ink::Black);
            break;

        case BarStyle::Dotted:
            canvas.fillRect(x1, y1, x2, y2, Ink::White);
            for (int py = y1; py < y2; ++py)
            {
                for (int px = x1; px < x2; ++px)
                {
                    bool border = py == y1 || py == y2 - 1 || px == x1 || px == x2 - 1;
                    if (border || (px % 3 == 0 && py % 3 == 0))
                        canvas.set(px, py, Ink::Black);
                }
            }
            break;
    }
}

void TimelineRenderer::drawBuffers(Bitmap& canvas, std::vector<PlacedSegment> const& placed, TimeAxis const& axis,
                                   RenderRequest const& request, int barTop) const
{
    int barBottom = barTop + BAR_HEIGHT;
    int blockX1 = placed.front().x1;
    int blockX2 = placed.back().x2;

    // Buffers are clamped to the window; they never wrap.
    if (request.bufferBefore > minutes(0))
    {
        auto bufferStart = std::max(placed.front().departure - request.bufferBefore, axis.windowStart());
        int startX = axis.toX(bufferStart);
        if (startX < blockX1)
            canvas.checkerboard(startX, barTop, blockX1, barBottom);
    }

    if (request.bufferAfter > minutes(0) && blockX2 < WIDTH)
    {
        auto bufferEnd = std::min(placed.back().arrival + request.bufferAfter, axis.windowEnd());
        int endX = axis.toX(bufferEnd);
        if (endX > blockX2)
            canvas.checkerboard(blockX2, barTop, std::min(endX, WIDTH), barBottom);
    }
}

void TimelineRenderer::drawTimeLabels(Bitmap& canvas, std::vector<PlacedSegment> const& placed,
                                      TimeAxis const& axis, int barTop) const
{
    struct Label
    {
        int left;
        int right;
        std::string text;
    };

    std::vector<Label> labels;
    for (std::size_t i = 0; i < placed.size(); ++i)
    {
        const auto& p = placed[i];
        bool isLast = i + 1 == placed.size();

        if (i == 0)
        {
            auto text = clockLabel(p.departure);
            labels.push_back({p.x1, p.x1 + font.measure(text).width, text});
        }

        if (!isLast)
        {
            int gapCenter = (p.x2 + placed[i + 1].x1) / 2;
            auto text = clockLabel(p.arrival);
            int width = font.measure(text).width;
            labels.push_back({gapCenter - width / 2, gapCenter - width / 2 + width, text});
        }
        else if (p.arrival <= axis.windowEnd())
        {
            auto text = clockLabel(p.arrival);
            labels.push_back({p.x2 - font.measure(text).width, p.x2, text});
        }
    }

    const int minGap = 4;
    const int y = barTop - BitmapFont::GLYPH_HEIGHT - 3;
    int lastRight = -1000;

    for (const auto& label : labels)
    {
        if (label.left <= lastRight + minGap)
            continue;

        // Clear gridlines behind the label.
        canvas.fillRect(label.left - 1, y - 1, label.right + 1, y + BitmapFont::GLYPH_HEIGHT + 1, Ink::White);
        drawText(canvas, label.text, label.left, y, Anchor::Left, 1, Ink::Black);
        lastRight = label.right;
    }
}

void TimelineRenderer::drawStationLabels(Bitmap& canvas, std::vector<PlacedSegment> const& placed,
                                         BarStyle style, int barTop) const
{
    Ink ink = textInkFor(style);
    int stationY = barTop + TEXT_PADDING;
    int minWidth = font.measure("XXX").width + LABEL_PADDING * 2;

    auto clearBehind = [&](int left, int right)
    {
        if (style == BarStyle::Dotted)
            canvas.fillRect(left - 1, stationY - 1, right + 1, stationY + BitmapFont::GLYPH_HEIGHT + 1, Ink::White);
    };

    for (std::size_t i = 0; i < placed.size(); ++i)
    {
        const auto& p = placed[i];
        bool isFirst = i == 0;
        bool isLast = i + 1 == placed.size();
        auto fromCode = font.sanitize(p.segment->from.stationCode);
        auto toCode = font.sanitize(p.segment->to.stationCode);

        if (p.x2 - p.x1 > minWidth)
        {
            if (isFirst)
            {
                int left = p.x1 + LABEL_PADDING;
                clearBehind(left, left + font.measure(fromCode).width);
                drawText(canvas, fromCode, left, stationY, Anchor::Left, 1, ink);
            }
            if (isLast)
            {
                int right = p.x2 - LABEL_PADDING;
                clearBehind(right - font.measure(toCode).width, right);
                drawText(canvas, toCode, right, stationY, Anchor::Right, 1, ink);
            }
        }

        if (!isLast)
        {
            // Tag over the junction with the next leg.
            int gapCenter = (p.x2 + placed[i + 1].x1) / 2;
            int codeWidth = font.measure(toCode).width;
            canvas.fillRect(gapCenter - codeWidth / 2 - 2, stationY - 1,
                            gapCenter + codeWidth / 2 + 2, stationY + BitmapFont::GLYPH_HEIGHT + 1,
                            inverse(ink));
            drawText(canvas, toCode, gapCenter, stationY, Anchor::Center, 1, ink);
        }
    }
}

void TimelineRenderer::drawTrainName(Bitmap& canvas, Train const& train, std::vector<PlacedSegment> const& placed,
                                     BarStyle style, int barTop) const
{
    int blockX1 = placed.front().x1;
    int blockX2 = std::min(placed.back().x2, WIDTH);
    int y = barTop + BAR_HEIGHT - BitmapFont::GLYPH_HEIGHT * FONT_SCALE - TEXT_PADDING;

    auto label = font.fit(font.sanitize(trainLabel(train)), blockX2 - blockX1 - 2 * TRAIN_PADDING, FONT_SCALE);
    if (label.empty())
        return;

    int center = (blockX1 + blockX2) / 2;
    if (style == BarStyle::Dotted)
    {
        int width = font.measure(label, FONT_SCALE).width;
        canvas.fillRect(center - width / 2 - 1, y - 1, center - width / 2 + width + 1,
                        y + BitmapFont::GLYPH_HEIGHT * FONT_SCALE + 1, Ink::White);
    }
    drawText(canvas, label, center, y, Anchor::Center, FONT_SCALE, textInkFor(style));
}

void TimelineRenderer::drawTrain(Bitmap& canvas, Train const& train, std::vector<PlacedSegment> const& placed,
                                 TimeAxis const& axis, RenderRequest const& request, int yCenter) const
{
    int barTop = barTopFor(yCenter);
    int barBottom = barTop + BAR_HEIGHT;
    BarStyle style = barStyleFor(train.statusKind());

    for (const auto& p : placed)
        drawBar(canvas, p.x1, barTop, p.x2, barBottom, style);

    drawBuffers(canvas, placed, axis, request, barTop);
    drawTimeLabels(canvas, placed, axis, barTop);
    drawStationLabels(canvas, placed, style, barTop);
    drawTrainName(canvas, train, placed, style, barTop);
}

Bitmap TimelineRenderer::render(RenderRequest const& request) const
{
    checkStations(request);

    Bitmap canvas(WIDTH, HEIGHT, Ink::White);
    TimeAxis axis = axisFor(request.now);

    drawGrid(canvas, axis);
    drawNowMarker(canvas, axis, request.now);

    std::vector<std::pair<Train const*, std::vector<PlacedSegment>>> rows;
    for (const auto& train : request.trains)
    {
        auto placed = placeSegments(train, axis);
        if (!placed.empty())
            rows.emplace_back(&train, std::move(placed));
    }

    // Rows past the canvas are dropped, not paginated.
    std::size_t count = std::min(rows.size(), static_cast<std::size_t>(rowCapacity()));
    if (count > 0)
    {
        int rowHeight = (CHART_BOTTOM - TOP_MARGIN) / static_cast<int>(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            int yCenter = TOP_MARGIN + static_cast<int>(i) * rowHeight + rowHeight / 2;
            drawTrain(canvas, *rows[i].first, rows[i].second, axis, request, yCenter);
        }
    }

    drawHeader(canvas, request);
    return canvas;
}
