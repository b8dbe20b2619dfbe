#pragma once
#include <chrono>
#include <date/date.h>
#include <date/tz.h>

// Linear map from instants onto the horizontal pixel axis of the timeline.
// Instants outside the window map outside the drawable span; callers clip.
class TimeAxis
{
public:
    static constexpr std::chrono::hours WINDOW_LENGTH{3};
    static constexpr std::chrono::minutes ALIGNMENT{30};

    TimeAxis(date::sys_seconds windowStart, int canvasWidth, int leftMargin, int rightMargin);

    // `now` floored to the half hour on the wall clock of `zone`.
    static date::sys_seconds alignWindowStart(date::sys_seconds now, date::time_zone const* zone);

    [[nodiscard]] date::sys_seconds windowStart() const noexcept { return start; }
    [[nodiscard]] date::sys_seconds windowEnd() const noexcept { return start + WINDOW_LENGTH; }
    [[nodiscard]] int drawableLeft() const noexcept { return leftMargin; }
    [[nodiscard]] int drawableRight() const noexcept { return canvasWidth - rightMargin; }

    [[nodiscard]] double position(date::sys_seconds t) const;
    [[nodiscard]] int toX(date::sys_seconds t) const;

private:
    date::sys_seconds start;
    int canvasWidth;
    int leftMargin;
    int rightMargin;
};
