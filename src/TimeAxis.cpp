#include <cmath>
#include "TimeAxis.hpp"

using namespace std::chrono;

TimeAxis::TimeAxis(date::sys_seconds windowStart, int width, int left, int right)
    : start(windowStart)
    , canvasWidth(width)
    , leftMargin(left)
    , rightMargin(right)
{
}

date::sys_seconds TimeAxis::alignWindowStart(date::sys_seconds now, date::time_zone const* zone)
{
    auto local = zone->to_local(now);
    auto day = date::floor<date::days>(local);
    auto sinceMidnight = date::floor<minutes>(local - day);
    auto aligned = day + ALIGNMENT * (sinceMidnight / ALIGNMENT);

    return date::floor<seconds>(zone->to_sys(aligned, date::choose::earliest));
}

double TimeAxis::position(date::sys_seconds t) const
{
    double elapsed = duration<double>(t - start).count();
    double total = duration<double>(WINDOW_LENGTH).count();
    double drawable = static_cast<double>(drawableRight() - drawableLeft());

    return leftMargin + elapsed / total * drawable;
}

int TimeAxis::toX(date::sys_seconds t) const
{
    return static_cast<int>(std::floor(position(t)));
}
