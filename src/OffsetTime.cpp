#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <date/date.h>
#include "Types.hpp"

using namespace std::chrono;

std::optional<OffsetTime> OffsetTime::parse(std::string const& text)
{
    if (text.empty())
        return std::nullopt;

    {
        std::istringstream in(text);
        date::sys_seconds tp;
        minutes offset{0};
        in >> date::parse("%FT%T%Ez", tp, offset);
        if (!in.fail())
            return OffsetTime{tp, offset};
    }

    // Some feeds carry fractional seconds; they are dropped.
    std::istringstream in(text);
    date::sys_time<milliseconds> tp;
    minutes offset{0};
    in >> date::parse("%FT%T%Ez", tp, offset);
    if (in.fail())
        return std::nullopt;

    return OffsetTime{date::floor<seconds>(tp), offset};
}

std::string OffsetTime::toIso() const
{
    std::string out = date::format("%FT%T", utc + offset);

    int total = static_cast<int>(offset.count());
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d",
                  total < 0 ? '-' : '+', std::abs(total) / 60, std::abs(total) % 60);
    return out + buf;
}

std::string OffsetTime::clockTime() const
{
    return date::format("%H:%M", utc + offset);
}

TrainStatus parseTrainStatus(std::string const& text)
{
    if (text == "Active")       return TrainStatus::Active;
    if (text == "Predeparture") return TrainStatus::Predeparture;
    if (text == "Completed")    return TrainStatus::Completed;
    return TrainStatus::Unknown;
}
