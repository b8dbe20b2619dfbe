#include <algorithm>
#include <cctype>
#include "SegmentExtractor.hpp"

std::string SegmentExtractor::normalizeCode(std::string code)
{
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
}

std::optional<OffsetTime> SegmentExtractor::firstValid(std::optional<std::string> const& preferred,
                                                       std::optional<std::string> const& fallback)
{
    if (preferred)
    {
        if (auto t = OffsetTime::parse(*preferred))
            return t;
    }
    if (fallback)
        return OffsetTime::parse(*fallback);

    return std::nullopt;
}

std::optional<StationStop> SegmentExtractor::departureSide(ProviderStop const& stop, std::string const& code)
{
    auto scheduled = firstValid(stop.scheduledDeparture, stop.scheduledArrival);
    if (!scheduled)
        return std::nullopt;

    return StationStop{code, stop.name, *scheduled, firstValid(stop.departure, stop.arrival)};
}

std::optional<StationStop> SegmentExtractor::arrivalSide(ProviderStop const& stop, std::string const& code)
{
    auto scheduled = firstValid(stop.scheduledArrival, stop.scheduledDeparture);
    if (!scheduled)
        return std::nullopt;

    return StationStop{code, stop.name, *scheduled, firstValid(stop.arrival, stop.departure)};
}

std::vector<Segment> SegmentExtractor::extract(std::vector<ProviderStop> const& route,
                                               std::vector<std::string> const& requested)
{
    struct Match
    {
        std::string code;
        ProviderStop const* stop;
    };

    std::vector<Match> matched;
    std::size_t searchFrom = 0;

    for (const auto& raw : requested)
    {
        std::string code = normalizeCode(raw);

        for (std::size_t i = searchFrom; i < route.size(); ++i)
        {
            if (normalizeCode(route[i].code) != code)
                continue;

            // A stop without any usable time cannot anchor a leg.
            if (!departureSide(route[i], code))
                continue;

            matched.push_back({code, &route[i]});
            searchFrom = i + 1;
            break;
        }
    }

    std::vector<Segment> segments;
    if (matched.size() < 2)
        return segments;

    segments.reserve(matched.size() - 1);
    for (std::size_t i = 0; i + 1 < matched.size(); ++i)
    {
        segments.push_back({
            *departureSide(*matched[i].stop, matched[i].code),
            *arrivalSide(*matched[i + 1].stop, matched[i + 1].code)
        });
    }

    return segments;
}
