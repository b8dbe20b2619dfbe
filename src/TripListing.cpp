#include <algorithm>
#include <sstream>
#include "TripListing.hpp"

std::string TripListing::joinRoute(std::vector<std::string> const& stations)
{
    std::string out;
    for (const auto& code : stations)
    {
        if (!out.empty())
            out += " -> ";
        out += code;
    }
    return out;
}

std::string TripListing::formatLeg(Segment const& seg)
{
    std::stringstream ss;
    ss << "  " << seg.from.stationCode << " " << seg.from.effectiveTime().clockTime()
       << " -> " << seg.to.stationCode << " " << seg.to.effectiveTime().clockTime();
    return ss.str();
}

std::string TripListing::format(std::vector<Train> const& trains, std::vector<std::string> const& stations)
{
    std::stringstream ss;
    if (trains.empty())
    {
        ss << "\nNo trains found connecting " << joinRoute(stations) << "\n";
        return ss.str();
    }

    std::vector<Train const*> ordered;
    for (const auto& t : trains)
    {
        if (!t.segments.empty())
            ordered.push_back(&t);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](Train const* a, Train const* b)
    {
        return a->segments.front().from.scheduled < b->segments.front().from.scheduled;
    });

    ss << "\nTrains: " << joinRoute(stations) << "\n";
    ss << std::string(70, '-') << "\n";

    for (const auto* t : ordered)
    {
        ss << (t->routeName.empty() ? "Unknown" : t->routeName)
           << " #" << t->trainNum
           << " (" << (t->status.empty() ? "Unknown" : t->status) << ")\n";

        for (const auto& seg : t->segments)
            ss << formatLeg(seg) << "\n";
        ss << "\n";
    }

    return ss.str();
}
