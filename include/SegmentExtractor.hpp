#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

class SegmentExtractor
{
public:
    // Legs between consecutive requested stations this train serves, in
    // request order. Empty when fewer than two stations can be matched.
    static std::vector<Segment> extract(std::vector<ProviderStop> const& route,
                                        std::vector<std::string> const& requested);

    static std::string normalizeCode(std::string code);

    static std::optional<StationStop> departureSide(ProviderStop const& stop, std::string const& code);
    static std::optional<StationStop> arrivalSide(ProviderStop const& stop, std::string const& code);

private:
    static std::optional<OffsetTime> firstValid(std::optional<std::string> const& preferred,
                                                std::optional<std::string> const& fallback);
};
