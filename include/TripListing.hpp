#pragma once
#include <string>
#include <vector>
#include "Types.hpp"

class TripListing
{
public:
    static std::string format(std::vector<Train> const& trains, std::vector<std::string> const& stations);

private:
    static std::string joinRoute(std::vector<std::string> const& stations);
    static std::string formatLeg(Segment const& seg);
};
