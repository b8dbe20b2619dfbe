#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

// Decodes Amtraker v3 responses.
class ProviderParser
{
public:
    // Train IDs listed by /stations/{code}, in provider order.
    static std::vector<std::string> parseStation(std::string const& body, std::string const& code);

    // The train with `trainId` from /trains/{trainId}; nullopt when the
    // response no longer lists it.
    static std::optional<ProviderTrain> parseTrain(std::string const& body, std::string const& trainId);
};
