#pragma once
#include <string>
#include <vector>
#include <optional>
#include <boost/asio/awaitable.hpp>
#include "Types.hpp"

class AmtrakClient;

class TrainFinder
{
public:
    // Every train serving at least two of `stations` in order, sorted by the
    // first leg's scheduled departure.
    static boost::asio::awaitable<std::vector<Train>> find(AmtrakClient& client, std::vector<std::string> stations);

    static std::optional<Train> buildTrain(ProviderTrain const& source, std::vector<std::string> const& stations);
    static std::vector<std::string> mergeTrainIds(std::vector<std::vector<std::string>> const& perStation);
    static void sortByDeparture(std::vector<Train>& trains);
};
