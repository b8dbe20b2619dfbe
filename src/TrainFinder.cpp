#include <algorithm>
#include <iostream>
#include <unordered_set>
#include "AmtrakClient.hpp"
#include "SegmentExtractor.hpp"
#include "TrainFinder.hpp"

std::optional<Train> TrainFinder::buildTrain(ProviderTrain const& source, std::vector<std::string> const& stations)
{
    auto segments = SegmentExtractor::extract(source.stops, stations);
    if (segments.empty())
        return std::nullopt;

    return Train{source.trainId, source.trainNum, source.routeName, source.trainState, std::move(segments)};
}

std::vector<std::string> TrainFinder::mergeTrainIds(std::vector<std::vector<std::string>> const& perStation)
{
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;

    for (const auto& list : perStation)
    {
        for (const auto& id : list)
        {
            if (seen.insert(id).second)
                ids.push_back(id);
        }
    }
    return ids;
}

void TrainFinder::sortByDeparture(std::vector<Train>& trains)
{
    std::stable_sort(trains.begin(), trains.end(), [](Train const& a, Train const& b)
    {
        return a.segments.front().from.scheduled < b.segments.front().from.scheduled;
    });
}

boost::asio::awaitable<std::vector<Train>> TrainFinder::find(AmtrakClient& client, std::vector<std::string> stations)
{
    std::vector<Train> trains;
    if (stations.size() < 2)
        co_return trains;

    // Trains are collected from every station so partial routes are caught.
    std::vector<std::vector<std::string>> perStation;
    for (const auto& code : stations)
        perStation.push_back(co_await client.fetchStation(SegmentExtractor::normalizeCode(code)));

    auto ids = mergeTrainIds(perStation);
    std::cout << "[Fetch] " << ids.size() << " candidate trains for "
              << stations.size() << " stations." << std::endl;

    for (const auto& id : ids)
    {
        auto source = co_await client.fetchTrain(id);
        if (!source)
            continue;

        if (auto train = buildTrain(*source, stations))
            trains.push_back(std::move(*train));
    }

    sortByDeparture(trains);
    std::cout << "[Fetch] " << trains.size() << " trains connect the route." << std::endl;
    co_return trains;
}
