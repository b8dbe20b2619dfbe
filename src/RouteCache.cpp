#include <algorithm>
#include "RouteCache.hpp"

std::string RouteCache::keyFor(std::vector<std::string> const& stations)
{
    std::string key;
    for (const auto& code : stations)
    {
        if (!key.empty())
            key += "_";
        key += code;
    }
    return key;
}

std::optional<TimelineDocument> RouteCache::lookup(std::vector<std::string> const& stations)
{
    auto key = keyFor(stations);

    std::lock_guard<std::mutex> lock(mutex);
    registered[key] = stations;

    auto it = entries.find(key);
    if (it == entries.end())
        return std::nullopt;
    return it->second.document;
}

void RouteCache::store(TimelineDocument document, date::sys_seconds fetchedAt)
{
    auto key = keyFor(document.stations);

    std::lock_guard<std::mutex> lock(mutex);
    registered[key] = document.stations;
    entries[key] = Entry{fetchedAt, std::move(document)};
}

std::vector<std::vector<std::string>> RouteCache::registeredRoutes() const
{
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<std::vector<std::string>> routes;
    for (const auto& [key, stations] : registered)
        routes.push_back(stations);
    return routes;
}

std::chrono::seconds RouteCache::maxAge(date::sys_seconds now) const
{
    std::lock_guard<std::mutex> lock(mutex);

    std::chrono::seconds oldest{0};
    for (const auto& [key, entry] : entries)
        oldest = std::max(oldest, now - entry.fetchedAt);
    return oldest;
}

std::size_t RouteCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}
