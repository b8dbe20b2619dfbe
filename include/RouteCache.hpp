#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <date/date.h>
#include "TimelineDocument.hpp"

// Last fetched document per station list. Routes looked up once stay
// registered for background refresh.
class RouteCache
{
private:
    struct Entry
    {
        date::sys_seconds fetchedAt;
        TimelineDocument document;
    };

    std::map<std::string, Entry> entries;
    std::map<std::string, std::vector<std::string>> registered;
    mutable std::mutex mutex;

public:
    static std::string keyFor(std::vector<std::string> const& stations);

    std::optional<TimelineDocument> lookup(std::vector<std::string> const& stations);
    void store(TimelineDocument document, date::sys_seconds fetchedAt);
    std::vector<std::vector<std::string>> registeredRoutes() const;
    std::chrono::seconds maxAge(date::sys_seconds now) const;
    std::size_t size() const;
};
