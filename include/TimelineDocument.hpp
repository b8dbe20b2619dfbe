#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Types.hpp"

// The {stations, trains} document exchanged between fetching and rendering.
struct TimelineDocument
{
    std::vector<std::string> stations;
    std::vector<Train> trains;

    static TimelineDocument parse(std::string const& text);
    static TimelineDocument fromJson(nlohmann::json const& doc);
    static TimelineDocument load(std::string const& path);

    nlohmann::json toJson() const;
    std::string dump(int indent = 2) const;
    void save(std::string const& path) const;

    bool operator==(TimelineDocument const& other) const = default;
};
