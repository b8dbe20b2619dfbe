#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <date/date.h>

// An instant as the provider wrote it: the UTC time point plus the UTC offset
// it was expressed in, so it can be written back out unchanged.
struct OffsetTime
{
    date::sys_seconds utc;
    std::chrono::minutes offset{0};

    static std::optional<OffsetTime> parse(std::string const& text);

    std::string toIso() const;      // "2026-10-17T06:02:00-04:00"
    std::string clockTime() const;  // "06:02", in the stored offset

    bool operator==(OffsetTime const& other) const = default;
    bool operator<(OffsetTime const& other) const { return utc < other.utc; }
};

// One side of a leg at a requested station.
struct StationStop
{
    std::string stationCode;
    std::string stationName;
    OffsetTime scheduled;
    std::optional<OffsetTime> actual;   // absent when the provider has no report

    OffsetTime const& effectiveTime() const { return actual ? *actual : scheduled; }

    bool operator==(StationStop const& other) const = default;
};

struct Segment
{
    StationStop from;
    StationStop to;

    bool operator==(Segment const& other) const = default;
};

enum class TrainStatus
{
    Active,
    Predeparture,
    Completed,
    Unknown
};

TrainStatus parseTrainStatus(std::string const& text);

struct Train
{
    std::string trainId;
    std::string trainNum;
    std::string routeName;
    std::string status;     // provider text, kept verbatim
    std::vector<Segment> segments;

    TrainStatus statusKind() const { return parseTrainStatus(status); }

    bool operator==(Train const& other) const = default;
};

// A stop as listed in the provider's full route for one train.
struct ProviderStop
{
    std::string code;
    std::string name;
    std::optional<std::string> scheduledArrival;
    std::optional<std::string> scheduledDeparture;
    std::optional<std::string> arrival;
    std::optional<std::string> departure;
};

struct ProviderTrain
{
    std::string trainId;
    std::string trainNum;
    std::string routeName;
    std::string trainState;
    std::vector<ProviderStop> stops;
};

struct RenderRequest
{
    std::vector<Train> trains;
    std::vector<std::string> stations;
    date::sys_seconds now;
    std::chrono::minutes bufferBefore{0};
    std::chrono::minutes bufferAfter{0};
    std::optional<std::chrono::seconds> dataAge;    // shown in the header when set
};
