#include <fstream>
#include <sstream>
#include "Errors.hpp"
#include "TimelineDocument.hpp"

using nlohmann::json;

namespace
{
    json stopToJson(StationStop const& stop)
    {
        return {
            {"station_code", stop.stationCode},
            {"station_name", stop.stationName},
            {"scheduled", stop.scheduled.toIso()},
            {"actual", stop.actual ? json(stop.actual->toIso()) : json(nullptr)}
        };
    }

    std::string textField(json const& obj, char const* key)
    {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null())
            return {};
        if (it->is_string())
            return it->get<std::string>();
        if (it->is_number())
            return it->dump();
        throw DocumentError(std::string("Field '") + key + "' must be a string");
    }

    OffsetTime timeField(json const& obj, char const* key)
    {
        auto text = textField(obj, key);
        auto t = OffsetTime::parse(text);
        if (!t)
            throw DocumentError(std::string("Field '") + key + "' is not an ISO 8601 offset time: '" + text + "'");
        return *t;
    }

    StationStop stopFromJson(json const& obj)
    {
        if (!obj.is_object())
            throw DocumentError("Segment endpoint must be an object");

        StationStop stop;
        stop.stationCode = textField(obj, "station_code");
        stop.stationName = textField(obj, "station_name");
        stop.scheduled = timeField(obj, "scheduled");

        auto actual = obj.find("actual");
        if (actual != obj.end() && !actual->is_null())
            stop.actual = timeField(obj, "actual");

        return stop;
    }

    Train trainFromJson(json const& obj)
    {
        if (!obj.is_object())
            throw DocumentError("Train entry must be an object");

        Train train;
        train.trainId   = textField(obj, "train_id");
        train.trainNum  = textField(obj, "train_num");
        train.routeName = textField(obj, "route_name");
        train.status    = textField(obj, "status");

        auto segments = obj.find("segments");
        if (segments == obj.end() || !segments->is_array())
            throw DocumentError("Train '" + train.trainId + "' has no segments array");

        for (const auto& seg : *segments)
        {
            if (!seg.is_object() || !seg.contains("from") || !seg.contains("to"))
                throw DocumentError("Segment needs from and to");
            train.segments.push_back({stopFromJson(seg["from"]), stopFromJson(seg["to"])});
        }

        return train;
    }
}

TimelineDocument TimelineDocument::fromJson(json const& doc)
{
    if (!doc.is_object())
        throw DocumentError("Timeline document must be a JSON object");

    auto stations = doc.find("stations");
    auto trains = doc.find("trains");
    if (stations == doc.end() || !stations->is_array())
        throw DocumentError("Timeline document has no stations array");
    if (trains == doc.end() || !trains->is_array())
        throw DocumentError("Timeline document has no trains array");

    TimelineDocument out;
    for (const auto& code : *stations)
    {
        if (!code.is_string())
            throw DocumentError("Station codes must be strings");
        out.stations.push_back(code.get<std::string>());
    }

    for (const auto& train : *trains)
        out.trains.push_back(trainFromJson(train));

    return out;
}

TimelineDocument TimelineDocument::parse(std::string const& text)
{
    try
    {
        return fromJson(json::parse(text));
    }
    catch (json::parse_error const& e)
    {
        throw DocumentError(std::string("Timeline document is not valid JSON: ") + e.what());
    }
}

TimelineDocument TimelineDocument::load(std::string const& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw DocumentError("Could not open " + path);

    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

json TimelineDocument::toJson() const
{
    json trainList = json::array();
    for (const auto& train : trains)
    {
        json segments = json::array();
        for (const auto& seg : train.segments)
            segments.push_back({{"from", stopToJson(seg.from)}, {"to", stopToJson(seg.to)}});

        trainList.push_back({
            {"train_id", train.trainId},
            {"train_num", train.trainNum},
            {"route_name", train.routeName},
            {"status", train.status},
            {"segments", std::move(segments)}
        });
    }

    return {{"stations", stations}, {"trains", std::move(trainList)}};
}

std::string TimelineDocument::dump(int indent) const
{
    return toJson().dump(indent);
}

void TimelineDocument::save(std::string const& path) const
{
    std::ofstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Could not open " + path + " for writing");
    file << dump() << "\n";
}
