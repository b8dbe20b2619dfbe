#include <nlohmann/json.hpp>
#include "Errors.hpp"
#include "ProviderParser.hpp"

using nlohmann::json;

namespace
{
    json parseBody(std::string const& body)
    {
        if (body.empty() || body[0] == '<')
            throw ProviderError("Provider returned a non-JSON body");

        try
        {
            return json::parse(body);
        }
        catch (json::parse_error const& e)
        {
            throw ProviderError(std::string("Provider JSON malformed: ") + e.what());
        }
    }

    std::optional<std::string> optionalText(json const& obj, char const* key)
    {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null())
            return std::nullopt;
        if (it->is_string())
        {
            auto s = it->get<std::string>();
            if (s.empty())
                return std::nullopt;
            return s;
        }
        if (it->is_number())
            return it->dump();
        return std::nullopt;
    }

    std::string text(json const& obj, char const* key)
    {
        return optionalText(obj, key).value_or("");
    }

    ProviderStop stopFromJson(json const& s)
    {
        ProviderStop stop;
        stop.code               = text(s, "code");
        stop.name               = text(s, "name");
        stop.scheduledArrival   = optionalText(s, "schArr");
        stop.scheduledDeparture = optionalText(s, "schDep");
        stop.arrival            = optionalText(s, "arr");
        stop.departure          = optionalText(s, "dep");
        return stop;
    }
}

std::vector<std::string> ProviderParser::parseStation(std::string const& body, std::string const& code)
{
    json doc = parseBody(body);

    // Unknown stations come back as an empty array.
    if (!doc.is_object())
        return {};

    auto station = doc.find(code);
    if (station == doc.end() || !station->is_object())
        return {};

    auto trains = station->find("trains");
    if (trains == station->end() || !trains->is_array())
        return {};

    std::vector<std::string> ids;
    for (const auto& id : *trains)
    {
        if (id.is_string())
            ids.push_back(id.get<std::string>());
    }
    return ids;
}

std::optional<ProviderTrain> ProviderParser::parseTrain(std::string const& body, std::string const& trainId)
{
    json doc = parseBody(body);
    if (!doc.is_object())
        return std::nullopt;

    // Keyed by train number; each value lists every running instance.
    for (const auto& [trainNum, instances] : doc.items())
    {
        if (!instances.is_array())
            continue;

        for (const auto& t : instances)
        {
            if (!t.is_object() || text(t, "trainID") != trainId)
                continue;

            ProviderTrain train;
            train.trainId    = trainId;
            train.trainNum   = optionalText(t, "trainNum").value_or(trainNum);
            train.routeName  = text(t, "routeName");
            train.trainState = text(t, "trainState");

            auto stations = t.find("stations");
            if (stations != t.end() && stations->is_array())
            {
                for (const auto& s : *stations)
                {
                    if (s.is_object())
                        train.stops.push_back(stopFromJson(s));
                }
            }
            return train;
        }
    }

    return std::nullopt;
}
