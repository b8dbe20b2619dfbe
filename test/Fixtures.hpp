/*
 * Shared fixtures: an injectable font table and provider-shaped stops.
 */

#ifndef TRAIN_TIMELINE_TEST_FIXTURES_HPP
#define TRAIN_TIMELINE_TEST_FIXTURES_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "BitmapFont.hpp"
#include "Types.hpp"

/* Every lowercase letter and digit drawn as a 5x7 box outline at rows 1-7. */
inline std::string fixtureFontJson(std::string const& extraChars = "")
{
    nlohmann::json table = nlohmann::json::array();
    std::string chars = "abcdefghijklmnopqrstuvwxyz0123456789" + extraChars;
    for (char c : chars) {
        std::vector<std::string> rows(BitmapFont::GLYPH_HEIGHT, "");
        rows[1] = " XXXXX";
        for (int r = 2; r <= 6; ++r) rows[r] = " X   X";
        rows[7] = " XXXXX";
        table.push_back({{"char", std::string(1, c)}, {"width", 7}, {"pixels", rows}});
    }
    return table.dump();
}

inline BitmapFont fixtureFont()
{
    return BitmapFont::fromJson(fixtureFontJson());
}

/* "06:02" -> "2026-10-17T06:02:00-04:00" (New York, daylight time). */
inline std::string nyc(std::string const& hhmm)
{
    return "2026-10-17T" + hhmm + ":00-04:00";
}

inline OffsetTime at(std::string const& hhmm)
{
    return *OffsetTime::parse(nyc(hhmm));
}

inline ProviderStop providerStop(std::string const& code,
                                 std::optional<std::string> schArr,
                                 std::optional<std::string> schDep,
                                 std::optional<std::string> arr = std::nullopt,
                                 std::optional<std::string> dep = std::nullopt)
{
    ProviderStop s;
    s.code = code;
    s.name = code + " Station";
    if (schArr) s.scheduledArrival = nyc(*schArr);
    if (schDep) s.scheduledDeparture = nyc(*schDep);
    if (arr) s.arrival = nyc(*arr);
    if (dep) s.departure = nyc(*dep);
    return s;
}

/* A stop served at one time, arrival and departure alike. */
inline ProviderStop servedAt(std::string const& code, std::string const& hhmm)
{
    return providerStop(code, hhmm, hhmm);
}

/* NYP 06:02, NWK 06:16 (actual 06:17), PHL 07:40. */
inline std::vector<ProviderStop> northeastRoute()
{
    return {
        providerStop("BOS", std::nullopt, std::string("02:00")),
        providerStop("NYP", std::string("05:55"), std::string("06:02"), std::string("05:55"), std::string("06:02")),
        providerStop("NWK", std::string("06:16"), std::string("06:16"), std::string("06:17"), std::string("06:17")),
        providerStop("PHL", std::string("07:40"), std::string("07:42")),
        providerStop("WAS", std::string("09:10"), std::nullopt),
    };
}

inline const std::vector<std::string> NYP_NWK_PHL = {"NYP", "NWK", "PHL"};

#endif /* TRAIN_TIMELINE_TEST_FIXTURES_HPP */
