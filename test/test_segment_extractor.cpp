/*
 * GTest suite for SegmentExtractor - ordered legs between requested stations
 */

#include "SegmentExtractor.hpp"
#include "Fixtures.hpp"
#include <gtest/gtest.h>
#include <algorithm>

static std::vector<std::string> codesOf(std::vector<Segment> const& segments)
{
    std::vector<std::string> codes;
    for (const auto& s : segments) {
        codes.push_back(s.from.stationCode + ">" + s.to.stationCode);
    }
    return codes;
}

TEST(SegmentExtractorTest, ThreeStationsInOrderGiveTwoLegs) {
    auto segments = SegmentExtractor::extract(northeastRoute(), NYP_NWK_PHL);

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(codesOf(segments), (std::vector<std::string>{"NYP>NWK", "NWK>PHL"}));

    EXPECT_EQ(segments[0].from.scheduled, at("06:02"));
    EXPECT_EQ(segments[0].to.scheduled, at("06:16"));
    EXPECT_EQ(segments[0].to.effectiveTime(), at("06:17"));
    EXPECT_EQ(segments[1].from.effectiveTime(), at("06:17"));
    EXPECT_EQ(segments[1].to.effectiveTime(), at("07:40"));
    EXPECT_EQ(segments[0].from.stationName, "NYP Station");
}

TEST(SegmentExtractorTest, DepartureSideUsesDepartureFields) {
    std::vector<ProviderStop> route = {
        providerStop("NYP", std::string("05:50"), std::string("06:02")),
        providerStop("NWK", std::string("06:16"), std::string("06:20")),
        providerStop("PHL", std::string("07:40"), std::string("07:45")),
    };
    auto segments = SegmentExtractor::extract(route, NYP_NWK_PHL);

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].from.scheduled, at("06:02"));
    EXPECT_EQ(segments[0].to.scheduled, at("06:16"));
    EXPECT_EQ(segments[1].from.scheduled, at("06:20"));
    EXPECT_EQ(segments[1].to.scheduled, at("07:40"));
}

TEST(SegmentExtractorTest, ReversedDirectionYieldsNothing) {
    std::vector<ProviderStop> route = {
        servedAt("PHL", "06:00"),
        servedAt("NWK", "07:20"),
        servedAt("NYP", "07:40"),
    };
    EXPECT_TRUE(SegmentExtractor::extract(route, NYP_NWK_PHL).empty());
}

TEST(SegmentExtractorTest, OmittedStationIsBridged) {
    std::vector<ProviderStop> route = {
        servedAt("NYP", "06:02"),
        servedAt("TRE", "06:50"),
        servedAt("PHL", "07:40"),
    };
    auto segments = SegmentExtractor::extract(route, NYP_NWK_PHL);

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(codesOf(segments), (std::vector<std::string>{"NYP>PHL"}));
}

TEST(SegmentExtractorTest, SingleMatchIsDropped) {
    std::vector<ProviderStop> route = {servedAt("NWK", "06:16"), servedAt("TRE", "06:50")};
    EXPECT_TRUE(SegmentExtractor::extract(route, NYP_NWK_PHL).empty());
}

TEST(SegmentExtractorTest, DegenerateInputsAreEmpty) {
    EXPECT_TRUE(SegmentExtractor::extract({}, NYP_NWK_PHL).empty());
    EXPECT_TRUE(SegmentExtractor::extract(northeastRoute(), {}).empty());
    EXPECT_TRUE(SegmentExtractor::extract(northeastRoute(), {"NYP"}).empty());
}

TEST(SegmentExtractorTest, CodesCompareCaseInsensitively) {
    std::vector<ProviderStop> route = {servedAt("nyp", "06:02"), servedAt("Nwk", "06:16")};
    auto segments = SegmentExtractor::extract(route, {"NYP", "nwk"});

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].from.stationCode, "NYP");
    EXPECT_EQ(segments[0].to.stationCode, "NWK");
}

TEST(SegmentExtractorTest, MissingActualFallsBackToScheduled) {
    std::vector<ProviderStop> route = {servedAt("NYP", "06:02"), servedAt("NWK", "06:16")};
    auto segments = SegmentExtractor::extract(route, {"NYP", "NWK"});

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_FALSE(segments[0].from.actual.has_value());
    EXPECT_EQ(segments[0].from.effectiveTime(), at("06:02"));
}

TEST(SegmentExtractorTest, TerminalStopsBorrowTheOtherSide) {
    std::vector<ProviderStop> route = {
        providerStop("NYP", std::nullopt, std::string("06:02")),
        providerStop("NWK", std::string("06:16"), std::nullopt),
    };
    auto segments = SegmentExtractor::extract(route, {"NYP", "NWK"});

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].from.scheduled, at("06:02"));
    EXPECT_EQ(segments[0].to.scheduled, at("06:16"));

    auto departure = SegmentExtractor::departureSide(route[1], "NWK");
    ASSERT_TRUE(departure.has_value());
    EXPECT_EQ(departure->scheduled, at("06:16"));
}

TEST(SegmentExtractorTest, StopWithoutTimesCannotAnchor) {
    std::vector<ProviderStop> route = {
        providerStop("NYP", std::nullopt, std::nullopt),
        servedAt("NWK", "06:16"),
        servedAt("PHL", "07:40"),
    };
    auto segments = SegmentExtractor::extract(route, NYP_NWK_PHL);

    EXPECT_EQ(codesOf(segments), (std::vector<std::string>{"NWK>PHL"}));
}

TEST(SegmentExtractorTest, RepeatedRequestMatchesIndependently) {
    std::vector<ProviderStop> loop = {
        servedAt("A", "06:00"),
        servedAt("B", "06:20"),
        servedAt("C", "06:40"),
        servedAt("A", "07:00"),
    };
    EXPECT_EQ(codesOf(SegmentExtractor::extract(loop, {"A", "B", "A"})),
              (std::vector<std::string>{"A>B", "B>A"}));

    std::vector<ProviderStop> line = {servedAt("A", "06:00"), servedAt("B", "06:20")};
    EXPECT_EQ(codesOf(SegmentExtractor::extract(line, {"A", "B", "A"})),
              (std::vector<std::string>{"A>B"}));
}

TEST(SegmentExtractorTest, FirstMatchAfterPreviousIsUsed) {
    std::vector<ProviderStop> route = {
        servedAt("B", "05:00"),
        servedAt("A", "06:00"),
        servedAt("B", "06:30"),
        servedAt("B", "06:45"),
    };
    auto segments = SegmentExtractor::extract(route, {"A", "B"});

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].to.scheduled, at("06:30"));
}

TEST(SegmentExtractorTest, DeterministicAcrossCalls) {
    auto first = SegmentExtractor::extract(northeastRoute(), NYP_NWK_PHL);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(SegmentExtractor::extract(northeastRoute(), NYP_NWK_PHL), first);
    }
}

/* Every ordering of a four-stop route against several requests: never more
 * than |S|-1 legs, legs chain end to start, and follow S's order. */
TEST(SegmentExtractorTest, LegsAreBoundedContiguousAndOrdered) {
    std::vector<std::vector<std::string>> requests = {
        {"A", "B", "C", "D"}, {"A", "C"}, {"D", "A", "B"}, {"B", "D", "C", "A"}};

    std::vector<std::string> order = {"A", "B", "C", "D"};
    do {
        std::vector<ProviderStop> route;
        int minute = 10;
        for (const auto& code : order) {
            route.push_back(servedAt(code, "06:" + std::to_string(minute)));
            minute += 10;
        }

        for (const auto& request : requests) {
            auto segments = SegmentExtractor::extract(route, request);
            EXPECT_LE(segments.size(), request.size() - 1);

            std::size_t lastIndex = 0;
            for (std::size_t i = 0; i < segments.size(); ++i) {
                if (i + 1 < segments.size()) {
                    EXPECT_EQ(segments[i].to.stationCode, segments[i + 1].from.stationCode);
                }
                auto idx = static_cast<std::size_t>(
                    std::find(request.begin(), request.end(), segments[i].to.stationCode) - request.begin());
                EXPECT_LT(idx, request.size());
                if (i > 0) {
                    EXPECT_GT(idx, lastIndex);
                }
                lastIndex = idx;
                EXPECT_LT(segments[i].from.scheduled, segments[i].to.scheduled);
            }
        }
    } while (std::next_permutation(order.begin(), order.end()));
}
