/*
 * GTest suite for TimelineRenderer - row layout, bars, buffers and labels
 */

#include "TimelineRenderer.hpp"
#include "PngEncoder.hpp"
#include "SegmentExtractor.hpp"
#include "Errors.hpp"
#include "Fixtures.hpp"
#include <gtest/gtest.h>

using namespace std::chrono;

class TimelineRendererTest : public ::testing::Test {
protected:
    BitmapFont font = fixtureFont();
    date::time_zone const* newYork = date::locate_zone("America/New_York");
    TimelineRenderer renderer{font, newYork};

    /* Window 05:30-08:30 with the now marker at 05:40. */
    date::sys_seconds now = at("05:40").utc;
    TimeAxis axis = renderer.axisFor(now);

    static Train scenarioTrain(std::string const& status = "Active", std::string const& num = "171") {
        return Train{num + "-17", num, "Northeast Regional", status,
                     SegmentExtractor::extract(northeastRoute(), NYP_NWK_PHL)};
    }

    RenderRequest request(std::vector<Train> trains, int before = 0, int after = 0) const {
        return RenderRequest{std::move(trains), NYP_NWK_PHL, now, minutes(before), minutes(after), std::nullopt};
    }

    static bool black(Bitmap const& bmp, int x, int y) {
        return bmp.get(x, y) == Ink::Black;
    }

    static bool checkerAt(int x, int y) {
        return (x + y) % 2 == 0;
    }
};

TEST_F(TimelineRendererTest, CapacityIsSevenRows) {
    EXPECT_EQ(TimelineRenderer::rowCapacity(), 7);
    EXPECT_EQ(TimelineRenderer::BAR_HEIGHT, 39);
}

TEST_F(TimelineRendererTest, SingleTrainRowIsCentred) {
    // One row spans 20..440; its centre is 230.
    EXPECT_EQ(TimelineRenderer::barTopFor(230), 211);
}

TEST_F(TimelineRendererTest, EmptyTimelineHasGridAndNowMarker) {
    Bitmap bmp = renderer.render(request({}));

    EXPECT_EQ(bmp.getWidth(), 800);
    EXPECT_EQ(bmp.getHeight(), 480);

    for (int x = 0; x < 800; ++x) {
        EXPECT_FALSE(black(bmp, x, 212)) << "x=" << x;
    }

    int nowX = axis.toX(now);
    EXPECT_EQ(nowX, 89);
    EXPECT_TRUE(black(bmp, nowX, 24));
    EXPECT_FALSE(black(bmp, nowX, 28));
    EXPECT_TRUE(black(bmp, 300, TimelineRenderer::CHART_BOTTOM));
}

TEST_F(TimelineRendererTest, PlacesScenarioLegs) {
    Train train = scenarioTrain();
    auto placed = TimelineRenderer::placeSegments(train, axis);

    ASSERT_EQ(placed.size(), 2u);
    EXPECT_EQ(placed[0].x1, 176);
    EXPECT_EQ(placed[0].x2, 235);
    EXPECT_EQ(placed[1].x1, 235);
    EXPECT_EQ(placed[1].x2, 562);
    EXPECT_EQ(placed[0].segment, &train.segments[0]);
}

TEST_F(TimelineRendererTest, SolidBarCoversLegColumns) {
    Bitmap bmp = renderer.render(request({scenarioTrain()}));

    int x1 = axis.toX(at("06:02").utc);
    int x2 = axis.toX(at("07:40").utc);
    for (int x = 0; x < 800; ++x) {
        EXPECT_EQ(black(bmp, x, 212), x >= x1 && x < x2) << "x=" << x;
    }
    EXPECT_TRUE(black(bmp, x1, 211));
    EXPECT_TRUE(black(bmp, x1, 249));
    EXPECT_FALSE(black(bmp, x1, 250));
}

TEST_F(TimelineRendererTest, LegsClipToWindow) {
    Train train{"66-17", "66", "Northeast Regional", "Active", {
        {{"BOS", "Boston", at("04:00"), std::nullopt}, {"NYP", "New York", at("05:00"), std::nullopt}},
        {{"NYP", "New York", at("05:00"), std::nullopt}, {"NWK", "Newark", at("06:00"), std::nullopt}},
        {{"NWK", "Newark", at("06:00"), std::nullopt}, {"PHL", "Philadelphia", at("09:00"), std::nullopt}},
    }};

    auto placed = TimelineRenderer::placeSegments(train, axis);
    ASSERT_EQ(placed.size(), 2u);
    EXPECT_EQ(placed[0].x1, 50);
    EXPECT_EQ(placed[0].x2, axis.toX(at("06:00").utc));
    EXPECT_EQ(placed[1].x2, TimelineRenderer::WIDTH);
    EXPECT_EQ(placed[1].arrival, at("09:00").utc);
}

TEST_F(TimelineRendererTest, BufferBeforeIsCheckerboard) {
    Bitmap bmp = renderer.render(request({scenarioTrain()}, 15, 0));

    int startX = axis.toX(at("05:47").utc);
    int blockX1 = axis.toX(at("06:02").utc);
    ASSERT_EQ(startX, 117);

    for (int y = 212; y < 249; ++y) {
        for (int x = startX + 1; x < blockX1 - 1; ++x) {
            EXPECT_EQ(black(bmp, x, y), checkerAt(x, y)) << x << "," << y;
        }
    }
    EXPECT_TRUE(black(bmp, startX, 230));
    EXPECT_TRUE(black(bmp, startX + 1, 211));
    EXPECT_FALSE(black(bmp, startX - 1, 230));
}

TEST_F(TimelineRendererTest, BufferClampsToWindowStart) {
    Bitmap bmp = renderer.render(request({scenarioTrain()}, 120, 0));

    int blockX1 = axis.toX(at("06:02").utc);
    EXPECT_TRUE(black(bmp, 50, 230));
    for (int y = 212; y < 249; ++y) {
        for (int x = 51; x < blockX1 - 1; ++x) {
            EXPECT_EQ(black(bmp, x, y), checkerAt(x, y)) << x << "," << y;
        }
    }
    EXPECT_FALSE(black(bmp, 49, 230));
    EXPECT_FALSE(black(bmp, 49, 212));
}

TEST_F(TimelineRendererTest, BufferAfterFollowsLastArrival) {
    Bitmap bmp = renderer.render(request({scenarioTrain()}, 0, 30));

    int blockX2 = axis.toX(at("07:40").utc);
    int endX = axis.toX(at("08:10").utc);
    ASSERT_EQ(endX, 681);

    for (int y = 212; y < 249; ++y) {
        for (int x = blockX2 + 1; x < endX - 1; ++x) {
            EXPECT_EQ(black(bmp, x, y), checkerAt(x, y)) << x << "," << y;
        }
    }
    EXPECT_TRUE(black(bmp, endX - 1, 230));
    EXPECT_FALSE(black(bmp, endX, 230));
}

TEST_F(TimelineRendererTest, BuffersDoNotChangeBars) {
    Bitmap plain = renderer.render(request({scenarioTrain()}));
    Bitmap buffered = renderer.render(request({scenarioTrain()}, 15, 30));

    for (int x = 180; x < 560; x += 7) {
        EXPECT_EQ(plain.get(x, 212), buffered.get(x, 212));
        EXPECT_EQ(plain.get(x, 245), buffered.get(x, 245));
    }
}

TEST_F(TimelineRendererTest, RenderIsDeterministic) {
    auto req = request({scenarioTrain(), scenarioTrain("Predeparture", "85")}, 10, 10);

    Bitmap first = renderer.render(req);
    Bitmap second = renderer.render(req);
    EXPECT_EQ(first, second);
    EXPECT_EQ(PngEncoder::encode(first), PngEncoder::encode(second));
}

TEST_F(TimelineRendererTest, InputOrderIsRowOrder) {
    int sampleX = axis.toX(at("06:02").utc) + 3;

    Bitmap activeFirst = renderer.render(request({scenarioTrain("Active", "171"), scenarioTrain("Predeparture", "85")}));
    EXPECT_TRUE(black(activeFirst, sampleX, 106 + 20));
    EXPECT_FALSE(black(activeFirst, sampleX, 316 + 20));

    Bitmap outlineFirst = renderer.render(request({scenarioTrain("Predeparture", "85"), scenarioTrain("Active", "171")}));
    EXPECT_FALSE(black(outlineFirst, sampleX, 106 + 20));
    EXPECT_TRUE(black(outlineFirst, sampleX, 316 + 20));
}

TEST_F(TimelineRendererTest, RowsBeyondCapacityAreDropped) {
    std::vector<Train> ten;
    for (int i = 0; i < 10; ++i) {
        ten.push_back(scenarioTrain(i % 2 ? "Active" : "Predeparture", std::to_string(100 + i)));
    }
    std::vector<Train> seven(ten.begin(), ten.begin() + 7);

    EXPECT_EQ(renderer.render(request(ten)), renderer.render(request(seven)));
}

TEST_F(TimelineRendererTest, TrainOutsideWindowIsNotDrawn) {
    Train late{"99-17", "99", "Keystone", "Predeparture", SegmentExtractor::extract(
        {servedAt("NYP", "10:00"), servedAt("NWK", "10:20"), servedAt("PHL", "11:30")}, NYP_NWK_PHL)};

    EXPECT_EQ(renderer.render(request({late})), renderer.render(request({})));
}

TEST_F(TimelineRendererTest, ForeignStationIsInvariantViolation) {
    Train stray{"1-17", "1", "Acela", "Active", SegmentExtractor::extract(
        {servedAt("NYP", "06:00"), servedAt("TRE", "06:50")}, {"NYP", "TRE"})};

    EXPECT_THROW(renderer.render(request({stray})), RenderInvariantError);
}

TEST_F(TimelineRendererTest, InvertedLegStillRenders) {
    Train odd{"2-17", "2", "Acela", "Active", {
        {{"NYP", "New York", at("07:00"), std::nullopt}, {"NWK", "Newark", at("06:30"), std::nullopt}}}};

    auto placed = TimelineRenderer::placeSegments(odd, axis);
    ASSERT_EQ(placed.size(), 1u);
    EXPECT_EQ(placed[0].x2, placed[0].x1 + 1);
    EXPECT_NO_THROW(renderer.render(request({odd}, 5, 5)));
}

TEST_F(TimelineRendererTest, RouteNamesWithUnknownCharactersRender) {
    Train train = scenarioTrain();
    train.routeName = "Caf\xc3\xa9 Express @ 5!";
    EXPECT_NO_THROW(renderer.render(request({train})));
}

TEST_F(TimelineRendererTest, StatusSelectsBarStyle) {
    EXPECT_EQ(TimelineRenderer::barStyleFor(TrainStatus::Active), BarStyle::Solid);
    EXPECT_EQ(TimelineRenderer::barStyleFor(TrainStatus::Unknown), BarStyle::Solid);
    EXPECT_EQ(TimelineRenderer::barStyleFor(TrainStatus::Predeparture), BarStyle::Outline);
    EXPECT_EQ(TimelineRenderer::barStyleFor(TrainStatus::Completed), BarStyle::Dotted);
}

TEST_F(TimelineRendererTest, TrainLabelShortensRegional) {
    EXPECT_EQ(TimelineRenderer::trainLabel(scenarioTrain()), "NE Regional 171");

    Train keystone{"643-17", "643", "Keystone", "Active", {}};
    EXPECT_EQ(TimelineRenderer::trainLabel(keystone), "Keystone 643");

    Train anonymous{"", "", "", "Active", {}};
    EXPECT_EQ(TimelineRenderer::trainLabel(anonymous), "Train");
}

TEST_F(TimelineRendererTest, ClockLabelsUseTwelveHourLocalTime) {
    EXPECT_EQ(renderer.clockLabel(at("06:02").utc), "6:02");
    EXPECT_EQ(renderer.clockLabel(at("13:05").utc), "1:05");
    EXPECT_EQ(renderer.clockLabel(at("12:30").utc), "12:30");
    EXPECT_EQ(renderer.clockLabel(at("00:30").utc), "12:30");
}

TEST_F(TimelineRendererTest, HeaderStampNamesDayAndTime) {
    EXPECT_EQ(renderer.stampLabel(at("18:02").utc), "oct 17 2026 6:02pm");
    EXPECT_EQ(renderer.stampLabel(at("00:05").utc), "oct 17 2026 12:05am");
}

TEST_F(TimelineRendererTest, DataAgeOnlyChangesHeader) {
    auto plain = request({scenarioTrain()});
    auto aged = plain;
    aged.dataAge = minutes(4);

    Bitmap a = renderer.render(plain);
    Bitmap b = renderer.render(aged);
    EXPECT_NE(a, b);
    for (int y = TimelineRenderer::TOP_MARGIN; y < 480; ++y) {
        for (int x = 0; x < 800; x += 5) {
            ASSERT_EQ(a.get(x, y), b.get(x, y)) << x << "," << y;
        }
    }
}
