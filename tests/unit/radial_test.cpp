#include <gtest/gtest.h>
#include <arrange/core/config.h>
#include <arrange/layout/radial.h>

#include <cmath>
#include <vector>

using namespace arrange::layout;
using arrange::core::DiagnosticLog;
using arrange::core::Severity;

namespace {

constexpr float kTolerance = 1e-3f;
constexpr double kTwoPi = 6.283185307179586;

std::vector<Box> make_boxes(std::size_t count) {
    std::vector<Box> boxes(count);
    for (std::size_t i = 0; i < count; ++i) boxes[i].id = i;
    return boxes;
}

Measurer uniform(Size size) {
    return [size](const Box&, const Constraint&) { return size; };
}

float distance(Point a, Point b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

} // namespace

TEST(RadialLayout, FourBoxesSitOnCompassPoints) {
    RadialLayout layout;
    auto result = layout.place(make_boxes(4), uniform({10, 10}), {{0, 0}, {100, 100}});

    ASSERT_EQ(result.placements.size(), 4u);
    // Inset radius is 50 - 5 = 45; first box at the top, then clockwise
    auto c0 = result.placements[0].frame.center();
    auto c1 = result.placements[1].frame.center();
    auto c2 = result.placements[2].frame.center();
    auto c3 = result.placements[3].frame.center();
    EXPECT_NEAR(c0.x, 50.0f, kTolerance);
    EXPECT_NEAR(c0.y, 5.0f, kTolerance);
    EXPECT_NEAR(c1.x, 95.0f, kTolerance);
    EXPECT_NEAR(c1.y, 50.0f, kTolerance);
    EXPECT_NEAR(c2.x, 50.0f, kTolerance);
    EXPECT_NEAR(c2.y, 95.0f, kTolerance);
    EXPECT_NEAR(c3.x, 5.0f, kTolerance);
    EXPECT_NEAR(c3.y, 50.0f, kTolerance);
}

TEST(RadialLayout, IdenticalBoxesAreEquidistantAndEvenlySpaced) {
    RadialLayout layout;
    const std::size_t n = 7;
    const Rect bounds{{20, 30}, {160, 160}};
    auto result = layout.place(make_boxes(n), uniform({16, 16}), bounds);

    ASSERT_EQ(result.placements.size(), n);
    const Point center = bounds.center();
    for (std::size_t i = 0; i < n; ++i) {
        auto c = result.placements[i].frame.center();
        EXPECT_NEAR(distance(c, center), 80.0f - 8.0f, kTolerance);

        double angle = std::atan2(c.y - center.y, c.x - center.x);
        double expected = kTwoPi / n * static_cast<double>(i) - kTwoPi / 4;
        double delta = std::remainder(angle - expected, kTwoPi);
        EXPECT_NEAR(delta, 0.0, 1e-4);
    }
}

TEST(RadialLayout, RadiusFollowsShorterSide) {
    RadialLayout layout;
    auto result = layout.place(make_boxes(2), uniform({10, 10}), {{0, 0}, {200, 100}});
    // r = 50, center (100, 50)
    auto c0 = result.placements[0].frame.center();
    auto c1 = result.placements[1].frame.center();
    EXPECT_NEAR(c0.x, 100.0f, kTolerance);
    EXPECT_NEAR(c0.y, 5.0f, kTolerance);
    EXPECT_NEAR(c1.x, 100.0f, kTolerance);
    EXPECT_NEAR(c1.y, 95.0f, kTolerance);
}

TEST(RadialLayout, InsetUsesEachAxisOfTheBoxSize) {
    RadialLayout layout;
    // Top box: y inset by half its height. Right box: x inset by half its width.
    auto result = layout.place(make_boxes(4), uniform({30, 10}), {{0, 0}, {100, 100}});
    auto top = result.placements[0].frame.center();
    auto right = result.placements[1].frame.center();
    EXPECT_NEAR(top.y, 50.0f - 45.0f, kTolerance);
    EXPECT_NEAR(right.x, 50.0f + 35.0f, kTolerance);
}

TEST(RadialLayout, PlacementsAreCenterAnchoredFrames) {
    RadialLayout layout;
    auto result = layout.place(make_boxes(3), uniform({20, 12}), {{0, 0}, {100, 100}});
    for (std::size_t i = 0; i < result.placements.size(); ++i) {
        const auto& p = result.placements[i];
        EXPECT_EQ(p.box_index, i);
        EXPECT_EQ(p.anchor, Anchor::Center);
        EXPECT_FLOAT_EQ(p.frame.size.width, 20.0f);
        EXPECT_FLOAT_EQ(p.frame.size.height, 12.0f);
        EXPECT_EQ(p.anchor_point(), p.frame.center());
        EXPECT_TRUE(p.proposal.is_unbounded());
    }
}

TEST(RadialLayout, BoxesAreMeasuredUnconstrained) {
    RadialLayout layout;
    int calls = 0;
    Measurer measurer = [&calls](const Box&, const Constraint& c) {
        ++calls;
        EXPECT_TRUE(c.is_unbounded());
        return Size{4, 4};
    };
    layout.place(make_boxes(6), measurer, {{0, 0}, {50, 50}});
    EXPECT_EQ(calls, 6);
}

TEST(RadialLayout, NoBoxes) {
    RadialLayout layout;
    int calls = 0;
    Measurer measurer = [&calls](const Box&, const Constraint&) {
        ++calls;
        return Size{};
    };
    auto result = layout.place({}, measurer, {{0, 0}, {80, 60}});
    EXPECT_TRUE(result.placements.empty());
    EXPECT_FLOAT_EQ(result.total_size.width, 80.0f);
    EXPECT_FLOAT_EQ(result.total_size.height, 60.0f);
    EXPECT_EQ(calls, 0);
}

TEST(RadialLayout, MeasureReturnsTheProposal) {
    RadialLayout layout;
    auto size = layout.measure(make_boxes(3), uniform({500, 500}),
                               Constraint::exactly({120, 80}));
    EXPECT_FLOAT_EQ(size.width, 120.0f);
    EXPECT_FLOAT_EQ(size.height, 80.0f);
}

TEST(RadialLayout, MeasureResolvesUnboundedAxes) {
    RadialLayout layout;
    DiagnosticLog log;
    auto size = layout.measure(make_boxes(1), uniform({5, 5}), Constraint::width_only(64), &log);
    EXPECT_FLOAT_EQ(size.width, 64.0f);
    EXPECT_FLOAT_EQ(size.height, arrange::core::config::kUnspecifiedDimension);
    EXPECT_EQ(log.events_from("radial").size(), 1u);
}

TEST(RadialLayout, OversizedBoxIsReported) {
    RadialLayout layout;
    DiagnosticLog log;
    layout.place(make_boxes(2), uniform({120, 10}), {{0, 0}, {100, 100}}, &log);
    EXPECT_EQ(log.count(Severity::Warning), 2u);
    EXPECT_EQ(log.events_for_box(0).size(), 1u);
    EXPECT_EQ(log.events_for_box(1).size(), 1u);
}

TEST(RadialLayout, PlaceIsIdempotent) {
    RadialLayout layout;
    auto boxes = make_boxes(9);
    auto first = layout.place(boxes, uniform({7, 13}), {{3, 3}, {90, 70}});
    auto second = layout.place(boxes, uniform({7, 13}), {{3, 3}, {90, 70}});
    EXPECT_EQ(serialize_layout(first), serialize_layout(second));
}
