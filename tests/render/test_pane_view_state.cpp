/*
Chartwell — PaneViewState Tests
Role: Verify fit, zoom, pan and change notification of a pane's view state
Testing Strategy: Drive the public API directly; count signals with lambda connections
Coverage: Fit padding, zoom clamping and anchoring, pixel panning, no-op change suppression, wheel input, axis following
*/
#include <gtest/gtest.h>
#include "render/PaneViewState.hpp"

class PaneViewStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        state.setViewportSize(1000, 400);
        QObject::connect(&state, &PaneViewState::visibleTimeRangeChanged, [this]{ ++rangeChanges; });
        // 11 bars, 100 s apart
        state.fitTimeRange(1000, 2000, 11);
        rangeChanges = 0;
    }

    PaneViewState state;
    int rangeChanges = 0;
};

TEST_F(PaneViewStateTest, FitPadsHalfABar) {
    const TimeRange range = state.visibleTimeRange();
    EXPECT_EQ(range.from, 950);
    EXPECT_EQ(range.to, 2050);
    EXPECT_DOUBLE_EQ(state.zoomFactor(), 1.0);
}

TEST_F(PaneViewStateTest, SameRangeDoesNotNotify) {
    state.setVisibleTimeRange(state.visibleTimeRange());
    EXPECT_EQ(rangeChanges, 0);

    state.setVisibleTimeRange({500, 400});
    EXPECT_EQ(rangeChanges, 0);
    EXPECT_EQ(state.visibleTimeRange().from, 950);
}

TEST_F(PaneViewStateTest, ZoomInNarrowsAroundCenter) {
    const TimeRange before = state.visibleTimeRange();
    state.zoomIn();

    const TimeRange after = state.visibleTimeRange();
    EXPECT_LT(after.span(), before.span());
    EXPECT_NEAR((after.from + after.to) / 2.0, (before.from + before.to) / 2.0, 1.0);
    EXPECT_DOUBLE_EQ(state.zoomFactor(), PaneViewState::kZoomStep);
    EXPECT_EQ(rangeChanges, 1);
}

TEST_F(PaneViewStateTest, ZoomAnchorKeepsLeftEdge) {
    const TimeRange before = state.visibleTimeRange();
    state.zoom(2.0, 0.0);
    EXPECT_EQ(state.visibleTimeRange().from, before.from);
    EXPECT_EQ(state.visibleTimeRange().span(), before.span() / 2);
}

TEST_F(PaneViewStateTest, ZoomClampedToLimits) {
    for (int i = 0; i < 100; ++i) state.zoomOut();
    EXPECT_DOUBLE_EQ(state.zoomFactor(), PaneViewState::kMinZoom);

    const int changes = rangeChanges;
    state.zoomOut();
    EXPECT_EQ(rangeChanges, changes);
}

TEST_F(PaneViewStateTest, ZoomInStopsAtMinimumSpan) {
    for (int i = 0; i < 100; ++i) state.zoomIn();
    // Never narrower than two bar intervals
    EXPECT_GE(state.visibleTimeRange().span(), 200);
}

TEST_F(PaneViewStateTest, PanByPixelsShiftsRange) {
    // 1100 s over 1000 px; dragging right moves the view back in time
    state.panByPixels(100.0);
    EXPECT_EQ(state.visibleTimeRange().from, 840);
    EXPECT_EQ(state.visibleTimeRange().to, 1940);
    EXPECT_EQ(rangeChanges, 1);
}

TEST_F(PaneViewStateTest, DragPansOnlyWhileDragging) {
    state.handlePanMove(QPointF(500, 10));
    EXPECT_EQ(rangeChanges, 0);

    state.handlePanStart(QPointF(500, 10));
    EXPECT_TRUE(state.isDragging());
    state.handlePanMove(QPointF(400, 10));
    state.handlePanEnd();
    EXPECT_FALSE(state.isDragging());
    EXPECT_EQ(state.visibleTimeRange().from, 1060);
}

TEST_F(PaneViewStateTest, WheelZoomIsBounded) {
    const TimeRange before = state.visibleTimeRange();
    state.handleWheel(100000.0, QPointF(500, 0));
    // Single wheel step never exceeds a 1.4x zoom
    EXPECT_NEAR(state.zoomFactor(), 1.4, 1e-9);
    EXPECT_LT(state.visibleTimeRange().span(), before.span());
}

TEST_F(PaneViewStateTest, ViewportReflectsState) {
    state.setValueRange(10.0, 20.0);
    const Viewport vp = state.viewport();
    EXPECT_EQ(vp.timeStart, 950);
    EXPECT_EQ(vp.timeEnd, 2050);
    EXPECT_DOUBLE_EQ(vp.valueMin, 10.0);
    EXPECT_DOUBLE_EQ(vp.valueMax, 20.0);
    EXPECT_DOUBLE_EQ(vp.width, 1000.0);
    EXPECT_DOUBLE_EQ(vp.height, 400.0);
}

TEST_F(PaneViewStateTest, FollowTimeAxisAdoptsZoomState) {
    PaneViewState follower;
    follower.fitTimeRange(0, 100, 101);
    state.zoom(4.0);

    follower.followTimeAxis(state);
    EXPECT_EQ(follower.visibleTimeRange(), state.visibleTimeRange());
    EXPECT_DOUBLE_EQ(follower.zoomFactor(), 4.0);
    EXPECT_EQ(follower.minSpan(), state.minSpan());

    // Further zooming on the follower clamps against the shared factor
    follower.zoom(100.0);
    EXPECT_DOUBLE_EQ(follower.zoomFactor(), PaneViewState::kMaxZoom);
    EXPECT_GE(follower.visibleTimeRange().span(), state.minSpan());
}

TEST_F(PaneViewStateTest, RefitNotifiesWhenOnlyZoomIsReset) {
    // Same visible range as the fixture's fit, reached at a zoom factor of 13/11
    PaneViewState leader;
    leader.fitTimeRange(900, 2100, 13);
    leader.zoom(13.0 / 11.0);
    ASSERT_EQ(leader.visibleTimeRange(), (TimeRange{950, 2050}));

    state.followTimeAxis(leader);
    EXPECT_EQ(rangeChanges, 0);
    EXPECT_GT(state.zoomFactor(), 1.0);

    state.fitTimeRange(1000, 2000, 11);
    EXPECT_DOUBLE_EQ(state.zoomFactor(), 1.0);
    EXPECT_EQ(rangeChanges, 1);
}

TEST(PaneViewState, SingleBarFitUsesDefaultInterval) {
    PaneViewState state;
    state.fitTimeRange(5000, 5000, 1);
    EXPECT_TRUE(state.visibleTimeRange().valid());
    EXPECT_LT(state.visibleTimeRange().from, 5000);
    EXPECT_GT(state.visibleTimeRange().to, 5000);
}
