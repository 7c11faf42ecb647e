/*
Chartwell — PaneController Tests
Role: Verify the Unmounted/Mounted state machine around one surface
Testing Strategy: RecordingSurfaceFactory + FakeContainer; inspect surfaces and view state
Coverage: Mount failures, misuse errors, layer replacement, resize with and without refit, idempotent destroy
*/
#include <gtest/gtest.h>
#include <algorithm>
#include "render/PaneController.hpp"
#include "render/SeriesAdapter.hpp"
#include "fixtures/fake_container.hpp"
#include "fixtures/recording_surface_factory.hpp"
#include "../marketdata/fixtures/dataset_builders.hpp"

namespace {

PaneOptions priceOptions() {
    PaneOptions options;
    options.name = "Price";
    options.height = 400;
    return options;
}

PaneLayers candleLayers(size_t n) {
    PaneLayers layers;
    layers.series.emplace_back(SeriesAdapter::toCandleLayer(fixtures::candles(n)));
    return layers;
}

} // namespace

class PaneControllerTest : public ::testing::Test {
protected:
    RecordingSurfaceFactory factory;
    FakeContainer container{800};
    PaneController pane{PaneId::Price, factory};
};

// =============================================================================
// Mount
// =============================================================================

TEST_F(PaneControllerTest, MountCreatesSurfaceAtContainerWidth) {
    pane.mount(container, priceOptions());

    EXPECT_TRUE(pane.isMounted());
    EXPECT_EQ(factory.created(), 1);
    EXPECT_EQ(factory.live(), 1);
    EXPECT_EQ(pane.width(), 800);
    EXPECT_EQ(pane.height(), 400);
    ASSERT_NE(pane.viewState(), nullptr);
    EXPECT_DOUBLE_EQ(pane.viewState()->viewportWidth(), 800.0);
}

TEST_F(PaneControllerTest, ZeroWidthContainerFailsMount) {
    container.setWidth(0);
    EXPECT_THROW(pane.mount(container, priceOptions()), PaneMountError);
    EXPECT_FALSE(pane.isMounted());
    EXPECT_EQ(factory.created(), 0);
    EXPECT_EQ(pane.viewState(), nullptr);
}

TEST_F(PaneControllerTest, DoubleMountIsStateError) {
    pane.mount(container, priceOptions());
    EXPECT_THROW(pane.mount(container, priceOptions()), PaneStateError);
    EXPECT_EQ(factory.live(), 1);
}

TEST_F(PaneControllerTest, OperationsRequireMount) {
    EXPECT_THROW(pane.setLayers(candleLayers(3)), PaneStateError);
    EXPECT_THROW(pane.resize(1000), PaneStateError);
    EXPECT_THROW(pane.fitContent(), PaneStateError);
}

// =============================================================================
// Layers
// =============================================================================

TEST_F(PaneControllerTest, SetLayersReplacesWholesale) {
    pane.mount(container, priceOptions());

    PaneLayers first = candleLayers(10);
    first.markers.push_back(MarkerSpec{});
    pane.setLayers(first);

    pane.setLayers(candleLayers(5));
    auto* surface = static_cast<FakeSurface*>(pane.surface());
    EXPECT_EQ(surface->applyCalls(), 2);
    EXPECT_TRUE(surface->appliedLayers().markers.empty());
    ASSERT_EQ(pane.layers().series.size(), 1u);
    EXPECT_EQ(std::get<CandleLayer>(pane.layers().series[0]).candles.size(), 5u);
}

TEST_F(PaneControllerTest, SetLayersAutoscalesValueRange) {
    pane.mount(container, priceOptions());
    pane.setLayers(candleLayers(10));
    pane.fitContent();

    auto candles = fixtures::candles(10);
    double lo = candles[0].low, hi = candles[0].high;
    for (const auto& c : candles) {
        lo = std::min(lo, c.low);
        hi = std::max(hi, c.high);
    }
    const auto [expectedMin, expectedMax] = CoordinateSystem::fitValueRange(lo, hi, 0.1, 0.1);
    EXPECT_DOUBLE_EQ(pane.viewState()->minValue(), expectedMin);
    EXPECT_DOUBLE_EQ(pane.viewState()->maxValue(), expectedMax);
}

TEST_F(PaneControllerTest, FitContentCoversAllBars) {
    pane.mount(container, priceOptions());
    pane.setLayers(candleLayers(50));
    pane.fitContent();

    const TimeRange range = pane.viewState()->visibleTimeRange();
    EXPECT_LT(range.from, fixtures::kStartTime);
    EXPECT_GT(range.to, fixtures::kStartTime + 49 * fixtures::kDay);
}

// =============================================================================
// Resize
// =============================================================================

TEST_F(PaneControllerTest, ResizeKeepsVisibleRange) {
    pane.mount(container, priceOptions());
    pane.setLayers(candleLayers(50));
    pane.fitContent();
    pane.viewState()->zoomIn();
    const TimeRange before = pane.viewState()->visibleTimeRange();

    pane.resize(1200);
    EXPECT_EQ(pane.width(), 1200);
    EXPECT_EQ(pane.height(), 400);
    EXPECT_EQ(pane.viewState()->visibleTimeRange(), before);
}

TEST_F(PaneControllerTest, ResizeWithAutoFitRefits) {
    pane.mount(container, priceOptions());
    pane.setLayers(candleLayers(50));
    pane.fitContent();
    const TimeRange fitted = pane.viewState()->visibleTimeRange();
    pane.viewState()->zoomIn();

    pane.resize(1200, true);
    EXPECT_EQ(pane.viewState()->visibleTimeRange(), fitted);
    EXPECT_DOUBLE_EQ(pane.viewState()->zoomFactor(), 1.0);
}

TEST_F(PaneControllerTest, NonPositiveResizeIgnored) {
    pane.mount(container, priceOptions());
    pane.resize(0);
    pane.resize(-10);
    EXPECT_EQ(pane.width(), 800);
}

// =============================================================================
// Destroy
// =============================================================================

TEST_F(PaneControllerTest, DestroyReleasesSurfaceAndIsIdempotent) {
    pane.mount(container, priceOptions());
    pane.destroy();
    EXPECT_FALSE(pane.isMounted());
    EXPECT_EQ(factory.live(), 0);
    EXPECT_EQ(pane.viewState(), nullptr);
    EXPECT_EQ(pane.width(), 0);

    pane.destroy();
    EXPECT_EQ(factory.live(), 0);
}

TEST_F(PaneControllerTest, RemountAfterDestroy) {
    pane.mount(container, priceOptions());
    pane.destroy();
    container.setWidth(640);
    pane.mount(container, priceOptions());
    EXPECT_EQ(pane.width(), 640);
    EXPECT_EQ(factory.live(), 1);
    EXPECT_EQ(factory.created(), 2);
}

TEST(PaneControllerLifetime, DestructorReleasesSurface) {
    RecordingSurfaceFactory factory;
    FakeContainer container;
    {
        PaneController pane(PaneId::Oscillator, factory);
        pane.mount(container, PaneOptions{});
        EXPECT_EQ(factory.live(), 1);
    }
    EXPECT_EQ(factory.live(), 0);
}

TEST(PaneControllerLifetime, TimeExtentSpansAllSeries) {
    PaneLayers layers;
    EXPECT_FALSE(timeExtent(layers).has_value());

    layers.series.emplace_back(SeriesAdapter::toCandleLayer(fixtures::candles(10)));
    auto extent = timeExtent(layers);
    ASSERT_TRUE(extent.has_value());
    EXPECT_EQ(extent->first, fixtures::kStartTime);
    EXPECT_EQ(extent->last, fixtures::kStartTime + 9 * fixtures::kDay);
    EXPECT_EQ(extent->barCount, 10u);
}
