/*
Chartwell — LifecycleBinding Tests
Role: Verify feed/resize wiring, serialized cycles and teardown of the chart binding
Testing Strategy: ManualFeed publishes datasets; FakeResizeSource drives widths; the surface factory hook
                  injects emissions and resizes while a cycle is mounting panes
Coverage: Bind/rebind/unbind, replay of current data, re-entrant emissions, deferred resize, subscription hygiene
*/
#include <gtest/gtest.h>
#include "render/ChartOrchestrator.hpp"
#include "render/LifecycleBinding.hpp"
#include "fixtures/fake_container.hpp"
#include "fixtures/fake_resize_source.hpp"
#include "fixtures/manual_feed.hpp"
#include "fixtures/recording_surface_factory.hpp"
#include "../marketdata/fixtures/dataset_builders.hpp"

class LifecycleBindingTest : public ::testing::Test {
protected:
    void SetUp() override {
        orchestrator = std::make_unique<ChartOrchestrator>(factory, priceContainer, oscillatorContainer);
        binding = std::make_unique<LifecycleBinding>(*orchestrator, resize);
    }

    RecordingSurfaceFactory factory;
    FakeContainer priceContainer{800};
    FakeContainer oscillatorContainer{800};
    FakeResizeSource resize;
    ManualFeed feed;
    std::unique_ptr<ChartOrchestrator> orchestrator;
    std::unique_ptr<LifecycleBinding> binding;
};

// =============================================================================
// Binding
// =============================================================================

TEST_F(LifecycleBindingTest, FeedEmissionsDriveReconcile) {
    binding->bind(feed);
    EXPECT_TRUE(binding->isBound());
    EXPECT_EQ(orchestrator->mountedPaneCount(), 0u);

    auto ds = fixtures::dataset(40, true, true);
    feed.publish(ds);
    EXPECT_EQ(orchestrator->renderedDataset(), ds);
    EXPECT_EQ(orchestrator->mountedPaneCount(), 2u);

    feed.publish(nullptr);
    EXPECT_EQ(orchestrator->mountedPaneCount(), 0u);
    EXPECT_EQ(factory.live(), 0);
}

TEST_F(LifecycleBindingTest, BindReplaysCurrentDataset) {
    auto ds = fixtures::dataset(25, false, true);
    feed.publish(ds);

    binding->bind(feed);
    EXPECT_EQ(orchestrator->renderedDataset(), ds);
    EXPECT_EQ(orchestrator->mountedPaneCount(), 2u);
}

TEST_F(LifecycleBindingTest, BindingSameFeedTwiceIsNoOp) {
    binding->bind(feed);
    binding->bind(feed);
    EXPECT_EQ(resize.subscribeCalls(), 1);
    EXPECT_EQ(resize.subscriberCount(), 1u);

    feed.publish(fixtures::dataset(10, false, false));
    EXPECT_EQ(factory.created(), 1);
}

TEST_F(LifecycleBindingTest, RebindIgnoresPreviousFeed) {
    ManualFeed other;
    binding->bind(feed);
    binding->bind(other);
    EXPECT_EQ(resize.subscriberCount(), 1u);
    EXPECT_EQ(resize.unsubscribeCalls(), 1);

    feed.publish(fixtures::dataset(10, false, false));
    EXPECT_EQ(factory.created(), 0);

    other.publish(fixtures::dataset(10, false, false));
    EXPECT_EQ(factory.created(), 1);
}

// =============================================================================
// Unbind
// =============================================================================

TEST_F(LifecycleBindingTest, UnbindRemovesSubscriptionExactlyOnce) {
    binding->bind(feed);
    feed.publish(fixtures::dataset(30, true, true));
    ASSERT_EQ(factory.live(), 2);

    binding->unbind();
    EXPECT_FALSE(binding->isBound());
    EXPECT_EQ(resize.subscriberCount(), 0u);
    EXPECT_EQ(resize.unsubscribeCalls(), 1);
    EXPECT_EQ(factory.live(), 0);

    binding->unbind();
    binding.reset();
    EXPECT_EQ(resize.unsubscribeCalls(), 1);
}

TEST_F(LifecycleBindingTest, EmissionsAfterUnbindIgnored) {
    binding->bind(feed);
    binding->unbind();

    feed.publish(fixtures::dataset(10, true, true));
    resize.emitResize(1000);
    EXPECT_EQ(factory.created(), 0);
}

TEST_F(LifecycleBindingTest, DestructorUnbinds) {
    binding->bind(feed);
    feed.publish(fixtures::dataset(10, true, true));
    binding.reset();

    EXPECT_EQ(resize.subscriberCount(), 0u);
    EXPECT_EQ(factory.live(), 0);
}

// =============================================================================
// Resize
// =============================================================================

TEST_F(LifecycleBindingTest, ResizeReachesMountedPanes) {
    binding->bind(feed);
    feed.publish(fixtures::dataset(50, true, true));

    resize.emitResize(1200);
    EXPECT_EQ(orchestrator->pane(PaneId::Price)->width(), 1200);
    EXPECT_EQ(orchestrator->pane(PaneId::Oscillator)->width(), 1200);
}

TEST_F(LifecycleBindingTest, ResizeBeforeDataIsHarmless) {
    binding->bind(feed);
    resize.emitResize(1024);
    priceContainer.setWidth(1024);
    oscillatorContainer.setWidth(1024);

    feed.publish(fixtures::dataset(20, false, true));
    EXPECT_EQ(orchestrator->pane(PaneId::Price)->width(), 1024);
}

TEST_F(LifecycleBindingTest, ResizeDuringCycleIsDeferred) {
    binding->bind(feed);
    bool fired = false;
    factory.onCreate = [&](const PaneOptions&) {
        if (fired) return;
        fired = true;
        EXPECT_TRUE(binding->isCycling());
        resize.emitResize(1300);
    };

    feed.publish(fixtures::dataset(30, true, true));
    EXPECT_FALSE(binding->isCycling());
    ASSERT_EQ(orchestrator->mountedPaneCount(), 2u);
    EXPECT_EQ(orchestrator->pane(PaneId::Price)->width(), 1300);
    EXPECT_EQ(orchestrator->pane(PaneId::Oscillator)->width(), 1300);
}

// =============================================================================
// Re-entrancy
// =============================================================================

TEST_F(LifecycleBindingTest, EmissionDuringCycleRunsAfterIt) {
    binding->bind(feed);
    auto d1 = fixtures::dataset(30, true, true, {}, "D1");
    auto d2 = fixtures::dataset(15, true, false, {}, "D2");

    bool fired = false;
    factory.onCreate = [&](const PaneOptions&) {
        if (fired) return;
        fired = true;
        // D1's price pane is being mounted when D2 arrives
        feed.publish(d2);
        EXPECT_EQ(binding->pendingCycles(), 1u);
    };

    feed.publish(d1);
    EXPECT_EQ(binding->pendingCycles(), 0u);
    EXPECT_EQ(orchestrator->renderedDataset(), d2);

    // Only D2's single price pane remains
    EXPECT_EQ(orchestrator->mountedPaneCount(), 1u);
    EXPECT_EQ(factory.live(), 1);
}

TEST_F(LifecycleBindingTest, SupersededQueuedDatasetNeverRenders) {
    binding->bind(feed);
    auto d1 = fixtures::dataset(30, true, true, {}, "D1");
    auto d2 = fixtures::dataset(15, false, false, {}, "D2");
    auto d3 = fixtures::dataset(12, false, true, {}, "D3");

    int creates = 0;
    factory.onCreate = [&](const PaneOptions&) {
        if (++creates != 1) return;
        feed.publish(d2);
        feed.publish(d3);
    };

    feed.publish(d1);
    EXPECT_EQ(orchestrator->renderedDataset(), d3);
    // d1: 2 surfaces, d2: skipped as stale, d3: 2 surfaces
    EXPECT_EQ(factory.created(), 4);
    EXPECT_EQ(factory.live(), 2);
}
