#include "kes_application.hpp"
#include "kes_error.hpp"
#include "kes_test_fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using RenderLog = std::shared_ptr<std::vector<std::string>>;

RenderLog makeLog() { return std::make_shared<std::vector<std::string>>(); }

std::string renderedName(const KestrelApplication &app) {
    KestrelFrameBuffer buffer(16, 1);
    app.renderCurrentView(buffer.getArea(), buffer);
    auto row = buffer.getRowText(0);
    return row.substr(0, row.find(' '));
}

ProbeView::Handler quitOn(char ch) {
    return [ch](const KestrelInputEvent &event, KestrelApplication &app) -> std::error_code {
        if (event.isCharacter(ch))
            app.requestStop();
        return {};
    };
}

} // namespace

TEST(KestrelApplicationTest, InitializeIsIdempotent) {
    KestrelApplication app;
    EXPECT_FALSE(app.isInitialized());

    app.initialize(std::make_unique<ProbeView>("first", nullptr));
    EXPECT_TRUE(app.isInitialized());
    EXPECT_TRUE(app.isRunning());
    app.requestStop();

    bool secondDestroyed = false;
    auto second = std::make_unique<ProbeView>("second", nullptr);
    second->trackDestruction(&secondDestroyed);
    app.initialize(std::move(second));

    EXPECT_TRUE(secondDestroyed);
    EXPECT_FALSE(app.isRunning());
    EXPECT_EQ(renderedName(app), "first");
}

TEST(KestrelApplicationTest, StopFromHandlerEndsLoop) {
    auto log = makeLog();
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>("main", log, quitOn('q')));

    FakeSurface surface;
    ScriptedEvents events({keyChar('x'), keyChar('q'), keyChar('y')});
    auto ec = app.run(surface, events);

    EXPECT_FALSE(ec);
    EXPECT_FALSE(app.isRunning());
    EXPECT_EQ(surface.drawCount, 2);
    EXPECT_EQ(log->size(), 2u);
    EXPECT_EQ(events.readCount, 2);
    EXPECT_EQ(surface.acquireCount, 1);
    EXPECT_EQ(surface.releaseCount, 1);
    EXPECT_EQ(app.getFrameCount(), 2u);
}

TEST(KestrelApplicationTest, ViewChangeIsDeferredToNextIteration) {
    auto log = makeLog();
    KestrelApplication app;
    size_t rendersWhenRequested = 0;
    bool stillPendingInHandler = false;
    app.initialize(std::make_unique<ProbeView>(
        "A", log,
        [&](const KestrelInputEvent &event, KestrelApplication &a) -> std::error_code {
            if (event.isCharacter('s')) {
                a.requestViewChange(std::make_unique<ProbeView>("B", log, quitOn('q')));
                rendersWhenRequested = log->size();
                stillPendingInHandler = a.isViewChangePending();
            }
            return {};
        }));

    FakeSurface surface;
    ScriptedEvents events({keyChar('s'), keyChar('q')});
    auto ec = app.run(surface, events);

    EXPECT_FALSE(ec);
    EXPECT_TRUE(stillPendingInHandler);
    EXPECT_EQ(rendersWhenRequested, 1u);
    ASSERT_EQ(log->size(), 2u);
    EXPECT_EQ((*log)[0], "A");
    EXPECT_EQ((*log)[1], "B");
    EXPECT_FALSE(app.isViewChangePending());
}

TEST(KestrelApplicationTest, FirstRequestedViewWins) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>("A", nullptr));

    bool secondDestroyed = false;
    auto second = std::make_unique<ProbeView>("C", nullptr);
    second->trackDestruction(&secondDestroyed);

    app.requestViewChange(std::make_unique<ProbeView>("B", nullptr));
    app.requestViewChange(std::move(second));
    EXPECT_TRUE(secondDestroyed);
    EXPECT_TRUE(app.isViewChangePending());
    EXPECT_EQ(renderedName(app), "A");

    EXPECT_TRUE(app.applyPendingViewChange());
    EXPECT_EQ(renderedName(app), "B");
    EXPECT_FALSE(app.applyPendingViewChange());
    EXPECT_EQ(renderedName(app), "B");
}

TEST(KestrelApplicationTest, CoalescedRequestsInsideLoop) {
    auto log = makeLog();
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "A", log, [&](const KestrelInputEvent &, KestrelApplication &a) -> std::error_code {
            a.requestViewChange(std::make_unique<ProbeView>("B", log, quitOn('q')));
            a.requestViewChange(std::make_unique<ProbeView>("C", log, quitOn('q')));
            return {};
        }));

    FakeSurface surface;
    ScriptedEvents events({keyChar('s'), keyChar('q')});
    EXPECT_FALSE(app.run(surface, events));
    ASSERT_EQ(log->size(), 2u);
    EXPECT_EQ((*log)[1], "B");
}

TEST(KestrelApplicationTest, SwapDestroysPreviousView) {
    KestrelApplication app;
    bool firstDestroyed = false;
    auto first = std::make_unique<ProbeView>("A", nullptr);
    first->trackDestruction(&firstDestroyed);
    app.initialize(std::move(first));

    app.requestViewChange(std::make_unique<ProbeView>("B", nullptr));
    EXPECT_FALSE(firstDestroyed);
    EXPECT_TRUE(app.applyPendingViewChange());
    EXPECT_TRUE(firstDestroyed);
}

TEST(KestrelApplicationTest, RenderAndDispatchNeverOverlap) {
    struct ExclusionView : public KestrelView {
        std::atomic<int> &readers;
        std::atomic<int> &writers;
        std::atomic<bool> &overlap;

        ExclusionView(std::atomic<int> &r, std::atomic<int> &w, std::atomic<bool> &o)
            : readers(r), writers(w), overlap(o) {}

        void render(const KestrelRect &, KestrelFrameBuffer &) const override {
            readers.fetch_add(1);
            if (writers.load() != 0)
                overlap.store(true);
            std::this_thread::yield();
            if (writers.load() != 0)
                overlap.store(true);
            readers.fetch_sub(1);
        }

        std::error_code handleEvent(const KestrelInputEvent &, KestrelApplication &) override {
            if (writers.fetch_add(1) != 0 || readers.load() != 0)
                overlap.store(true);
            std::this_thread::yield();
            if (readers.load() != 0)
                overlap.store(true);
            writers.fetch_sub(1);
            return {};
        }
    };

    std::atomic<int> readers{0};
    std::atomic<int> writers{0};
    std::atomic<bool> overlap{false};
    KestrelApplication app;
    app.initialize(std::make_unique<ExclusionView>(readers, writers, overlap));

    constexpr int kIterations = 2000;
    auto renderer = [&app]() {
        KestrelFrameBuffer buffer(4, 1);
        for (int i = 0; i < kIterations; ++i) {
            app.renderCurrentView(buffer.getArea(), buffer);
        }
    };
    auto dispatcher = [&app]() {
        for (int i = 0; i < kIterations; ++i) {
            EXPECT_FALSE(app.dispatchEvent(keyChar('x')));
        }
    };

    std::thread r1(renderer);
    std::thread r2(renderer);
    std::thread d1(dispatcher);
    std::thread d2(dispatcher);
    r1.join();
    r2.join();
    d1.join();
    d2.join();

    EXPECT_FALSE(overlap.load());
}

TEST(KestrelApplicationTest, ReadFailureReleasesSurfaceOnce) {
    auto log = makeLog();
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>("main", log));

    FakeSurface surface;
    ScriptedEvents events;
    auto ec = app.run(surface, events);

    EXPECT_EQ(ec, KestrelError::InputReadFailed);
    EXPECT_EQ(surface.releaseCount, 1);
    EXPECT_FALSE(surface.acquired);
    EXPECT_EQ(log->size(), 1u);
    EXPECT_TRUE(app.isRunning());
}

TEST(KestrelApplicationTest, DrawFailureReleasesSurfaceOnce) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>("main", nullptr));

    FakeSurface surface;
    surface.failDrawAt = 2;
    ScriptedEvents events({keyChar('a'), keyChar('b')});
    auto ec = app.run(surface, events);

    EXPECT_EQ(ec, KestrelError::SurfaceDrawFailed);
    EXPECT_EQ(events.readCount, 1);
    EXPECT_EQ(surface.releaseCount, 1);
}

TEST(KestrelApplicationTest, HandlerFailureStopsWithoutFurtherRender) {
    auto log = makeLog();
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "main", log, [](const KestrelInputEvent &event, KestrelApplication &) -> std::error_code {
            if (event.isCharacter('!'))
                return KestrelError::ViewFailed;
            return {};
        }));

    FakeSurface surface;
    ScriptedEvents events({keyChar('a'), keyChar('!'), keyChar('b')});
    auto ec = app.run(surface, events);

    EXPECT_EQ(ec, KestrelError::ViewFailed);
    EXPECT_EQ(log->size(), 2u);
    EXPECT_EQ(events.readCount, 2);
    EXPECT_EQ(surface.releaseCount, 1);
    EXPECT_EQ(app.getFrameCount(), 1u);
}

TEST(KestrelApplicationTest, HandlerMayReturnSystemErrors) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "main", nullptr, [](const KestrelInputEvent &, KestrelApplication &) -> std::error_code {
            return std::make_error_code(std::errc::io_error);
        }));

    FakeSurface surface;
    ScriptedEvents events({keyChar('a')});
    auto ec = app.run(surface, events);

    EXPECT_EQ(ec, std::errc::io_error);
    EXPECT_EQ(surface.releaseCount, 1);
}

TEST(KestrelApplicationTest, AcquireFailureSkipsLoopAndRelease) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>("main", nullptr));

    FakeSurface surface;
    surface.acquireError = KestrelError::SurfaceAcquireFailed;
    ScriptedEvents events({keyChar('a')});
    auto ec = app.run(surface, events);

    EXPECT_EQ(ec, KestrelError::SurfaceAcquireFailed);
    EXPECT_EQ(surface.drawCount, 0);
    EXPECT_EQ(surface.releaseCount, 0);
    EXPECT_EQ(events.readCount, 0);
}

TEST(KestrelApplicationTest, StoppedBeforeRunDoesNotRender) {
    auto log = makeLog();
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>("main", log));
    app.requestStop();

    FakeSurface surface;
    ScriptedEvents events({keyChar('a')});
    EXPECT_FALSE(app.run(surface, events));
    EXPECT_TRUE(log->empty());
    EXPECT_EQ(surface.releaseCount, 1);
}

TEST(KestrelApplicationTest, SwitchThenQuitScenario) {
    auto log = makeLog();
    bool viewADestroyed = false;
    auto viewA = std::make_unique<ProbeView>(
        "ViewA", log, [&log](const KestrelInputEvent &event, KestrelApplication &app) {
            if (event.isCharacter('s'))
                app.requestViewChange(std::make_unique<ProbeView>("ViewB", log, quitOn('q')));
            return std::error_code{};
        });
    viewA->trackDestruction(&viewADestroyed);

    KestrelApplication app;
    app.initialize(std::move(viewA));
    EXPECT_TRUE(app.isRunning());

    FakeSurface surface(20, 4);
    ScriptedEvents events({keyChar('s'), keyChar('q')});
    auto ec = app.run(surface, events);

    EXPECT_FALSE(ec);
    ASSERT_EQ(log->size(), 2u);
    EXPECT_EQ((*log)[0], "ViewA");
    EXPECT_EQ((*log)[1], "ViewB");
    EXPECT_TRUE(viewADestroyed);
    EXPECT_EQ(surface.getBuffer().getRowText(0).substr(0, 5), "ViewB");
    EXPECT_EQ(surface.releaseCount, 1);
    EXPECT_FALSE(app.isRunning());
}

TEST(KestrelApplicationTest, RunCanBeRepeatedAfterFailure) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>("main", nullptr, quitOn('q')));

    FakeSurface surface;
    ScriptedEvents failing;
    EXPECT_EQ(app.run(surface, failing), KestrelError::InputReadFailed);

    ScriptedEvents quitting({keyChar('q')});
    EXPECT_FALSE(app.run(surface, quitting));
    EXPECT_EQ(surface.acquireCount, 2);
    EXPECT_EQ(surface.releaseCount, 2);
}

TEST(KestrelApplicationDeathTest, IsRunningBeforeInitialize) {
    KestrelApplication app;
    EXPECT_DEATH((void)app.isRunning(), "before initialize");
}

TEST(KestrelApplicationDeathTest, RequestStopBeforeInitialize) {
    KestrelApplication app;
    EXPECT_DEATH(app.requestStop(), "before initialize");
}

TEST(KestrelApplicationDeathTest, RequestViewChangeBeforeInitialize) {
    KestrelApplication app;
    EXPECT_DEATH(app.requestViewChange(std::make_unique<ProbeView>("B", nullptr)),
                 "before initialize");
}

TEST(KestrelApplicationDeathTest, RunBeforeInitialize) {
    KestrelApplication app;
    FakeSurface surface;
    ScriptedEvents events;
    EXPECT_DEATH((void)app.run(surface, events), "before initialize");
}

TEST(KestrelApplicationDeathTest, InitializeWithoutView) {
    KestrelApplication app;
    EXPECT_DEATH(app.initialize(nullptr), "requires a view");
}

TEST(KestrelApplicationDeathTest, ReentrantRun) {
    FakeSurface surface;
    ScriptedEvents events({keyChar('r')});
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "main", nullptr,
        [&surface, &events](const KestrelInputEvent &, KestrelApplication &a) {
            return a.run(surface, events);
        }));
    EXPECT_DEATH((void)app.run(surface, events), "already running");
}

TEST(KestrelApplicationDeathTest, ApplyViewChangeFromHandler) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "A", nullptr, [](const KestrelInputEvent &, KestrelApplication &a) -> std::error_code {
            a.requestViewChange(std::make_unique<ProbeView>("B", nullptr));
            a.applyPendingViewChange();
            return {};
        }));
    EXPECT_DEATH((void)app.dispatchEvent(keyChar('x')),
                 "applyPendingViewChange\\(\\) called from inside handleEvent");
}

TEST(KestrelApplicationDeathTest, RenderFromHandler) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "A", nullptr, [](const KestrelInputEvent &, KestrelApplication &a) -> std::error_code {
            KestrelFrameBuffer buffer(8, 1);
            a.renderCurrentView(buffer.getArea(), buffer);
            return {};
        }));
    EXPECT_DEATH((void)app.dispatchEvent(keyChar('x')), "called from inside handleEvent");
}

TEST(KestrelApplicationDeathTest, DispatchFromHandler) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "A", nullptr, [](const KestrelInputEvent &event, KestrelApplication &a) {
            return a.dispatchEvent(event);
        }));
    EXPECT_DEATH((void)app.dispatchEvent(keyChar('x')), "called from inside handleEvent");
}

TEST(KestrelApplicationDeathTest, InitializeFromHandler) {
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "A", nullptr, [](const KestrelInputEvent &, KestrelApplication &a) -> std::error_code {
            a.initialize(std::make_unique<ProbeView>("B", nullptr));
            return {};
        }));
    EXPECT_DEATH((void)app.dispatchEvent(keyChar('x')), "called from inside handleEvent");
}

TEST(KestrelApplicationTest, DispatchingEndsWhenHandlerReturns) {
    auto log = makeLog();
    KestrelApplication app;
    app.initialize(std::make_unique<ProbeView>(
        "A", log, [](const KestrelInputEvent &, KestrelApplication &a) -> std::error_code {
            a.requestViewChange(std::make_unique<ProbeView>("B", nullptr));
            return {};
        }));
    EXPECT_FALSE(app.dispatchEvent(keyChar('x')));
    EXPECT_TRUE(app.applyPendingViewChange());
    EXPECT_EQ(renderedName(app), "B");
}
