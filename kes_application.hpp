#ifndef KES_APPLICATION_HPP
#define KES_APPLICATION_HPP

#include "kes_terminal.hpp"
#include "kes_view.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <system_error>
#include <thread>

/**
 * @brief Runtime context for a terminal application built from views.
 *
 * Owns the running flag, the active view and the pending view change.  Each of
 * the three is guarded by its own reader/writer lock, so code outside the run
 * loop may inspect or mutate them while the loop is between calls.
 *
 * Views receive the context in KestrelView::handleEvent.  While a handler runs,
 * the active view is exclusively locked by the loop, so a handler must never
 * replace the view directly.  Instead it calls requestViewChange(), which parks
 * the new view in a single-slot mailbox that run() drains at the top of the next
 * iteration, before anything is rendered.
 *
 * Usage:
 *   auto app = std::make_shared<KestrelApplication>();
 *   app->initialize(std::make_unique<MyView>());
 *   auto ec = app->run(surface, events);
 */
class KestrelApplication {
  public:
    KestrelApplication() = default;
    KestrelApplication(const KestrelApplication &) = delete;
    KestrelApplication &operator=(const KestrelApplication &) = delete;

    //  Sets the running flag and the initial view.  Each is set only if not already
    //  established; a repeated call leaves the application untouched.
    void initialize(std::unique_ptr<KestrelView> initialView);
    bool isInitialized() const;

    //  Both abort the process if called before initialize()
    bool isRunning() const;
    void requestStop();

    //  Queues newView to become the active view at the start of the next loop
    //  iteration.  If a change is already queued, newView is discarded (the first
    //  request wins.)  Aborts if called before initialize().
    void requestViewChange(std::unique_ptr<KestrelView> newView);
    bool isViewChangePending() const;

    //  Installs the queued view, if any.  Returns true if the active view changed.
    //  Must not be called while the active view is being rendered or handling an
    //  event (run() calls this at the top of each iteration.)  Aborts if called from
    //  the active view's handleEvent().
    bool applyPendingViewChange();

    //  Renders the active view while holding shared access to it
    void renderCurrentView(const KestrelRect &region, KestrelFrameBuffer &buffer) const;
    //  Sends event to the active view while holding exclusive access to it.
    //  initialize(), applyPendingViewChange(), renderCurrentView() and dispatchEvent()
    //  all need the view lock, so calling them from inside handleEvent() aborts.
    std::error_code dispatchEvent(const KestrelInputEvent &event);

    //  Runs the draw / read event / dispatch loop until requestStop() is called or
    //  something fails.  The surface is acquired on entry and released on every
    //  exit.  Aborts if called before initialize() or while already running.
    std::error_code run(KestrelTerminalSurface &surface, KestrelEventSource &events);

    //  number of completed loop iterations of the current or last run()
    unsigned getFrameCount() const { return frameCount_.load(); }

  private:
    void checkNotDispatching(const char *what) const;

    struct State {
        bool isRunning;
    };

    mutable std::shared_mutex stateMutex_;
    std::optional<State> state_;

    mutable std::shared_mutex viewMutex_;
    std::unique_ptr<KestrelView> view_;
    //  thread running the active view's handleEvent(), if any
    std::atomic<std::thread::id> dispatchThread_{};
    mutable std::shared_mutex pendingMutex_;
    std::unique_ptr<KestrelView> nextView_;
    bool changeView_ = false;

    std::atomic<bool> loopActive_{false};
    std::atomic<unsigned> frameCount_{0};
};

#endif
