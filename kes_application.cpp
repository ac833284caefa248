#include "kes_application.hpp"
#include "kes_error.hpp"

#include "spdlog/spdlog.h"

#include <mutex>
#include <utility>

namespace {

//  clears the reentrancy flag on every exit from run()
class LoopActiveReset {
  public:
    explicit LoopActiveReset(std::atomic<bool> &flag) : flag_(flag) {}
    ~LoopActiveReset() { flag_.store(false); }

  private:
    std::atomic<bool> &flag_;
};

//  marks the calling thread as dispatching for the lifetime of a handleEvent() call
class DispatchScope {
  public:
    explicit DispatchScope(std::atomic<std::thread::id> &owner) : owner_(owner) {
        owner_.store(std::this_thread::get_id());
    }
    ~DispatchScope() { owner_.store(std::thread::id()); }

  private:
    std::atomic<std::thread::id> &owner_;
};

} // namespace

void KestrelApplication::checkNotDispatching(const char *what) const {
    if (dispatchThread_.load() == std::this_thread::get_id()) {
        kestrelFatalMisuse(what);
    }
}

void KestrelApplication::initialize(std::unique_ptr<KestrelView> initialView) {
    checkNotDispatching("initialize() called from inside handleEvent()");
    if (!initialView) {
        kestrelFatalMisuse("initialize() requires a view");
    }
    {
        std::unique_lock<std::shared_mutex> lk(viewMutex_);
        if (!view_) {
            view_ = std::move(initialView);
            spdlog::debug("Initial view is '{}'", view_->getViewName());
        } else {
            spdlog::debug("Application view already initialized, ignoring '{}'",
                          initialView->getViewName());
        }
    }
    {
        std::unique_lock<std::shared_mutex> lk(stateMutex_);
        if (!state_.has_value()) {
            state_ = State{true};
        }
    }
}

bool KestrelApplication::isInitialized() const {
    std::shared_lock<std::shared_mutex> lk(stateMutex_);
    return state_.has_value();
}

bool KestrelApplication::isRunning() const {
    std::shared_lock<std::shared_mutex> lk(stateMutex_);
    if (!state_.has_value()) {
        kestrelFatalMisuse("isRunning() called before initialize()");
    }
    return state_->isRunning;
}

void KestrelApplication::requestStop() {
    std::unique_lock<std::shared_mutex> lk(stateMutex_);
    if (!state_.has_value()) {
        kestrelFatalMisuse("requestStop() called before initialize()");
    }
    if (state_->isRunning) {
        spdlog::info("Application stop requested");
    }
    state_->isRunning = false;
}

void KestrelApplication::requestViewChange(std::unique_ptr<KestrelView> newView) {
    if (!isInitialized()) {
        kestrelFatalMisuse("requestViewChange() called before initialize()");
    }
    if (!newView) {
        kestrelFatalMisuse("requestViewChange() requires a view");
    }
    //  only the mailbox is locked here.  The caller is usually the active view's
    //  own event handler, which runs while the loop holds the view lock.
    std::unique_lock<std::shared_mutex> lk(pendingMutex_);
    if (changeView_) {
        spdlog::debug("View change to '{}' dropped, '{}' is already pending",
                      newView->getViewName(), nextView_->getViewName());
        return;
    }
    nextView_ = std::move(newView);
    changeView_ = true;
}

bool KestrelApplication::isViewChangePending() const {
    std::shared_lock<std::shared_mutex> lk(pendingMutex_);
    return changeView_;
}

bool KestrelApplication::applyPendingViewChange() {
    checkNotDispatching("applyPendingViewChange() called from inside handleEvent()");
    std::unique_ptr<KestrelView> nextView;
    {
        std::unique_lock<std::shared_mutex> lk(pendingMutex_);
        if (!changeView_)
            return false;
        changeView_ = false;
        nextView = std::move(nextView_);
    }
    //  the outgoing view is destroyed after the view lock is released
    std::unique_ptr<KestrelView> oldView;
    {
        std::unique_lock<std::shared_mutex> lk(viewMutex_);
        spdlog::debug("Changing view '{}' -> '{}'", view_ ? view_->getViewName() : "(none)",
                      nextView->getViewName());
        oldView = std::exchange(view_, std::move(nextView));
    }
    return true;
}

void KestrelApplication::renderCurrentView(const KestrelRect &region,
                                           KestrelFrameBuffer &buffer) const {
    checkNotDispatching("renderCurrentView() called from inside handleEvent()");
    std::shared_lock<std::shared_mutex> lk(viewMutex_);
    if (!view_) {
        kestrelFatalMisuse("render requested before initialize()");
    }
    view_->render(region, buffer);
}

std::error_code KestrelApplication::dispatchEvent(const KestrelInputEvent &event) {
    checkNotDispatching("dispatchEvent() called from inside handleEvent()");
    std::unique_lock<std::shared_mutex> lk(viewMutex_);
    if (!view_) {
        kestrelFatalMisuse("event dispatched before initialize()");
    }
    DispatchScope dispatching(dispatchThread_);
    return view_->handleEvent(event, *this);
}

std::error_code KestrelApplication::run(KestrelTerminalSurface &surface,
                                        KestrelEventSource &events) {
    if (!isInitialized()) {
        kestrelFatalMisuse("run() called before initialize()");
    }
    if (loopActive_.exchange(true)) {
        kestrelFatalMisuse("run() called while the application loop is already running");
    }
    LoopActiveReset loopReset(loopActive_);
    frameCount_ = 0;

    if (auto ec = surface.acquire()) {
        spdlog::error("Unable to acquire the terminal - {}", ec.message());
        return ec;
    }
    KestrelSurfaceGuard surfaceGuard(surface);
    spdlog::info("Application loop started");

    std::error_code ec;
    while (isRunning()) {
        applyPendingViewChange();

        ec = surface.draw([this](const KestrelRect &region, KestrelFrameBuffer &buffer) {
            renderCurrentView(region, buffer);
        });
        if (ec) {
            spdlog::error("Frame {} draw failed - {}", frameCount_.load(), ec.message());
            break;
        }

        KestrelInputEvent event{};
        ec = events.readNextEvent(event);
        if (ec) {
            spdlog::error("Frame {} input failed - {}", frameCount_.load(), ec.message());
            break;
        }

        ec = dispatchEvent(event);
        if (ec) {
            spdlog::error("Frame {} view failed to handle event - {}", frameCount_.load(),
                          ec.message());
            break;
        }
        ++frameCount_;
    }

    if (!ec) {
        spdlog::info("Application loop stopped after {} frames", frameCount_.load());
    }
    return ec;
}
