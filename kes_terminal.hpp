#ifndef KES_TERMINAL_HPP
#define KES_TERMINAL_HPP

#include "kes_frame_buffer.hpp"
#include "kes_types.hpp"

#include <functional>
#include <system_error>

/**
 * @brief The drawing target used by the run loop.
 *
 * acquire() switches the terminal into the mode the application needs, draw()
 * produces one frame and release() restores the terminal.  Implementations
 * must tolerate release() being called when nothing is acquired.
 */
class KestrelTerminalSurface {
  public:
    using DrawCallback = std::function<void(const KestrelRect &, KestrelFrameBuffer &)>;

    virtual ~KestrelTerminalSurface() = default;

    virtual std::error_code acquire() = 0;
    //  invokes callback with the full drawable region and a cleared frame buffer, then
    //  presents the buffer
    virtual std::error_code draw(const DrawCallback &callback) = 0;
    virtual void release() = 0;
};

//  Blocking source of input events, one event per call.
class KestrelEventSource {
  public:
    virtual ~KestrelEventSource() = default;

    virtual std::error_code readNextEvent(KestrelInputEvent &event) = 0;
};

//  Releases an acquired surface when leaving scope, on every exit path.
class KestrelSurfaceGuard {
  public:
    explicit KestrelSurfaceGuard(KestrelTerminalSurface &surface) : surface_(surface) {}
    ~KestrelSurfaceGuard() { surface_.release(); }

    KestrelSurfaceGuard(const KestrelSurfaceGuard &) = delete;
    KestrelSurfaceGuard &operator=(const KestrelSurfaceGuard &) = delete;

  private:
    KestrelTerminalSurface &surface_;
};

#endif
