#ifndef KES_VIEW_HPP
#define KES_VIEW_HPP

#include "kes_frame_buffer.hpp"
#include "kes_types.hpp"

#include <system_error>

class KestrelApplication;

/**
 * @brief A screen or page driven by the application run loop.
 *
 * Exactly one view is active at a time.  The application renders it once per
 * loop iteration and hands it every input event.  A view changes what is on
 * screen by asking the application for a different view (see
 * KestrelApplication::requestViewChange), which takes effect at the start of
 * the next loop iteration, and ends the program with
 * KestrelApplication::requestStop.
 */
class KestrelView {
  public:
    virtual ~KestrelView() = default;

    //  paints the view into region.  Called with shared access to the view, so this
    //  must only depend on the view's own state and the region size, and must not
    //  block.
    virtual void render(const KestrelRect &region, KestrelFrameBuffer &buffer) const = 0;

    //  handles one input event.  Called with exclusive access to the view.  A
    //  failure ends the run loop and is returned from KestrelApplication::run.
    virtual std::error_code handleEvent(const KestrelInputEvent & /*event */,
                                        KestrelApplication & /*application */) {
        return {};
    }

    //  reflection on the view for log output
    virtual const char *getViewName() const { return "view"; }
};

#endif
