#ifndef KES_HOST_ABOUT_VIEW_HPP
#define KES_HOST_ABOUT_VIEW_HPP

#include "kes_view.hpp"

#include <string>

//  Reports the drawable region and the configuration in use.  Any key returns to
//  the menu; resize events only update the counter.
class KestrelAboutView : public KestrelView {
  public:
    explicit KestrelAboutView(std::string configPath);

    void render(const KestrelRect &region, KestrelFrameBuffer &buffer) const final;
    std::error_code handleEvent(const KestrelInputEvent &event,
                                KestrelApplication &application) final;
    const char *getViewName() const final { return "about"; }

    unsigned getResizeCount() const { return resizeCount_; }

  private:
    std::string configPath_;
    unsigned resizeCount_;
};

#endif
