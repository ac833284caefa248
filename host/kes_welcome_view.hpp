#ifndef KES_HOST_WELCOME_VIEW_HPP
#define KES_HOST_WELCOME_VIEW_HPP

#include "kes_view.hpp"

#include <string>

//  First view shown by the demo.  Enter opens the menu, q or Q quits.
class KestrelWelcomeView : public KestrelView {
  public:
    explicit KestrelWelcomeView(std::string configPath);

    void render(const KestrelRect &region, KestrelFrameBuffer &buffer) const final;
    std::error_code handleEvent(const KestrelInputEvent &event,
                                KestrelApplication &application) final;
    const char *getViewName() const final { return "welcome"; }

  private:
    std::string configPath_;
};

#endif
