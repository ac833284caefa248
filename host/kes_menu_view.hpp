#ifndef KES_HOST_MENU_VIEW_HPP
#define KES_HOST_MENU_VIEW_HPP

#include "kes_view.hpp"

#include <string>

class KestrelMenuView : public KestrelView {
  public:
    enum class Item { About, Back, Quit };

    explicit KestrelMenuView(std::string configPath);

    void render(const KestrelRect &region, KestrelFrameBuffer &buffer) const final;
    std::error_code handleEvent(const KestrelInputEvent &event,
                                KestrelApplication &application) final;
    const char *getViewName() const final { return "menu"; }

    Item getSelectedItem() const { return static_cast<Item>(selected_); }

  private:
    void activate(KestrelApplication &application);

    std::string configPath_;
    int selected_;
};

#endif
