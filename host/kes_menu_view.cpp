#include "kes_menu_view.hpp"
#include "kes_about_view.hpp"
#include "kes_application.hpp"
#include "kes_l10n.hpp"
#include "kes_welcome_view.hpp"

#include "fmt/format.h"

#include <memory>
#include <utility>

namespace {

constexpr int kMenuItemCount = 3;

const char *getItemLabel(int index) {
    switch (static_cast<KestrelMenuView::Item>(index)) {
    case KestrelMenuView::Item::About:
        return KES_L10N_LABEL(kMenuItemAbout);
    case KestrelMenuView::Item::Back:
        return KES_L10N_LABEL(kMenuItemBack);
    case KestrelMenuView::Item::Quit:
        return KES_L10N_LABEL(kMenuItemQuit);
    }
    return "";
}

} // namespace

KestrelMenuView::KestrelMenuView(std::string configPath)
    : configPath_(std::move(configPath)), selected_(0) {}

void KestrelMenuView::render(const KestrelRect &region, KestrelFrameBuffer &buffer) const {
    buffer.drawBox(region);
    buffer.putCenteredText(region, region.y, fmt::format(" {} ", KES_L10N_LABEL(kMenuTitle)),
                           kKestrelAttr_Bold);

    auto inner = region.inset(2, 1);
    int top = inner.y + (inner.height - kMenuItemCount) / 2;
    for (int i = 0; i < kMenuItemCount; ++i) {
        auto label = fmt::format("{} {}", i == selected_ ? '>' : ' ', getItemLabel(i));
        buffer.putCenteredText(inner, top + i, label,
                               i == selected_ ? kKestrelAttr_Reverse : kKestrelAttr_None);
    }
    buffer.putCenteredText(inner, inner.bottom() - 1, KES_L10N_LABEL(kMenuHint),
                           kKestrelAttr_Dim);
}

std::error_code KestrelMenuView::handleEvent(const KestrelInputEvent &event,
                                             KestrelApplication &application) {
    if (event.type != KestrelInputType::Key)
        return {};

    switch (event.key) {
    case KestrelKey::Up:
        selected_ = (selected_ + kMenuItemCount - 1) % kMenuItemCount;
        break;
    case KestrelKey::Down:
    case KestrelKey::Tab:
        selected_ = (selected_ + 1) % kMenuItemCount;
        break;
    case KestrelKey::Enter:
        activate(application);
        break;
    case KestrelKey::Escape:
        application.requestViewChange(std::make_unique<KestrelWelcomeView>(configPath_));
        break;
    default:
        break;
    }
    return {};
}

void KestrelMenuView::activate(KestrelApplication &application) {
    switch (getSelectedItem()) {
    case Item::About:
        application.requestViewChange(std::make_unique<KestrelAboutView>(configPath_));
        break;
    case Item::Back:
        application.requestViewChange(std::make_unique<KestrelWelcomeView>(configPath_));
        break;
    case Item::Quit:
        application.requestStop();
        break;
    }
}
