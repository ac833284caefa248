#include "kes_welcome_view.hpp"
#include "kes_application.hpp"
#include "kes_l10n.hpp"
#include "kes_menu_view.hpp"

#include <memory>
#include <utility>

KestrelWelcomeView::KestrelWelcomeView(std::string configPath)
    : configPath_(std::move(configPath)) {}

void KestrelWelcomeView::render(const KestrelRect &region, KestrelFrameBuffer &buffer) const {
    buffer.drawBox(region);
    int middle = region.y + region.height / 2;
    buffer.putCenteredText(region, middle - 1, KES_L10N_LABEL(kWelcomeTitle), kKestrelAttr_Bold);
    buffer.putCenteredText(region.inset(1, 0), middle + 1, KES_L10N_LABEL(kWelcomeHint),
                           kKestrelAttr_Dim);
}

std::error_code KestrelWelcomeView::handleEvent(const KestrelInputEvent &event,
                                                KestrelApplication &application) {
    if (event.isCharacter('q') || event.isCharacter('Q')) {
        application.requestStop();
    } else if (event.isKey(KestrelKey::Enter)) {
        application.requestViewChange(std::make_unique<KestrelMenuView>(configPath_));
    }
    return {};
}
