#include "kes_about_view.hpp"
#include "kes_application.hpp"
#include "kes_l10n.hpp"
#include "kes_menu_view.hpp"

#include "fmt/format.h"

#include <memory>
#include <utility>

KestrelAboutView::KestrelAboutView(std::string configPath)
    : configPath_(std::move(configPath)), resizeCount_(0) {}

void KestrelAboutView::render(const KestrelRect &region, KestrelFrameBuffer &buffer) const {
    buffer.drawBox(region);
    auto inner = region.inset(2, 1);
    int y = inner.y;
    buffer.putText(inner.x, y++, KES_L10N_LABEL(kAboutTitle), kKestrelAttr_Bold, inner);
    y++;
    buffer.putText(inner.x, y++,
                   fmt::format(fmt::runtime(KES_L10N_LABEL(kAboutRegion)), region.width,
                               region.height),
                   kKestrelAttr_None, inner);
    buffer.putText(inner.x, y++,
                   fmt::format(fmt::runtime(KES_L10N_LABEL(kAboutResizes)), resizeCount_),
                   kKestrelAttr_None, inner);
    buffer.putText(inner.x, y++,
                   fmt::format(fmt::runtime(KES_L10N_LABEL(kAboutConfig)), configPath_),
                   kKestrelAttr_None, inner);
    buffer.putText(inner.x, inner.bottom() - 1, KES_L10N_LABEL(kAboutHint), kKestrelAttr_Dim,
                   inner);
}

std::error_code KestrelAboutView::handleEvent(const KestrelInputEvent &event,
                                              KestrelApplication &application) {
    if (event.type == KestrelInputType::Resize) {
        ++resizeCount_;
    } else if (event.type == KestrelInputType::Key) {
        application.requestViewChange(std::make_unique<KestrelMenuView>(configPath_));
    }
    return {};
}
