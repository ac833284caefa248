#include "kes_l10n.hpp"

namespace KestrelL10N {

const char *kWelcomeTitle[] = {"Hello World!"};
const char *kWelcomeHint[] = {"Press Enter for the menu, q to quit."};
const char *kMenuTitle[] = {"Menu"};
const char *kMenuHint[] = {"Up/Down to select, Enter to choose, Esc to go back."};
const char *kMenuItemAbout[] = {"About"};
const char *kMenuItemBack[] = {"Back"};
const char *kMenuItemQuit[] = {"Quit"};
const char *kAboutTitle[] = {"About Kestrel"};
const char *kAboutRegion[] = {"Drawable region: {} x {}"};
const char *kAboutResizes[] = {"Resize events seen: {}"};
const char *kAboutConfig[] = {"Configuration: {}"};
const char *kAboutHint[] = {"Press any key to return to the menu."};

} // namespace KestrelL10N
