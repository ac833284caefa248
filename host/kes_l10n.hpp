#ifndef KES_HOST_L10N_HPP
#define KES_HOST_L10N_HPP

#define KES_L10N_LABEL(_name_) KestrelL10N::_name_[KestrelL10N::kLanguageDefault]

namespace KestrelL10N {

extern const char *kWelcomeTitle[];
extern const char *kWelcomeHint[];
extern const char *kMenuTitle[];
extern const char *kMenuHint[];
extern const char *kMenuItemAbout[];
extern const char *kMenuItemBack[];
extern const char *kMenuItemQuit[];
extern const char *kAboutTitle[];
extern const char *kAboutRegion[];
extern const char *kAboutResizes[];
extern const char *kAboutConfig[];
extern const char *kAboutHint[];

constexpr unsigned kLanguageDefault = 0;

} // namespace KestrelL10N

#endif
