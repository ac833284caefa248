#include "kes_error.hpp"

#include "fmt/core.h"
#include "spdlog/spdlog.h"

#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

class KestrelErrorCategory : public std::error_category {
  public:
    const char *name() const noexcept override { return "kestrel"; }

    std::string message(int ev) const override {
        switch (static_cast<KestrelError>(ev)) {
        case KestrelError::SurfaceAcquireFailed:
            return "unable to acquire the terminal surface";
        case KestrelError::SurfaceDrawFailed:
            return "unable to draw to the terminal surface";
        case KestrelError::SurfaceNotAcquired:
            return "terminal surface has not been acquired";
        case KestrelError::InputReadFailed:
            return "unable to read the next input event";
        case KestrelError::ViewFailed:
            return "view failed to handle an event";
        }
        return fmt::format("unknown kestrel error {}", ev);
    }
};

} // namespace

const std::error_category &kestrelErrorCategory() {
    static KestrelErrorCategory category;
    return category;
}

std::error_code make_error_code(KestrelError error) {
    return std::error_code(static_cast<int>(error), kestrelErrorCategory());
}

void kestrelFatalMisuse(const char *what) {
    fmt::print(stderr, "kestrel: fatal misuse: {}\n", what);
    std::fflush(stderr);
    spdlog::critical("Fatal misuse - {}", what);
    spdlog::default_logger()->flush();
    std::abort();
}
