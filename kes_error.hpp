#ifndef KES_ERROR_HPP
#define KES_ERROR_HPP

#include <system_error>
#include <type_traits>

//  Failures reported by the run loop and its collaborators.  Zero is reserved
//  for success so that a default constructed std::error_code means "no error".
enum class KestrelError {
    SurfaceAcquireFailed = 1,
    SurfaceDrawFailed,
    SurfaceNotAcquired,
    InputReadFailed,
    ViewFailed
};

const std::error_category &kestrelErrorCategory();

std::error_code make_error_code(KestrelError error);

namespace std {
template <> struct is_error_code_enum<KestrelError> : true_type {};
} // namespace std

//  Programmer misuse (calling into the application before initialize(), reentrant
//  run(), null views.)  These indicate an integration bug; the process reports the
//  reason and aborts.
[[noreturn]] void kestrelFatalMisuse(const char *what);

#endif
