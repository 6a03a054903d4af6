#include "access_guard.hpp"

#include "draw_error.hpp"

#include <stdexcept>
#include <utility>

namespace fd {

AccessGuard::AccessGuard(Principal authority)
    : authority_(std::move(authority)) {
    if (authority_.empty()) {
        throw std::invalid_argument("authority principal must not be empty");
    }
}

void AccessGuard::authorize(const Principal& caller, const char* operation) const {
    if (!isAuthority(caller)) {
        throw DrawError(DrawErrorCode::UNAUTHORIZED,
                        "'" + caller + "' may not " + operation + "; only the authority may");
    }
}

} // namespace fd
