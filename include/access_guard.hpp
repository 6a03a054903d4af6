#pragma once

#include <string>

namespace fd {

using Principal = std::string;

// Authority-only gate for commit, reveal and reset.
class AccessGuard {
public:
    explicit AccessGuard(Principal authority);

    bool isAuthority(const Principal& caller) const { return caller == authority_; }

    // Throws DrawError(UNAUTHORIZED) naming the rejected operation.
    void authorize(const Principal& caller, const char* operation) const;

    const Principal& authority() const { return authority_; }

private:
    Principal authority_;
};

} // namespace fd
