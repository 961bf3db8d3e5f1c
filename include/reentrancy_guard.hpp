#pragma once

#include "errors.hpp"

#include <string>

namespace lf {

// One per component. Every externally callable mutating entry point opens a
// Scope; a nested call into the same component fails with Reentrancy.
class ReentrancyGuard {
public:
    class Scope {
    public:
        Scope(ReentrancyGuard& guard, const char* entryPoint) : guard_(guard) {
            if (guard_.entered_) {
                throw LottoError(ErrorCode::Reentrancy,
                                 std::string("reentrant call into ") + entryPoint);
            }
            guard_.entered_ = true;
        }
        ~Scope() { guard_.entered_ = false; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

    bool entered() const { return entered_; }

private:
    bool entered_ = false;
};

} // namespace lf
