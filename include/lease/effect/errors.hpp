#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lease::effect {

/// Raised when a residual branch of a race is acquired a second time.
/// Residuals wrap a computation that is already running, so its result can
/// be handed out once only.
class residual_consumed : public std::logic_error {
public:
    explicit residual_consumed(std::size_t branch)
        : std::logic_error("residual of race branch " + std::to_string(branch) + " was already consumed")
        , branch_(branch) {}

    [[nodiscard]] std::size_t branch() const noexcept { return branch_; }

private:
    std::size_t branch_;
};

} // namespace lease::effect
