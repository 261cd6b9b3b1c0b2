#pragma once

#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace lease::effect {

/// Settled result of a synchronous computation: a value or the exception
/// that prevented it.
template<typename T>
class outcome {
public:
    using value_type = T;

    /// Successful outcome
    static outcome success(T value) {
        return outcome(std::in_place_index<0>, std::move(value));
    }

    /// Failed outcome. A null exception_ptr is not a failure and is rejected.
    static outcome failure(std::exception_ptr error) {
        if (!error) {
            error = std::make_exception_ptr(std::invalid_argument("outcome::failure with null exception"));
        }
        return outcome(std::in_place_index<1>, std::move(error));
    }

    /// Run f, capturing any exception it throws
    template<typename F>
    static outcome capture(F&& f) {
        try {
            return success(std::forward<F>(f)());
        } catch (...) {
            return failure(std::current_exception());
        }
    }

    [[nodiscard]] bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    /// The stored exception, or null on success
    [[nodiscard]] std::exception_ptr error() const noexcept {
        if (auto* e = std::get_if<1>(&state_)) {
            return *e;
        }
        return nullptr;
    }

    /// The value. Rethrows the stored exception on failure.
    T& get() & {
        rethrow_if_failed();
        return std::get<0>(state_);
    }

    const T& get() const& {
        rethrow_if_failed();
        return std::get<0>(state_);
    }

    T get() && {
        rethrow_if_failed();
        return std::move(std::get<0>(state_));
    }

private:
    template<std::size_t I, typename U>
    outcome(std::in_place_index_t<I> tag, U&& v) : state_(tag, std::forward<U>(v)) {}

    void rethrow_if_failed() const {
        if (auto* e = std::get_if<1>(&state_)) {
            std::rethrow_exception(*e);
        }
    }

    std::variant<T, std::exception_ptr> state_;
};

} // namespace lease::effect
