#pragma once

#include "detail.hpp"
#include "factory.hpp"
#include "handle.hpp"
#include <lease/effect/concepts.hpp>
#include <lease/effect/outcome.hpp>
#include <lease/log/macros.hpp>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace lease {

/// Value of a racing composition
template<typename E, typename T>
struct chosen {
    /// Position of the winning branch; the head is 0, tail[i] is i + 1
    std::size_t index = 0;
    T value;
    /// The other branches, in input order, over their still-pending
    /// acquisitions. Their handles belong to whoever acquires them.
    std::vector<factory<E, T>> residuals;
};

namespace detail {

template<typename E, typename T>
using pending_branch = std::function<computation<E, effect::outcome<handle<E, T>>>()>;

/// Wait for each pending branch in turn and release whatever it acquired.
/// Yields the first release failure, if any.
template<typename E, typename T>
computation<E, effect::outcome<unit>> release_pending(std::vector<pending_branch<E, T>> pending) {
    using settled = effect::outcome<handle<E, T>>;
    using released = effect::outcome<unit>;

    computation<E, released> acc = E::pure(released::success(unit{}));
    for (auto& branch : pending) {
        acc = E::flat_map(std::move(acc), [branch](released so_far) -> computation<E, released> {
            auto taken = attempt<E, settled>(invoke_retained<E, settled>(branch));
            return E::flat_map(std::move(taken), [so_far](effect::outcome<settled> result) -> computation<E, released> {
                if (!result || !result.get()) {
                    return E::pure(so_far);
                }
                auto attempt_release = attempt<E, unit>(run_release<E>(result.get().get().release));
                return E::flat_map(std::move(attempt_release), [so_far](released r) -> computation<E, released> {
                    if (!so_far) {
                        return E::pure(so_far);
                    }
                    return E::pure(std::move(r));
                });
            });
        });
    }
    return acc;
}

} // namespace detail

/// Race the acquisitions of `head` and every factory of `tail` through
/// E::choose_any.
///
/// The result holds the winner's value and the losing branches as residual
/// factories. Its release releases the winner only; a residual is released
/// by the composition that acquires it. Losing branches are not cancelled.
///
/// A race whose first settled branch failed waits for the other branches,
/// releases what they acquired and then fails with that branch's error (or
/// with a release failure, which wins). Racing needs the error channel for
/// this, so E must be an error effect too.
template<effect::racing_effect E, typename T>
    requires effect::error_effect<E>
factory<E, chosen<E, T>> choose_any(const factory<E, T>& head, std::vector<factory<E, T>> tail) {
    using branch_handle = handle<E, T>;
    using result_handle = handle<E, chosen<E, T>>;
    using acquisition = typename factory<E, chosen<E, T>>::acquisition_type;

    return factory<E, chosen<E, T>>([head, tail = std::move(tail)]() -> acquisition {
        using settled = effect::outcome<branch_handle>;

        std::vector<detail::computation<E, settled>> branches;
        branches.reserve(tail.size() + 1);
        branches.push_back(detail::attempt<E, branch_handle>(head.acquire()));
        for (const auto& branch : tail) {
            branches.push_back(detail::attempt<E, branch_handle>(branch.acquire()));
        }

        return E::flat_map(E::choose_any(std::move(branches)),
            [](effect::race_outcome<E, settled> race) -> acquisition {
                if (!race.winner) {
                    LEASE_LOG_DEBUG("branch {} settled first with a failure, releasing {} other(s)",
                                    race.index, race.residuals.size());
                    auto error = race.winner.error();
                    return E::flat_map(detail::release_pending<E, T>(std::move(race.residuals)),
                        [error](effect::outcome<unit> released) -> acquisition {
                            if (!released) {
                                LEASE_LOG_WARNING("race failure dropped for a release failure: {}",
                                                  log::describe(error));
                                return E::template raise<result_handle>(released.error());
                            }
                            return E::template raise<result_handle>(error);
                        });
                }

                LEASE_LOG_DEBUG("branch {} won the race, {} residual(s)", race.index, race.residuals.size());
                std::vector<factory<E, T>> residuals;
                residuals.reserve(race.residuals.size());
                for (auto& pending : race.residuals) {
                    residuals.emplace_back([pending = std::move(pending)] {
                        return E::flat_map(pending(), [](settled branch) {
                            return detail::settle<E, branch_handle>(std::move(branch));
                        });
                    });
                }
                branch_handle winner = std::move(race.winner).get();
                return E::pure(result_handle{
                    chosen<E, T>{race.index, std::move(winner.value), std::move(residuals)},
                    std::move(winner.release)});
            });
    });
}

} // namespace lease
