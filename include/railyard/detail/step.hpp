#pragma once

#include <functional>
#include <type_traits>
#include <utility>

#include "../outcome.hpp"

namespace railyard::detail {

/**
 * Call f with the outcome's success value, or with no arguments when the
 * value type is void. The caller has already checked has_value().
 *
 * Value category follows the outcome: an rvalue outcome hands its value
 * over as an rvalue, a const outcome as a const reference.
 */
template <typename F, OutcomeLike O>
constexpr decltype(auto) invoke_with_value(F&& f, O&& outcome) {
    if constexpr (std::is_void_v<outcome_value_t<O>>) {
        return std::invoke(std::forward<F>(f));
    } else {
        return std::invoke(std::forward<F>(f), *std::forward<O>(outcome));
    }
}

template <typename F, typename O>
using value_result_t =
    std::remove_cvref_t<decltype(invoke_with_value(std::declval<F>(), std::declval<O>()))>;

/**
 * A pipeline step: a callable from one Outcome to another
 *
 * Produced by the single-argument forms of the combinators. Steps are
 * applied to an outcome with `outcome | step` and chained into a larger
 * step with `step | step`.
 *
 * @tparam Fn Callable taking an Outcome and returning an Outcome
 */
template <typename Fn>
class Step {
public:
    explicit constexpr Step(Fn fn) : fn_(std::move(fn)) {}

    template <OutcomeLike O>
    constexpr auto operator()(O&& outcome) const {
        return std::invoke(fn_, std::forward<O>(outcome));
    }

    template <OutcomeLike O>
    friend constexpr auto operator|(O&& outcome, const Step& step) {
        return step(std::forward<O>(outcome));
    }

    // first, then second
    template <typename Next>
    friend constexpr auto operator|(Step first, Step<Next> second) {
        auto composed = [first = std::move(first), second = std::move(second)](auto&& outcome) {
            return second(first(std::forward<decltype(outcome)>(outcome)));
        };
        return Step<decltype(composed)>(std::move(composed));
    }

private:
    Fn fn_;
};

template <typename Fn>
constexpr auto make_step(Fn&& fn) {
    return Step<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

} // namespace railyard::detail
