#pragma once

// Railway combinators
//
// Each combinator comes in two forms:
//   op(f, outcome)  - apply to an outcome now, returning the next outcome
//   op(f)           - build a Step for use with operator|
//
// A failed outcome travels past bind, map, tee and inspect without calling
// their functions. Only observe sees both tracks, and it cannot switch them.
//
// Usage:
//   auto result = parse(text)
//       | railyard::bind(resolve)      // resolve: T -> Outcome<U, E>
//       | railyard::tee(store)         // store: const U& -> Outcome<void, E>
//       | railyard::map(render);       // render: U -> V

#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include "detail/step.hpp"
#include "outcome.hpp"

namespace railyard {

// ============================================================================
// Applied forms
// ============================================================================

/**
 * @brief Chain a step that can itself fail
 *
 * On success returns f(value) as-is; on failure returns the failure without
 * calling f.
 *
 * @param f Callable value -> Outcome<U, E> (no argument when the value is void)
 * @param outcome Incoming outcome with failure type E
 * @return Outcome<U, E>
 */
template <typename F, OutcomeLike O>
constexpr auto bind(F&& f, O&& outcome) {
    using Result = detail::value_result_t<F, O>;
    static_assert(SameErrorTrack<Result, O>,
                  "bind() needs a step returning an Outcome with the same error type");

    if (!outcome.has_value()) {
        return Result(unexpect, std::forward<O>(outcome).error());
    }
    return Result(detail::invoke_with_value(std::forward<F>(f), std::forward<O>(outcome)));
}

/**
 * @brief Apply a transform that cannot fail
 *
 * On success returns Outcome<U, E>{f(value)}; on failure passes the failure
 * through. A void transform yields Outcome<void, E>.
 */
template <typename F, OutcomeLike O>
constexpr auto map(F&& f, O&& outcome) {
    using U = detail::value_result_t<F, O>;
    using Result = Outcome<U, outcome_error_t<O>>;

    if (!outcome.has_value()) {
        return Result(unexpect, std::forward<O>(outcome).error());
    }
    if constexpr (std::is_void_v<U>) {
        detail::invoke_with_value(std::forward<F>(f), std::forward<O>(outcome));
        return Result();
    } else {
        return Result(detail::invoke_with_value(std::forward<F>(f), std::forward<O>(outcome)));
    }
}

/**
 * @brief Run a side effect that can fail without touching the value
 *
 * On success calls f(value) with a const view of the value. If f succeeds,
 * whatever its own payload, the original outcome is returned unchanged; if f
 * fails, its failure replaces the outcome. A failed outcome passes through
 * without calling f.
 *
 * @param f Callable const value& -> Outcome<X, E>, X is discarded
 * @param outcome Incoming outcome
 * @return Outcome of the same type as the incoming one
 */
template <typename F, OutcomeLike O>
constexpr auto tee(F&& f, O&& outcome) {
    using Result = std::remove_cvref_t<O>;

    if (!outcome.has_value()) {
        return Result(std::forward<O>(outcome));
    }

    auto effect = detail::invoke_with_value(std::forward<F>(f), std::as_const(outcome));
    static_assert(SameErrorTrack<decltype(effect), Result>,
                  "tee() needs a side effect returning an Outcome with the same error type");

    if (!effect.has_value()) {
        return Result(unexpect, std::move(effect).error());
    }
    return Result(std::forward<O>(outcome));
}

/**
 * @brief Look at both tracks without changing either
 *
 * Always calls f(const outcome&), success or failure, and returns the
 * outcome unchanged. f's return value is ignored.
 */
template <typename F, OutcomeLike O>
constexpr auto observe(F&& f, O&& outcome) {
    std::invoke(std::forward<F>(f), std::as_const(outcome));
    return std::remove_cvref_t<O>(std::forward<O>(outcome));
}

/**
 * @brief Hand the success value to a consumer that cannot fail
 *
 * Failures pass through without calling f.
 */
template <typename F, OutcomeLike O>
constexpr auto inspect(F&& f, O&& outcome) {
    if (outcome.has_value()) {
        static_cast<void>(detail::invoke_with_value(std::forward<F>(f), std::as_const(outcome)));
    }
    return std::remove_cvref_t<O>(std::forward<O>(outcome));
}

/**
 * @brief Transform the failure value, leaving a success untouched
 *
 * @param f Callable E -> G
 * @return Outcome<T, G>
 */
template <typename F, OutcomeLike O>
constexpr auto map_error(F&& f, O&& outcome) {
    using T = outcome_value_t<O>;
    using G = std::remove_cvref_t<std::invoke_result_t<F, decltype(std::declval<O>().error())>>;
    using Result = Outcome<T, G>;

    if (!outcome.has_value()) {
        return Result(unexpect, std::invoke(std::forward<F>(f), std::forward<O>(outcome).error()));
    }
    if constexpr (std::is_void_v<T>) {
        return Result();
    } else {
        return Result(*std::forward<O>(outcome));
    }
}

// ============================================================================
// Fault boundary
// ============================================================================

/**
 * @brief Wrap a step so exceptions come back as failures
 *
 * The returned callable takes the same arguments as f and never throws. An
 * exception derived from std::exception is converted with
 * fault_traits<E>::from_exception(); any other thrown value becomes
 * fault_traits<E>::from_unknown(). Either way it is returned as the failure
 * branch of f's own Outcome type.
 *
 * @param f Callable returning Outcome<T, E>
 */
template <typename F>
auto guard(F&& f) {
    return [fn = std::forward<F>(f)](auto&&... args) {
        using Result = std::remove_cvref_t<
            std::invoke_result_t<const std::decay_t<F>&, decltype(args)...>>;
        static_assert(OutcomeLike<Result>, "guard() wraps steps returning an Outcome");

        try {
            return Result(std::invoke(fn, std::forward<decltype(args)>(args)...));
        } catch (const std::exception& ex) {
            return Result(unexpect, fault_traits<outcome_error_t<Result>>::from_exception(ex));
        } catch (...) {
            return Result(unexpect, fault_traits<outcome_error_t<Result>>::from_unknown());
        }
    };
}

/**
 * @brief bind() behind a fault boundary
 *
 * For legacy steps that report failure by throwing. An exception from f
 * becomes Failure(fault_traits<E>::from_exception(ex)), and a thrown value
 * of any other type becomes Failure(fault_traits<E>::from_unknown()).
 */
template <typename F, OutcomeLike O>
auto try_with(F&& f, O&& outcome) {
    return railyard::bind(railyard::guard(std::forward<F>(f)), std::forward<O>(outcome));
}

/**
 * @brief map() behind a fault boundary
 *
 * Same conversion rules as try_with().
 */
template <typename F, OutcomeLike O>
auto try_map(F&& f, O&& outcome) {
    using Result = decltype(railyard::map(std::forward<F>(f), std::forward<O>(outcome)));

    try {
        return railyard::map(std::forward<F>(f), std::forward<O>(outcome));
    } catch (const std::exception& ex) {
        return Result(unexpect, fault_traits<outcome_error_t<O>>::from_exception(ex));
    } catch (...) {
        return Result(unexpect, fault_traits<outcome_error_t<O>>::from_unknown());
    }
}

// ============================================================================
// Step forms
// ============================================================================

template <typename F>
constexpr auto bind(F&& f) {
    return detail::make_step([fn = std::forward<F>(f)](auto&& outcome) {
        return railyard::bind(fn, std::forward<decltype(outcome)>(outcome));
    });
}

template <typename F>
constexpr auto map(F&& f) {
    return detail::make_step([fn = std::forward<F>(f)](auto&& outcome) {
        return railyard::map(fn, std::forward<decltype(outcome)>(outcome));
    });
}

template <typename F>
constexpr auto tee(F&& f) {
    return detail::make_step([fn = std::forward<F>(f)](auto&& outcome) {
        return railyard::tee(fn, std::forward<decltype(outcome)>(outcome));
    });
}

template <typename F>
constexpr auto observe(F&& f) {
    return detail::make_step([fn = std::forward<F>(f)](auto&& outcome) {
        return railyard::observe(fn, std::forward<decltype(outcome)>(outcome));
    });
}

template <typename F>
constexpr auto inspect(F&& f) {
    return detail::make_step([fn = std::forward<F>(f)](auto&& outcome) {
        return railyard::inspect(fn, std::forward<decltype(outcome)>(outcome));
    });
}

template <typename F>
constexpr auto map_error(F&& f) {
    return detail::make_step([fn = std::forward<F>(f)](auto&& outcome) {
        return railyard::map_error(fn, std::forward<decltype(outcome)>(outcome));
    });
}

template <typename F>
auto try_with(F&& f) {
    return detail::make_step([fn = railyard::guard(std::forward<F>(f))](auto&& outcome) {
        return railyard::bind(fn, std::forward<decltype(outcome)>(outcome));
    });
}

template <typename F>
auto try_map(F&& f) {
    return detail::make_step([fn = std::forward<F>(f)](auto&& outcome) {
        return railyard::try_map(fn, std::forward<decltype(outcome)>(outcome));
    });
}

} // namespace railyard
