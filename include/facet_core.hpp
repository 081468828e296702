// facet_core.hpp - Facet - Core Function Utilities
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FACET_CORE_HPP
#define FACET_CORE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace facet
{
//========================================================================
// Function shapes
//========================================================================

    // A deferred computation, evaluated on demand on the caller's stack.
    template <typename T>
    using lazy = std::function<T()>;

    // A function from a type to itself.
    template <typename T>
    using endomorphism = std::function<T(T const &)>;

    // A computation that reads an environment R to produce an A.
    template <typename R, typename A>
    using reader = std::function<A(R const &)>;

    // Shared, pointer-shaped structure used by the *_ref optics. The pointee
    // is treated as immutable: updates always go to a fresh copy.
    template <typename T>
    using ref = std::shared_ptr<T>;

//========================================================================
// Basic combinators
//========================================================================

    struct identity_fn
    {
        template <typename T>
        constexpr T && operator()(T && v) const noexcept
        {
            return std::forward<T>(v);
        }
    };

    inline constexpr identity_fn identity{};

    template <typename T>
    auto constant(T value)
    {
        return [value = std::move(value)](auto &&...) { return value; };
    }

//------------------------------------------------------------------------

    // pipe(v, f, g, h) == h(g(f(v)))
    template <typename T>
    std::decay_t<T> pipe(T && value)
    {
        return std::forward<T>(value);
    }

    template <typename T, typename F, typename... Fs>
    auto pipe(T && value, F && f, Fs &&... fs)
    {
        return pipe(std::invoke(std::forward<F>(f), std::forward<T>(value)), std::forward<Fs>(fs)...);
    }

    // flow(f, g, h)(v) == h(g(f(v)))
    template <typename... Fs>
    auto flow(Fs... fs)
    {
        return [fs...](auto && value) { return pipe(std::forward<decltype(value)>(value), fs...); };
    }

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        template <typename T>
        struct optional_value;

        template <typename A>
        struct optional_value<std::optional<A>>
        {
            using type = A;
        };

        // Value type of the std::optional returned by F(S)
        template <typename F, typename S>
        using option_result_t = typename optional_value<
            std::decay_t<std::invoke_result_t<F const &, S const &>>>::type;

        template <typename F, typename... Args>
        using result_t = std::decay_t<std::invoke_result_t<F const &, Args const &...>>;

        // setter(field)(state)
        template <typename Setter, typename B, typename S>
        auto apply_setter(Setter const & setter, B const & field, S const & state)
        {
            return std::invoke(std::invoke(setter, field), state);
        }
    }

} // namespace facet

#endif
