// facet_validation_bind.hpp - Facet - Do-Notation over Validated State
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Builds a record field by field inside validated<S>:
//
//     auto r = pipe(validation::do_(state{}),
//                   validation::bind(set_x, [](state const &) { return validate_x(); }),
//                   validation::let(set_y, [](state const & s) { return s.x * 2; }),
//                   validation::ap_s(set_z, validate_z()));
//
// Setters are curried: setter(field)(state) returns the updated state.
// bind, let and let_to stop at the first failure; only ap_s and ap_sl
// accumulate the errors of independent fields.

#ifndef FACET_VALIDATION_BIND_HPP
#define FACET_VALIDATION_BIND_HPP

#include "facet_lens.hpp"
#include "facet_validation.hpp"

namespace facet::validation
{
    //========================================================================
    // DO-NOTATION
    //========================================================================

    template <typename S>
    validated<S> do_(S initial)
    {
        return validation::of(std::move(initial));
    }

    // f(state) gives the validated field value, which setter folds in
    template <typename Setter, typename F>
    auto bind(Setter setter, F f)
    {
        return [setter = std::move(setter), f = std::move(f)](auto const & fa)
        {
            using S = validated_value_t<decltype(fa)>;
            return validation::monad_chain(fa, [&setter, &f](S const & s) -> validated<S>
            {
                return validation::monad_map(std::invoke(f, s), [&setter, &s](auto const & field) -> S
                {
                    return detail::apply_setter(setter, field, s);
                });
            });
        };
    }

    // f(state) computes the field value directly
    template <typename Setter, typename F>
    auto let(Setter setter, F f)
    {
        return [setter = std::move(setter), f = std::move(f)](auto const & fa)
        {
            using S = validated_value_t<decltype(fa)>;
            return validation::monad_map(fa, [&setter, &f](S const & s) -> S
            {
                return detail::apply_setter(setter, std::invoke(f, s), s);
            });
        };
    }

    template <typename Setter, typename B>
    auto let_to(Setter setter, B value)
    {
        return validation::let(std::move(setter), constant(std::move(value)));
    }

    // Starts a pipeline from a single validated value: ctor(a) is the state
    template <typename Ctor>
    auto bind_to(Ctor ctor)
    {
        return validation::map(std::move(ctor));
    }

    // Applicative counterpart of bind: the field is validated independently
    // of the state, and state errors precede field errors.
    template <typename Setter, typename T>
    auto ap_s(Setter setter, validated<T> field)
    {
        return [setter = std::move(setter), field = std::move(field)](auto const & fa)
        {
            using S = validated_value_t<decltype(fa)>;
            auto partial = validation::monad_map(fa, [&setter](S const & s)
            {
                return [setter, s](T const & t) -> S { return detail::apply_setter(setter, t, s); };
            });
            return validation::monad_ap(partial, field);
        };
    }

    //------------------------------------------------------------------------
    // Lens variants
    //------------------------------------------------------------------------

    template <typename S, typename T>
    auto ap_sl(optics::lens<S, T> const & l, validated<T> field)
    {
        return validation::ap_s(l.set, std::move(field));
    }

    // f receives the focused value and returns its validated replacement
    template <typename S, typename T, typename F>
    auto bind_l(optics::lens<S, T> const & l, F f)
    {
        return validation::bind(l.set, [get = l.get, f = std::move(f)](S const & s)
        {
            return std::invoke(f, get(s));
        });
    }

    template <typename S, typename T>
    auto let_l(optics::lens<S, T> const & l, std::type_identity_t<endomorphism<T>> f)
    {
        return validation::let(l.set, [get = l.get, f = std::move(f)](S const & s)
        {
            return f(get(s));
        });
    }

    template <typename S, typename T>
    auto let_to_l(optics::lens<S, T> const & l, std::type_identity_t<T> value)
    {
        return validation::let_to(l.set, std::move(value));
    }

} // namespace facet::validation

#endif
