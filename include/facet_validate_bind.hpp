// facet_validate_bind.hpp - Facet - Do-Notation over Validators
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// The validator counterpart of facet_validation_bind.hpp. Every step runs
// against the same input and context as the pipeline it extends; field
// validators given to bind may depend on the fields built so far.

#ifndef FACET_VALIDATE_BIND_HPP
#define FACET_VALIDATE_BIND_HPP

#include "facet_lens.hpp"
#include "facet_validate.hpp"

namespace facet::validate
{
    //========================================================================
    // DO-NOTATION
    //========================================================================

    template <typename I, typename S>
    validator<I, S> do_(S initial)
    {
        return validate::of<I>(std::move(initial));
    }

    // f(state) gives the validator<I, T> of the next field
    template <typename Setter, typename F>
    auto bind(Setter setter, F f)
    {
        return [setter = std::move(setter), f = std::move(f)](auto const & fa)
        {
            using I = validator_input_t<decltype(fa)>;
            using S = validator_value_t<decltype(fa)>;
            return validate::monad_chain(fa, [setter, f](S const & s) -> validator<I, S>
            {
                return validate::monad_map(std::invoke(f, s), [setter, s](auto const & field) -> S
                {
                    return facet::detail::apply_setter(setter, field, s);
                });
            });
        };
    }

    template <typename Setter, typename F>
    auto let(Setter setter, F f)
    {
        return [setter = std::move(setter), f = std::move(f)](auto const & fa)
        {
            using S = validator_value_t<decltype(fa)>;
            return validate::monad_map(fa, [setter, f](S const & s) -> S
            {
                return facet::detail::apply_setter(setter, std::invoke(f, s), s);
            });
        };
    }

    template <typename Setter, typename B>
    auto let_to(Setter setter, B value)
    {
        return validate::let(std::move(setter), constant(std::move(value)));
    }

    template <typename Ctor>
    auto bind_to(Ctor ctor)
    {
        return validate::map(std::move(ctor));
    }

    // Field validated independently of the state; both run, and state
    // errors precede field errors
    template <typename Setter, typename I, typename T>
    auto ap_s(Setter setter, validator<I, T> field)
    {
        return [setter = std::move(setter), field = std::move(field)](auto const & fa)
        {
            using S = validator_value_t<decltype(fa)>;
            auto partial = validate::monad_map(fa, [setter](S const & s)
            {
                return [setter, s](T const & t) -> S { return facet::detail::apply_setter(setter, t, s); };
            });
            return validate::monad_ap(partial, field);
        };
    }

    //------------------------------------------------------------------------
    // Lens variants
    //------------------------------------------------------------------------

    template <typename S, typename T, typename I>
    auto ap_sl(optics::lens<S, T> const & l, validator<I, T> field)
    {
        return validate::ap_s(l.set, std::move(field));
    }

    // f receives the focused value and returns the validator of its replacement
    template <typename S, typename T, typename F>
    auto bind_l(optics::lens<S, T> const & l, F f)
    {
        return validate::bind(l.set, [get = l.get, f = std::move(f)](S const & s)
        {
            return std::invoke(f, get(s));
        });
    }

    template <typename S, typename T>
    auto let_l(optics::lens<S, T> const & l, std::type_identity_t<endomorphism<T>> f)
    {
        return validate::let(l.set, [get = l.get, f = std::move(f)](S const & s)
        {
            return f(get(s));
        });
    }

    template <typename S, typename T>
    auto let_to_l(optics::lens<S, T> const & l, std::type_identity_t<T> value)
    {
        return validate::let_to(l.set, std::move(value));
    }

} // namespace facet::validate

#endif
