// facet_optional.hpp - Facet - Optionals
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// An optional focuses a value A that may be absent from a structure S.
// Setting through an absent focus is a no-op:
//   get_option(s) == nullopt  =>  set(a)(s) == s
// Every constructor below enforces this by re-checking get_option in the
// setter, so user-supplied setters are never called on an absent focus.

#ifndef FACET_OPTIONAL_HPP
#define FACET_OPTIONAL_HPP

#include "facet_core.hpp"
#include "facet_lens.hpp"
#include "facet_prism.hpp"

#include <fmt/format.h>

#include <memory>
#include <optional>
#include <string>

namespace facet::optics
{
    //========================================================================
    // OPTIONAL
    //========================================================================

    template <typename S, typename A>
    struct optional
    {
        std::function<std::optional<A>(S const &)> get_option;
        std::function<endomorphism<S>(A const &)>  set;   // set(a)(s)
        std::string                                name = "Optional";
    };

    namespace optionals
    {
        //--------------------------------------------------------------------
        // Construction
        //--------------------------------------------------------------------

        template <typename S, typename GetOption, typename Set>
        auto make_optional_curried(GetOption get_option, Set set, std::string name = "Optional")
            -> optional<S, detail::option_result_t<GetOption, S>>
        {
            using A = detail::option_result_t<GetOption, S>;
            std::function<std::optional<A>(S const &)> get(std::move(get_option));
            std::function<endomorphism<S>(A const &)>  put(std::move(set));

            return optional<S, A>{
                get,
                [get, put](A const & a) -> endomorphism<S>
                {
                    return [get, put, a](S const & s) -> S
                    {
                        if (!get(s))
                            return s;
                        return put(a)(s);
                    };
                },
                std::move(name)
            };
        }

        // set is called as set(s, a) and only when the focus is present
        template <typename S, typename GetOption, typename Set>
        auto make_optional(GetOption get_option, Set set, std::string name = "Optional")
            -> optional<S, detail::option_result_t<GetOption, S>>
        {
            using A = detail::option_result_t<GetOption, S>;
            return make_optional_curried<S>(
                std::move(get_option),
                [set = std::move(set)](A const & a) -> endomorphism<S>
                {
                    return [set, a](S const & s) -> S { return std::invoke(set, s, a); };
                },
                std::move(name));
        }

        // Optional over a shared structure. get_option reads the pointee;
        // set is a mutator void(T &, A const &) applied to a fresh copy. A
        // null pointer is an absent focus.
        template <typename T, typename GetOption, typename Set>
        auto make_optional_ref(GetOption get_option, Set set, std::string name = "OptionalRef")
            -> optional<ref<T>, detail::option_result_t<GetOption, T>>
        {
            using A = detail::option_result_t<GetOption, T>;
            return make_optional_curried<ref<T>>(
                [get_option = std::move(get_option)](ref<T> const & s) -> std::optional<A>
                {
                    if (!s)
                        return std::nullopt;
                    return std::invoke(get_option, *s);
                },
                [set = std::move(set)](A const & a) -> endomorphism<ref<T>>
                {
                    return [set, a](ref<T> const & s) -> ref<T>
                    {
                        if (!s)
                            return s;
                        auto copy = std::make_shared<T>(*s);
                        std::invoke(set, *copy, a);
                        return copy;
                    };
                },
                std::move(name));
        }

        template <typename S>
        optional<S, S> id()
        {
            return make_optional<S>(
                [](S const & s) { return std::optional<S>(s); },
                [](S const &, S const & a) { return a; },
                "Identity");
        }

        // from_predicate<S, A>(pred)(get, set): the field read by get is
        // present when it satisfies pred
        template <typename S, typename A, typename Pred>
        auto from_predicate(Pred pred)
        {
            return [pred = std::move(pred)](auto get, auto set) -> optional<S, A>
            {
                return make_optional<S>(
                    [pred, get](S const & s) -> std::optional<A>
                    {
                        A a = std::invoke(get, s);
                        if (!std::invoke(pred, a))
                            return std::nullopt;
                        return a;
                    },
                    std::move(set),
                    "FromPredicate");
            };
        }

        // from_predicate_ref<T, A>(pred)(get, set) with get reading the
        // pointee and set a mutator on a copy of it
        template <typename T, typename A, typename Pred>
        auto from_predicate_ref(Pred pred)
        {
            return [pred = std::move(pred)](auto get, auto set) -> optional<ref<T>, A>
            {
                return make_optional_ref<T>(
                    [pred, get](T const & t) -> std::optional<A>
                    {
                        A a = std::invoke(get, t);
                        if (!std::invoke(pred, a))
                            return std::nullopt;
                        return a;
                    },
                    std::move(set),
                    "FromPredicateRef");
            };
        }

    } // namespace optionals

    //========================================================================
    // ADAPTERS
    //========================================================================

    // A lens is an optional whose focus is always present
    template <typename S, typename A>
    optional<S, A> lens_as_optional(lens<S, A> const & l)
    {
        return optional<S, A>{
            [get = l.get](S const & s) { return std::optional<A>(get(s)); },
            l.set,
            l.name
        };
    }

    // Setting writes reverse_get(a) only when the prism currently matches
    template <typename S, typename A>
    optional<S, A> prism_as_optional(prism<S, A> const & p)
    {
        return optionals::make_optional_curried<S>(
            p.get_option,
            [reverse_get = p.reverse_get](A const & a) -> endomorphism<S>
            {
                return [reverse_get, a](S const &) { return reverse_get(a); };
            },
            p.name);
    }

    template <typename S, typename A>
    optional<S, A> as_optional(lens<S, A> const & l)
    {
        return lens_as_optional(l);
    }

    template <typename S, typename A>
    optional<S, A> as_optional(prism<S, A> const & p)
    {
        return prism_as_optional(p);
    }

    namespace lenses
    {
        // pipe(sa, compose_prism(ab)): the case B of the field A
        template <typename A, typename B>
        auto compose_prism(prism<A, B> ab)
        {
            return [ab = std::move(ab)]<typename S>(lens<S, A> const & sa) -> optional<S, B>
            {
                return optionals::make_optional_curried<S>(
                    [sa, ab](S const & s) { return ab.get_option(sa.get(s)); },
                    [sa, ab](B const & b) -> endomorphism<S> { return sa.set(ab.reverse_get(b)); },
                    fmt::format("Compose[{} -> {}]", sa.name, ab.name));
            };
        }
    }

    namespace optionals
    {
        //--------------------------------------------------------------------
        // Composition
        //--------------------------------------------------------------------

        // pipe(sa, compose(ab)); absent at the first missing stage
        template <typename A, typename B>
        auto compose(optional<A, B> ab)
        {
            return [ab = std::move(ab)]<typename S>(optional<S, A> const & sa) -> optional<S, B>
            {
                return make_optional_curried<S>(
                    [sa, ab](S const & s) -> std::optional<B>
                    {
                        auto a = sa.get_option(s);
                        if (!a)
                            return std::nullopt;
                        return ab.get_option(*a);
                    },
                    [sa, ab](B const & b) -> endomorphism<S>
                    {
                        return [sa, ab, b](S const & s) -> S
                        {
                            auto a = sa.get_option(s);
                            if (!a)
                                return s;
                            return sa.set(ab.set(b)(*a))(s);
                        };
                    },
                    fmt::format("OptionalCompose[{} -> {}]", sa.name, ab.name));
            };
        }

        template <typename A, typename B>
        auto compose(lens<A, B> const & ab)
        {
            return compose(lens_as_optional(ab));
        }

        template <typename A, typename B>
        auto compose(prism<A, B> const & ab)
        {
            return compose(prism_as_optional(ab));
        }

        // As compose, for an outer optional over a shared structure. The
        // update is written into a copy of the pointee.
        template <typename A, typename B>
        auto compose_ref(optional<A, B> ab)
        {
            return [ab = std::move(ab)]<typename T>(optional<ref<T>, A> const & sa) -> optional<ref<T>, B>
            {
                return make_optional_curried<ref<T>>(
                    [sa, ab](ref<T> const & s) -> std::optional<B>
                    {
                        if (!s)
                            return std::nullopt;
                        auto a = sa.get_option(s);
                        if (!a)
                            return std::nullopt;
                        return ab.get_option(*a);
                    },
                    [sa, ab](B const & b) -> endomorphism<ref<T>>
                    {
                        return [sa, ab, b](ref<T> const & s) -> ref<T>
                        {
                            auto a = sa.get_option(s);
                            if (!a)
                                return s;
                            return sa.set(ab.set(b)(*a))(std::make_shared<T>(*s));
                        };
                    },
                    fmt::format("OptionalComposeRef[{} -> {}]", sa.name, ab.name));
            };
        }

        //--------------------------------------------------------------------
        // Transformation
        //--------------------------------------------------------------------

        // Views the focus through an isomorphism ab / ba
        template <typename AB, typename BA>
        auto imap(AB ab, BA ba)
        {
            return [ab = std::move(ab), ba = std::move(ba)]<typename S, typename A>(optional<S, A> const & sa)
            {
                using B = detail::result_t<AB, A>;
                return make_optional_curried<S>(
                    [sa, ab](S const & s) -> std::optional<B>
                    {
                        auto a = sa.get_option(s);
                        if (!a)
                            return std::nullopt;
                        return std::invoke(ab, *a);
                    },
                    [sa, ba](B const & b) -> endomorphism<S> { return sa.set(std::invoke(ba, b)); },
                    fmt::format("IMap[{}]", sa.name));
            };
        }

        // As imap, for conversions that can fail in either direction. A value
        // that ba cannot convert back leaves the structure unchanged.
        template <typename AB, typename BA>
        auto ichain(AB ab, BA ba)
        {
            return [ab = std::move(ab), ba = std::move(ba)]<typename S, typename A>(optional<S, A> const & sa)
            {
                using B = detail::option_result_t<AB, A>;
                return make_optional_curried<S>(
                    [sa, ab](S const & s) -> std::optional<B>
                    {
                        auto a = sa.get_option(s);
                        if (!a)
                            return std::nullopt;
                        return std::invoke(ab, *a);
                    },
                    [sa, ba](B const & b) -> endomorphism<S>
                    {
                        auto a = std::invoke(ba, b);
                        if (!a)
                            return [](S const & s) { return s; };
                        return sa.set(*a);
                    },
                    fmt::format("IChain[{}]", sa.name));
            };
        }

        // pipe(o, modify(f)): s -> set(f(a))(s) when a is present, else s
        template <typename F>
        auto modify(F f)
        {
            return [f = std::move(f)]<typename S, typename A>(optional<S, A> const & o) -> endomorphism<S>
            {
                return [o, f](S const & s) -> S
                {
                    auto a = o.get_option(s);
                    if (!a)
                        return s;
                    return o.set(std::invoke(f, *a))(s);
                };
            };
        }

        // As modify, reporting an absent focus as nullopt
        template <typename F>
        auto modify_option(F f)
        {
            return [f = std::move(f)]<typename S, typename A>(optional<S, A> const & o)
                -> std::function<std::optional<S>(S const &)>
            {
                return [o, f](S const & s) -> std::optional<S>
                {
                    auto a = o.get_option(s);
                    if (!a)
                        return std::nullopt;
                    return o.set(std::invoke(f, *a))(s);
                };
            };
        }

        template <typename A>
        auto set_option(A a)
        {
            return modify_option([a = std::move(a)](A const &) { return a; });
        }

    } // namespace optionals

} // namespace facet::optics

#endif
