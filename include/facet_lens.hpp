// facet_lens.hpp - Facet - Lenses
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// A lens focuses a field A that is always present in a structure S.
// Laws, for every s and a:
//   GetSet  set(get(s))(s) == s
//   SetGet  get(set(a)(s)) == a
//   SetSet  set(a2)(set(a1)(s)) == set(a2)(s)

#ifndef FACET_LENS_HPP
#define FACET_LENS_HPP

#include "facet_core.hpp"

#include <fmt/format.h>

#include <memory>
#include <string>

namespace facet::optics
{
    //========================================================================
    // LENS
    //========================================================================

    template <typename S, typename A>
    struct lens
    {
        std::function<A(S const &)>               get;
        std::function<endomorphism<S>(A const &)> set;   // set(a)(s)
        std::string                               name = "Lens";
    };

    namespace lenses
    {
        //--------------------------------------------------------------------
        // Construction
        //--------------------------------------------------------------------

        // set is called as set(s, a) on a copy of s and returns the update
        template <typename S, typename Get, typename Set>
        auto make_lens(Get get, Set set, std::string name = "Lens")
            -> lens<S, detail::result_t<Get, S>>
        {
            using A = detail::result_t<Get, S>;
            return lens<S, A>{
                std::move(get),
                [set = std::move(set)](A const & a) -> endomorphism<S>
                {
                    return [set, a](S const & s) -> S { return std::invoke(set, s, a); };
                },
                std::move(name)
            };
        }

        template <typename S, typename Get, typename Set>
        auto make_lens_curried(Get get, Set set, std::string name = "Lens")
            -> lens<S, detail::result_t<Get, S>>
        {
            using A = detail::result_t<Get, S>;
            return lens<S, A>{ std::move(get), std::move(set), std::move(name) };
        }

        // Lens over a shared structure. set is a mutator void(T &, A const &)
        // that is only ever applied to a fresh copy of the pointee, so the
        // caller's object is never modified. A null pointer reads as a
        // default-constructed T and is replaced by a new object on set.
        template <typename T, typename Get, typename Set>
        auto make_lens_ref(Get get, Set set, std::string name = "LensRef")
            -> lens<ref<T>, detail::result_t<Get, T>>
        {
            using A = detail::result_t<Get, T>;
            return lens<ref<T>, A>{
                [get = std::move(get)](ref<T> const & s) -> A
                {
                    if (!s)
                        return std::invoke(get, T{});
                    return std::invoke(get, *s);
                },
                [set = std::move(set)](A const & a) -> endomorphism<ref<T>>
                {
                    return [set, a](ref<T> const & s) -> ref<T>
                    {
                        auto copy = s ? std::make_shared<T>(*s) : std::make_shared<T>();
                        std::invoke(set, *copy, a);
                        return copy;
                    };
                },
                std::move(name)
            };
        }

        template <typename S>
        lens<S, S> id()
        {
            return make_lens<S>(
                [](S const & s) { return s; },
                [](S const &, S const & a) { return a; },
                "Identity");
        }

        //--------------------------------------------------------------------
        // Composition
        //--------------------------------------------------------------------

        // pipe(sa, compose(ab)) focuses B inside S through A
        template <typename A, typename B>
        auto compose(lens<A, B> ab)
        {
            return [ab = std::move(ab)]<typename S>(lens<S, A> const & sa) -> lens<S, B>
            {
                return lens<S, B>{
                    [sa, ab](S const & s) { return ab.get(sa.get(s)); },
                    [sa, ab](B const & b) -> endomorphism<S>
                    {
                        return [sa, ab, b](S const & s) { return sa.set(ab.set(b)(sa.get(s)))(s); };
                    },
                    fmt::format("LensCompose[{} -> {}]", sa.name, ab.name)
                };
            };
        }

        // As compose, for an outer lens over a shared structure. The update is
        // written into a copy of the pointee.
        template <typename A, typename B>
        auto compose_ref(lens<A, B> ab)
        {
            return [ab = std::move(ab)]<typename T>(lens<ref<T>, A> const & sa) -> lens<ref<T>, B>
            {
                return lens<ref<T>, B>{
                    [sa, ab](ref<T> const & s) { return ab.get(sa.get(s)); },
                    [sa, ab](B const & b) -> endomorphism<ref<T>>
                    {
                        return [sa, ab, b](ref<T> const & s) -> ref<T>
                        {
                            A inner = ab.set(b)(sa.get(s));
                            auto copy = s ? std::make_shared<T>(*s) : std::make_shared<T>();
                            return sa.set(inner)(copy);
                        };
                    },
                    fmt::format("LensComposeRef[{} -> {}]", sa.name, ab.name)
                };
            };
        }

        //--------------------------------------------------------------------
        // Transformation
        //--------------------------------------------------------------------

        // pipe(l, modify(f)) is the endomorphism s -> set(f(get(s)))(s)
        template <typename F>
        auto modify(F f)
        {
            return [f = std::move(f)]<typename S, typename A>(lens<S, A> const & l) -> endomorphism<S>
            {
                return [l, f](S const & s) -> S { return l.set(std::invoke(f, l.get(s)))(s); };
            };
        }

        // Views the focus through an isomorphism ab / ba
        template <typename AB, typename BA>
        auto imap(AB ab, BA ba)
        {
            return [ab = std::move(ab), ba = std::move(ba)]<typename S, typename A>(lens<S, A> const & ea)
            {
                using B = detail::result_t<AB, A>;
                return lens<S, B>{
                    [ea, ab](S const & s) -> B { return std::invoke(ab, ea.get(s)); },
                    [ea, ba](B const & b) -> endomorphism<S> { return ea.set(std::invoke(ba, b)); },
                    fmt::format("IMap[{}]", ea.name)
                };
            };
        }

    } // namespace lenses

} // namespace facet::optics

#endif
