// facet_iso.hpp - Facet - Isomorphisms
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// An iso is a lossless, reversible conversion between S and A. get and
// reverse_get are total and undo each other. Laws, for every s and a:
//   reverse_get(get(s)) == s
//   get(reverse_get(a)) == a
// Every iso is also a lens and a prism; see the adapters at the bottom.

#ifndef FACET_ISO_HPP
#define FACET_ISO_HPP

#include "facet_core.hpp"
#include "facet_either.hpp"
#include "facet_lens.hpp"
#include "facet_optional.hpp"
#include "facet_prism.hpp"

#include <fmt/format.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace facet::optics
{
    //========================================================================
    // ISO
    //========================================================================

    template <typename S, typename A>
    struct iso
    {
        std::function<A(S const &)> get;
        std::function<S(A const &)> reverse_get;
        std::string                 name = "Iso";
    };

    namespace isos
    {
        template <typename S, typename Get, typename ReverseGet>
        auto make_iso(Get get, ReverseGet reverse_get, std::string name = "Iso")
            -> iso<S, detail::result_t<Get, S>>
        {
            using A = detail::result_t<Get, S>;
            return iso<S, A>{ std::move(get), std::move(reverse_get), std::move(name) };
        }

        template <typename S>
        iso<S, S> id()
        {
            return iso<S, S>{
                [](S const & s) { return s; },
                [](S const & s) { return s; },
                "Identity"
            };
        }

        //--------------------------------------------------------------------
        // Common isos
        //--------------------------------------------------------------------

        // Shifts a number by n; reverse_get shifts it back
        template <typename T>
        iso<T, T> add(T n)
        {
            return iso<T, T>{
                [n](T const & t) { return t + n; },
                [n](T const & t) { return t - n; },
                fmt::format("Add[{}]", n)
            };
        }

        template <typename T>
        iso<T, T> sub(T n)
        {
            return iso<T, T>{
                [n](T const & t) { return t - n; },
                [n](T const & t) { return t + n; },
                fmt::format("Sub[{}]", n)
            };
        }

        template <typename A, typename B>
        iso<std::pair<A, B>, std::pair<B, A>> swap_pair()
        {
            return iso<std::pair<A, B>, std::pair<B, A>>{
                [](std::pair<A, B> const & p) { return std::pair<B, A>(p.second, p.first); },
                [](std::pair<B, A> const & p) { return std::pair<A, B>(p.second, p.first); },
                "SwapPair"
            };
        }

        template <typename L, typename R>
        iso<either<L, R>, either<R, L>> swap_either()
        {
            return iso<either<L, R>, either<R, L>>{
                [](either<L, R> const & e)
                {
                    return e.fold([](L const & l) { return either<R, L>::right(l); },
                                  [](R const & r) { return either<R, L>::left(r); });
                },
                [](either<R, L> const & e)
                {
                    return e.fold([](R const & r) { return either<L, R>::right(r); },
                                  [](L const & l) { return either<L, R>::left(l); });
                },
                "SwapEither"
            };
        }

        // Its own inverse
        template <typename A>
        iso<std::vector<A>, std::vector<A>> reverse_vector()
        {
            auto flip = [](std::vector<A> const & v) { return std::vector<A>(v.rbegin(), v.rend()); };
            return iso<std::vector<A>, std::vector<A>>{ flip, flip, "ReverseVector" };
        }

        // Joins with sep; reverse_get splits at every sep, so an empty string
        // reads back as one empty element
        inline iso<std::vector<std::string>, std::string> joined(std::string sep)
        {
            return iso<std::vector<std::string>, std::string>{
                [sep](std::vector<std::string> const & parts)
                {
                    return fmt::format("{}", fmt::join(parts, sep));
                },
                [sep](std::string const & text)
                {
                    std::vector<std::string> parts;
                    size_t start = 0;
                    for (;;)
                    {
                        size_t end = sep.empty() ? std::string::npos : text.find(sep, start);
                        if (end == std::string::npos)
                        {
                            parts.push_back(text.substr(start));
                            return parts;
                        }
                        parts.push_back(text.substr(start, end - start));
                        start = end + sep.size();
                    }
                },
                fmt::format("Joined[{}]", sep)
            };
        }

        inline iso<std::vector<std::string>, std::string> lines()
        {
            auto result = joined("\n");
            result.name = "Lines";
            return result;
        }

        //--------------------------------------------------------------------
        // Composition
        //--------------------------------------------------------------------

        // pipe(sa, compose(ab)) converts S to B through A
        template <typename A, typename B>
        auto compose(iso<A, B> ab)
        {
            return [ab = std::move(ab)]<typename S>(iso<S, A> const & sa) -> iso<S, B>
            {
                return iso<S, B>{
                    [sa, ab](S const & s) { return ab.get(sa.get(s)); },
                    [sa, ab](B const & b) { return sa.reverse_get(ab.reverse_get(b)); },
                    fmt::format("IsoCompose[{} -> {}]", sa.name, ab.name)
                };
            };
        }

        template <typename S, typename A>
        iso<A, S> reverse(iso<S, A> const & sa)
        {
            return iso<A, S>{ sa.reverse_get, sa.get, fmt::format("Reverse[{}]", sa.name) };
        }

        //--------------------------------------------------------------------
        // Conversion and transformation
        //--------------------------------------------------------------------

        // pipe(i, to(s)) is i.get(s)
        template <typename S>
        auto to(S s)
        {
            return [s = std::move(s)]<typename A>(iso<S, A> const & i) -> A { return i.get(s); };
        }

        // pipe(i, from(a)) is i.reverse_get(a)
        template <typename A>
        auto from(A a)
        {
            return [a = std::move(a)]<typename S>(iso<S, A> const & i) -> S { return i.reverse_get(a); };
        }

        // pipe(i, modify(f)) is the endomorphism s -> reverse_get(f(get(s)))
        template <typename F>
        auto modify(F f)
        {
            return [f = std::move(f)]<typename S, typename A>(iso<S, A> const & i) -> endomorphism<S>
            {
                return [i, f](S const & s) -> S { return i.reverse_get(std::invoke(f, i.get(s))); };
            };
        }

        // Extends the target through a second conversion ab / ba, which must
        // itself be lossless for the result to be an iso
        template <typename AB, typename BA>
        auto imap(AB ab, BA ba)
        {
            return [ab = std::move(ab), ba = std::move(ba)]<typename S, typename A>(iso<S, A> const & sa)
            {
                using B = detail::result_t<AB, A>;
                return iso<S, B>{
                    [sa, ab](S const & s) -> B { return std::invoke(ab, sa.get(s)); },
                    [sa, ba](B const & b) -> S { return sa.reverse_get(std::invoke(ba, b)); },
                    fmt::format("IMap[{}]", sa.name)
                };
            };
        }

    } // namespace isos

    //========================================================================
    // ADAPTERS
    //========================================================================

    // Setting replaces the whole structure with reverse_get(a)
    template <typename S, typename A>
    lens<S, A> iso_as_lens(iso<S, A> const & i)
    {
        return lens<S, A>{
            i.get,
            [reverse_get = i.reverse_get](A const & a) -> endomorphism<S>
            {
                return [reverse_get, a](S const &) { return reverse_get(a); };
            },
            i.name
        };
    }

    // A prism that always matches
    template <typename S, typename A>
    prism<S, A> iso_as_prism(iso<S, A> const & i)
    {
        return prism<S, A>{
            [get = i.get](S const & s) { return std::optional<A>(get(s)); },
            i.reverse_get,
            i.name
        };
    }

    template <typename S, typename A>
    lens<S, A> as_lens(iso<S, A> const & i)
    {
        return iso_as_lens(i);
    }

    template <typename S, typename A>
    prism<S, A> as_prism(iso<S, A> const & i)
    {
        return iso_as_prism(i);
    }

    template <typename S, typename A>
    optional<S, A> as_optional(iso<S, A> const & i)
    {
        return lens_as_optional(iso_as_lens(i));
    }

    namespace lenses
    {
        // pipe(sa, compose_iso(ab)): the field A viewed as B
        template <typename A, typename B>
        auto compose_iso(iso<A, B> const & ab)
        {
            return compose(iso_as_lens(ab));
        }
    }

} // namespace facet::optics

#endif
