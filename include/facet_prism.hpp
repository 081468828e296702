// facet_prism.hpp - Facet - Prisms
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// A prism selects one case A of a sum-like type S. get_option matches the
// case, reverse_get builds an S from it. Law, for every a:
//   get_option(reverse_get(a)) == a

#ifndef FACET_PRISM_HPP
#define FACET_PRISM_HPP

#include "facet_core.hpp"

#include <fmt/format.h>

#include <charconv>
#include <optional>
#include <string>
#include <variant>

namespace facet::optics
{
    //========================================================================
    // PRISM
    //========================================================================

    template <typename S, typename A>
    struct prism
    {
        std::function<std::optional<A>(S const &)> get_option;
        std::function<S(A const &)>                 reverse_get;
        std::string                                 name = "Prism";
    };

    namespace prisms
    {
        template <typename S, typename GetOption, typename ReverseGet>
        auto make_prism(GetOption get_option, ReverseGet reverse_get, std::string name = "Prism")
            -> prism<S, detail::option_result_t<GetOption, S>>
        {
            using A = detail::option_result_t<GetOption, S>;
            return prism<S, A>{ std::move(get_option), std::move(reverse_get), std::move(name) };
        }

        template <typename S>
        prism<S, S> id()
        {
            return prism<S, S>{
                [](S const & s) { return std::optional<S>(s); },
                [](S const & s) { return s; },
                "Identity"
            };
        }

        //--------------------------------------------------------------------
        // Common prisms
        //--------------------------------------------------------------------

        // The payload of an engaged std::optional
        template <typename A>
        prism<std::optional<A>, A> some()
        {
            return prism<std::optional<A>, A>{
                [](std::optional<A> const & s) { return s; },
                [](A const & a) { return std::optional<A>(a); },
                "Some"
            };
        }

        // One alternative of a std::variant
        template <typename Alt, typename Variant>
        prism<Variant, Alt> from_variant()
        {
            return prism<Variant, Alt>{
                [](Variant const & s) -> std::optional<Alt>
                {
                    if (auto const * alt = std::get_if<Alt>(&s))
                        return *alt;
                    return std::nullopt;
                },
                [](Alt const & a) { return Variant(std::in_place_type<Alt>, a); },
                "FromVariant"
            };
        }

        // Values satisfying pred; reverse_get is the identity
        template <typename A, typename Pred>
        prism<A, A> from_predicate(Pred pred, std::string name = "FromPredicate")
        {
            return prism<A, A>{
                [pred = std::move(pred)](A const & a) -> std::optional<A>
                {
                    if (std::invoke(pred, a))
                        return a;
                    return std::nullopt;
                },
                [](A const & a) { return a; },
                std::move(name)
            };
        }

        // Decimal integers; the whole string must be consumed
        inline prism<std::string, int> parse_int()
        {
            return prism<std::string, int>{
                [](std::string const & s) -> std::optional<int>
                {
                    int value = 0;
                    char const * first = s.data();
                    char const * last = s.data() + s.size();
                    auto [ptr, ec] = std::from_chars(first, last, value);
                    if (s.empty() || ec != std::errc() || ptr != last)
                        return std::nullopt;
                    return value;
                },
                [](int const & i) { return std::to_string(i); },
                "ParseInt"
            };
        }

        inline prism<std::string, std::string> non_empty_string()
        {
            return from_predicate<std::string>(
                [](std::string const & s) { return !s.empty(); },
                "NonEmptyString");
        }

        //--------------------------------------------------------------------
        // Composition and updates
        //--------------------------------------------------------------------

        // pipe(ab, compose(bc)) matches B inside A, then C inside B
        template <typename B, typename C>
        auto compose(prism<B, C> bc)
        {
            return [bc = std::move(bc)]<typename A>(prism<A, B> const & ab) -> prism<A, C>
            {
                return prism<A, C>{
                    [ab, bc](A const & a) -> std::optional<C>
                    {
                        auto b = ab.get_option(a);
                        if (!b)
                            return std::nullopt;
                        return bc.get_option(*b);
                    },
                    [ab, bc](C const & c) { return ab.reverse_get(bc.reverse_get(c)); },
                    fmt::format("PrismCompose[{} -> {}]", ab.name, bc.name)
                };
            };
        }

        // Replaces the matched case with a; other cases are left unchanged
        template <typename A>
        auto set(A a)
        {
            return [a = std::move(a)]<typename S>(prism<S, A> const & p) -> endomorphism<S>
            {
                return [p, a](S const & s) -> S
                {
                    if (!p.get_option(s))
                        return s;
                    return p.reverse_get(a);
                };
            };
        }

        template <typename F>
        auto modify(F f)
        {
            return [f = std::move(f)]<typename S, typename A>(prism<S, A> const & p) -> endomorphism<S>
            {
                return [p, f](S const & s) -> S
                {
                    auto a = p.get_option(s);
                    if (!a)
                        return s;
                    return p.reverse_get(std::invoke(f, *a));
                };
            };
        }

    } // namespace prisms

} // namespace facet::optics

#endif
