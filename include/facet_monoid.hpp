// facet_monoid.hpp - Facet - Monoids
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FACET_MONOID_HPP
#define FACET_MONOID_HPP

#include "facet_core.hpp"

#include <string>
#include <vector>

namespace facet
{
//========================================================================
// Monoid
//========================================================================

    // An associative binary operation with an identity element:
    //   concat(concat(a, b), c) == concat(a, concat(b, c))
    //   concat(empty(), a) == a == concat(a, empty())
    //
    // empty is a function so that an identity may be computed lazily
    // (see the alt monoids).
    template <typename A>
    struct monoid
    {
        std::function<A()>                     empty;
        std::function<A(A const &, A const &)> concat;
    };

    template <typename A, typename Concat>
    monoid<A> make_monoid(Concat concat, A empty)
    {
        return monoid<A>{
            [empty = std::move(empty)]() { return empty; },
            std::move(concat)
        };
    }

//------------------------------------------------------------------------

    inline monoid<std::string> string_monoid()
    {
        return make_monoid<std::string>(
            [](std::string const & a, std::string const & b) { return a + b; },
            std::string{});
    }

    template <typename T>
    monoid<T> sum_monoid()
    {
        return make_monoid<T>([](T const & a, T const & b) { return a + b; }, T{0});
    }

    template <typename T>
    monoid<T> product_monoid()
    {
        return make_monoid<T>([](T const & a, T const & b) { return a * b; }, T{1});
    }

    template <typename T>
    monoid<std::vector<T>> vector_monoid()
    {
        return make_monoid<std::vector<T>>(
            [](std::vector<T> const & a, std::vector<T> const & b)
            {
                if (a.empty()) return b;
                if (b.empty()) return a;

                std::vector<T> out;
                out.reserve(a.size() + b.size());
                out.insert(out.end(), a.begin(), a.end());
                out.insert(out.end(), b.begin(), b.end());
                return out;
            },
            std::vector<T>{});
    }

    // Swaps the operands of concat
    template <typename A>
    monoid<A> reverse(monoid<A> const & m)
    {
        return monoid<A>{
            m.empty,
            [concat = m.concat](A const & a, A const & b) { return concat(b, a); }
        };
    }

    // Left fold of values with m, starting from m.empty()
    template <typename A>
    A concat_all(monoid<A> const & m, std::vector<A> const & values)
    {
        A acc = m.empty();
        for (auto const & v : values)
            acc = m.concat(acc, v);
        return acc;
    }

} // namespace facet

#endif
