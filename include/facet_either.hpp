// facet_either.hpp - Facet - Either / Result
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FACET_EITHER_HPP
#define FACET_EITHER_HPP

#include "facet_core.hpp"

#include <cstddef>
#include <exception>
#include <variant>

namespace facet
{
//========================================================================
// Either
//========================================================================

    // A disjoint union of a left (failure) and a right (success) value.
    // Exactly one side is populated; an either is never modified after
    // construction, transformations build a new one.
    template <typename L, typename R>
    class either
    {
    public:
        using left_type  = L;
        using right_type = R;

        static either left(L l)
        {
            return either(std::in_place_index<0>, std::move(l));
        }

        static either right(R r)
        {
            return either(std::in_place_index<1>, std::move(r));
        }

        bool is_left() const noexcept { return data_.index() == 0; }
        bool is_right() const noexcept { return data_.index() == 1; }

        // Throws std::bad_variant_access on the wrong side
        L const & get_left() const { return std::get<0>(data_); }
        R const & get_right() const { return std::get<1>(data_); }

        L const * left_ptr() const noexcept { return std::get_if<0>(&data_); }
        R const * right_ptr() const noexcept { return std::get_if<1>(&data_); }

        template <typename FL, typename FR>
        auto fold(FL && on_left, FR && on_right) const
        {
            if (is_left())
                return std::invoke(std::forward<FL>(on_left), get_left());
            return std::invoke(std::forward<FR>(on_right), get_right());
        }

        template <typename U>
        R get_or_else(U && fallback) const
        {
            if (is_right())
                return get_right();
            return static_cast<R>(std::forward<U>(fallback));
        }

        bool operator==(either const &) const = default;

    private:
        template <std::size_t I, typename T>
        either(std::in_place_index_t<I> tag, T && v)
            : data_(tag, std::forward<T>(v))
        {}

        std::variant<L, R> data_;
    };

//------------------------------------------------------------------------

    template <typename T>
    struct is_either : std::false_type {};

    template <typename L, typename R>
    struct is_either<either<L, R>> : std::true_type {};

    template <typename T>
    using right_value_t = typename std::decay_t<T>::right_type;

    template <typename L, typename R, typename F>
    auto map_left(either<L, R> const & e, F && f)
        -> either<detail::result_t<F, L>, R>
    {
        using out = either<detail::result_t<F, L>, R>;
        if (e.is_left())
            return out::left(std::invoke(std::forward<F>(f), e.get_left()));
        return out::right(e.get_right());
    }

    template <typename L, typename R, typename F>
    auto map_right(either<L, R> const & e, F && f)
        -> either<L, detail::result_t<F, R>>
    {
        using out = either<L, detail::result_t<F, R>>;
        if (e.is_left())
            return out::left(e.get_left());
        return out::right(std::invoke(std::forward<F>(f), e.get_right()));
    }

//========================================================================
// Result
//========================================================================

    // Conventional single-error outcome. The error is a std::exception_ptr
    // so any exception type (and nested cause chains) can be carried.
    template <typename A>
    using result = either<std::exception_ptr, A>;

    template <typename A>
    result<A> ok(A value)
    {
        return result<A>::right(std::move(value));
    }

    template <typename A>
    result<A> fail(std::exception_ptr error)
    {
        return result<A>::left(std::move(error));
    }

    template <typename A, typename E>
    result<A> fail(E error)
    {
        return result<A>::left(std::make_exception_ptr(std::move(error)));
    }

} // namespace facet

#endif
