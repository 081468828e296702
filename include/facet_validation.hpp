// facet_validation.hpp - Facet - Error-Accumulating Validation
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// validated<A> is either a success carrying an A, or a failure carrying an
// ordered, non-empty sequence of validation errors. Independent
// combinations (ap and the applicative monoids) accumulate every failure;
// dependent sequencing (chain) stops at the first.

#ifndef FACET_VALIDATION_HPP
#define FACET_VALIDATION_HPP

#include "facet_core.hpp"
#include "facet_either.hpp"
#include "facet_monoid.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <any>
#include <concepts>
#include <exception>
#include <string>
#include <typeinfo>
#include <vector>

namespace facet
{
//========================================================================
// Type-erased values
//========================================================================

    // Holds the offending input of a failure. The value can be recovered
    // with get<T>() and rendered with to_string() when fmt knows the type.
    // Two values are equal when they hold the same type and compare equal
    // with ==; pointers (C strings among them) and types without == are
    // compared by their rendering.
    class any_value
    {
    public:
        any_value() = default;

        template <typename T,
                  typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, any_value>>>
        any_value(T && v)
            : value_(std::forward<T>(v))
            , render_(&render<std::decay_t<T>>)
            , compare_(&compare<std::decay_t<T>>)
        {}

        bool has_value() const noexcept { return value_.has_value(); }

        template <typename T>
        T const * get() const noexcept { return std::any_cast<T>(&value_); }

        std::string to_string() const
        {
            return render_ ? render_(value_) : std::string{};
        }

        std::type_info const & type() const noexcept { return value_.type(); }

        bool equals(any_value const & other) const
        {
            if (type() != other.type())
                return false;
            return !compare_ || compare_(value_, other.value_);
        }

    private:
        template <typename T>
        static std::string render(std::any const & a)
        {
            T const * v = std::any_cast<T>(&a);
            if constexpr (fmt::is_formattable<T>::value)
                return fmt::format("{}", *v);
            else
                return fmt::format("<{}>", typeid(T).name());
        }

        template <typename T>
        static bool compare(std::any const & a, std::any const & b)
        {
            if constexpr (std::equality_comparable<T> && !std::is_pointer_v<T>)
                return *std::any_cast<T>(&a) == *std::any_cast<T>(&b);
            else
                return render<T>(a) == render<T>(b);
        }

        std::any value_;
        std::string (*render_)(std::any const &) = nullptr;
        bool (*compare_)(std::any const &, std::any const &) = nullptr;
    };

//========================================================================
// Context path
//========================================================================

    struct context_entry
    {
        std::string key;     // field name, map key or element index
        std::string type;    // expected type name
        any_value   actual;  // value found at this position
    };

    inline bool operator==(context_entry const & a, context_entry const & b)
    {
        return a.key == b.key
            && a.type == b.type
            && a.actual.equals(b.actual);
    }

    // Path from the validation root to the current position, outermost first
    using context = std::vector<context_entry>;

    // "user.address.zipCode"; an entry without a key contributes its type
    inline std::string format_path(context const & ctx)
    {
        std::string path;
        for (size_t i = 0; i < ctx.size(); ++i)
        {
            if (i > 0)
                path += '.';
            path += ctx[i].key.empty() ? ctx[i].type : ctx[i].key;
        }
        return path;
    }

//========================================================================
// Causes
//========================================================================

    // what() of the exception held by error; empty for a null pointer.
    // A cause not derived from std::exception reads "unknown exception".
    inline std::string describe(std::exception_ptr const & error)
    {
        std::string text;
        if (!error)
            return text;

        try
        {
            std::rethrow_exception(error);
        }
        catch (std::exception const & e)
        {
            text = e.what();
        }
        catch (...)
        {
            text = "unknown exception";
        }
        return text;
    }

    // The cause nested inside error by std::throw_with_nested, or null.
    // Any other thrown type has no nested cause.
    inline std::exception_ptr unwrap(std::exception_ptr const & error)
    {
        std::exception_ptr inner;
        if (!error)
            return inner;

        try
        {
            std::rethrow_exception(error);
        }
        catch (std::nested_exception const & nested)
        {
            inner = nested.nested_ptr();
        }
        catch (...)
        {
            inner = nullptr;
        }
        return inner;
    }

    // True if target is error itself or any cause nested below it
    inline bool has_cause(std::exception_ptr const & error, std::exception_ptr const & target)
    {
        for (auto current = error; current; current = unwrap(current))
        {
            if (current == target)
                return true;
        }
        return false;
    }

//========================================================================
// Validation errors
//========================================================================

    struct validation_error
    {
        any_value          value;    // the offending input
        facet::context     context;  // where it was found
        std::string        message;
        std::exception_ptr cause;    // optional underlying error

        std::exception_ptr unwrap() const noexcept { return cause; }

        std::string to_string() const
        {
            return "ValidationError: " + message;
        }
    };

    inline bool operator==(validation_error const & a, validation_error const & b)
    {
        return a.message == b.message
            && a.context == b.context
            && a.cause == b.cause
            && a.value.equals(b.value);
    }

    // Failures in production order
    using errors = std::vector<validation_error>;

    inline errors concat_errors(errors const & first, errors const & second)
    {
        if (first.empty()) return second;
        if (second.empty()) return first;

        errors out;
        out.reserve(first.size() + second.size());
        out.insert(out.end(), first.begin(), first.end());
        out.insert(out.end(), second.begin(), second.end());
        return out;
    }

    inline monoid<errors> errors_monoid()
    {
        return monoid<errors>{
            []() { return errors{}; },
            &concat_errors
        };
    }

//------------------------------------------------------------------------

    // A whole error sequence collapsed into one standard exception, for
    // callers that expect a single error.
    class validation_errors : public std::exception
    {
    public:
        explicit validation_errors(errors errs, std::exception_ptr cause = nullptr)
            : errors_(std::move(errs))
            , cause_(std::move(cause))
            , summary_(make_summary(errors_.size()))
        {}

        char const * what() const noexcept override { return summary_.c_str(); }

        errors const & error_list() const noexcept { return errors_; }
        std::exception_ptr cause() const noexcept { return cause_; }
        std::exception_ptr unwrap() const noexcept { return cause_; }

        std::string to_string() const
        {
            if (errors_.empty())
                return summary_;

            std::string out = fmt::format("ValidationErrors ({}):\n", errors_.size());
            for (size_t i = 0; i < errors_.size(); ++i)
                out += fmt::format("  [{}] {}\n", i, errors_[i].to_string());

            if (cause_)
                out += fmt::format("  caused by: {}\n", describe(cause_));

            return out;
        }

    private:
        static std::string make_summary(size_t count)
        {
            if (count == 0) return "ValidationErrors: no errors";
            if (count == 1) return "ValidationErrors: 1 error";
            return fmt::format("ValidationErrors: {} errors", count);
        }

        errors             errors_;
        std::exception_ptr cause_;
        std::string        summary_;
    };

    inline std::exception_ptr make_validation_errors(errors errs, std::exception_ptr cause = nullptr)
    {
        return std::make_exception_ptr(validation_errors(std::move(errs), std::move(cause)));
    }

//========================================================================
// Validated values
//========================================================================

    template <typename A>
    using validated = either<errors, A>;

    // The context-dependent half of a validator
    template <typename A>
    using decoder = reader<context, validated<A>>;

    template <typename T>
    struct is_validated : std::false_type {};

    template <typename A>
    struct is_validated<validated<A>> : std::true_type {};

    template <typename T>
    struct validated_value;

    template <typename A>
    struct validated_value<validated<A>>
    {
        using type = A;
    };

    template <typename T>
    using validated_value_t = typename validated_value<std::decay_t<T>>::type;

//------------------------------------------------------------------------

    template <typename A>
    validated<A> success(A value)
    {
        return validated<A>::right(std::move(value));
    }

    template <typename A>
    validated<A> failures(errors errs)
    {
        return validated<A>::left(std::move(errs));
    }

    template <typename A>
    validated<A> failure(validation_error error)
    {
        return validated<A>::left(errors{ std::move(error) });
    }

    // A failure waiting for the context it is reported in
    template <typename A>
    decoder<A> failure_with_message(any_value value, std::string message)
    {
        return [value = std::move(value), message = std::move(message)](context const & ctx)
        {
            return failure<A>(validation_error{ value, ctx, message, nullptr });
        };
    }

    // As failure_with_message, recording the underlying cause
    template <typename A>
    reader<std::exception_ptr, decoder<A>> failure_with_error(any_value value, std::string message)
    {
        return [value = std::move(value), message = std::move(message)](std::exception_ptr const & cause)
            -> decoder<A>
        {
            return [value, message, cause](context const & ctx)
            {
                return failure<A>(validation_error{ value, ctx, message, cause });
            };
        };
    }

    // Errors become one validation_errors exception; values pass unchanged
    template <typename A>
    result<A> to_result(validated<A> const & v)
    {
        return map_left(v, [](errors const & errs) { return make_validation_errors(errs); });
    }

//========================================================================
// Functor / Applicative / Monad
//========================================================================

    namespace validation
    {
        template <typename A>
        validated<A> of(A value)
        {
            return success(std::move(value));
        }

        template <typename A, typename F>
        auto monad_map(validated<A> const & fa, F && f) -> validated<detail::result_t<F, A>>
        {
            using out = validated<detail::result_t<F, A>>;
            if (fa.is_left())
                return out::left(fa.get_left());
            return out::right(std::invoke(std::forward<F>(f), fa.get_right()));
        }

        template <typename F>
        auto map(F f)
        {
            return [f = std::move(f)](auto const & fa) { return validation::monad_map(fa, f); };
        }

//------------------------------------------------------------------------

        // Both failed: function-side errors, then value-side errors
        template <typename F, typename A>
        auto monad_ap(validated<F> const & fab, validated<A> const & fa) -> validated<detail::result_t<F, A>>
        {
            using out = validated<detail::result_t<F, A>>;
            if (fab.is_left())
            {
                if (fa.is_left())
                    return out::left(concat_errors(fab.get_left(), fa.get_left()));
                return out::left(fab.get_left());
            }
            if (fa.is_left())
                return out::left(fa.get_left());
            return out::right(std::invoke(fab.get_right(), fa.get_right()));
        }

        template <typename A>
        auto ap(validated<A> fa)
        {
            return [fa = std::move(fa)](auto const & fab) { return validation::monad_ap(fab, fa); };
        }

//------------------------------------------------------------------------

        template <typename A, typename F>
        auto monad_chain(validated<A> const & fa, F && f) -> detail::result_t<F, A>
        {
            using out = detail::result_t<F, A>;
            static_assert(is_validated<out>::value, "chain expects a function returning validated<B>");

            if (fa.is_left())
                return out::left(fa.get_left());
            return std::invoke(std::forward<F>(f), fa.get_right());
        }

        template <typename F>
        auto chain(F f)
        {
            return [f = std::move(f)](auto const & fa) { return validation::monad_chain(fa, f); };
        }

//------------------------------------------------------------------------

        // Recovery on the failure channel. A successful handler replaces the
        // failure; a failing handler appends its errors to the original ones.
        template <typename A, typename F>
        validated<A> monad_chain_left(validated<A> const & fa, F && f)
        {
            if (fa.is_right())
                return fa;

            validated<A> next = std::invoke(std::forward<F>(f), fa.get_left());
            if (next.is_right())
                return next;

            return failures<A>(concat_errors(fa.get_left(), next.get_left()));
        }

        template <typename F>
        auto chain_left(F f)
        {
            return [f = std::move(f)](auto const & fa) { return validation::monad_chain_left(fa, f); };
        }

        template <typename F>
        auto or_else(F f)
        {
            return chain_left(std::move(f));
        }

        // second is only evaluated when first failed
        template <typename A, typename Lazy>
        validated<A> monad_alt(validated<A> const & first, Lazy && second)
        {
            return monad_chain_left(first, [&second](errors const &) -> validated<A> { return std::invoke(second); });
        }

        template <typename Lazy>
        auto alt(Lazy second)
        {
            return [second = std::move(second)](auto const & first) { return validation::monad_alt(first, second); };
        }

//------------------------------------------------------------------------

        template <typename OnErrors, typename OnValue>
        auto fold(OnErrors on_errors, OnValue on_value)
        {
            return [on_errors = std::move(on_errors), on_value = std::move(on_value)](auto const & fa)
            {
                return fa.fold(on_errors, on_value);
            };
        }

        // The errors of a failure; empty for a success
        template <typename A>
        errors get_errors(validated<A> const & fa)
        {
            if (fa.is_left())
                return fa.get_left();
            return errors{};
        }

//========================================================================
// Monoids
//========================================================================

        // Successes are combined with m, failures accumulate
        template <typename A>
        monoid<validated<A>> applicative_monoid(monoid<A> m)
        {
            return monoid<validated<A>>{
                [m]() { return validation::of(m.empty()); },
                [m](validated<A> const & first, validated<A> const & second)
                {
                    auto partial = validation::monad_map(first, [m](A const & x)
                    {
                        return [m, x](A const & y) { return m.concat(x, y); };
                    });
                    return validation::monad_ap(partial, second);
                }
            };
        }

        // As applicative_monoid, but a single success wins over a failure
        template <typename A>
        monoid<validated<A>> alternative_monoid(monoid<A> m)
        {
            auto applicative = applicative_monoid(m);
            return monoid<validated<A>>{
                applicative.empty,
                [applicative](validated<A> const & first, validated<A> const & second)
                {
                    auto combined = applicative.concat(first, second);
                    if (combined.is_right() || (first.is_left() && second.is_left()))
                        return combined;
                    return first.is_right() ? first : second;
                }
            };
        }

        // First success wins; errors accumulate only when both fail
        template <typename A>
        monoid<validated<A>> alt_monoid(lazy<validated<A>> zero)
        {
            return monoid<validated<A>>{
                zero,
                [](validated<A> const & first, validated<A> const & second)
                {
                    return validation::monad_alt(first, [&second]() { return second; });
                }
            };
        }

    } // namespace validation

} // namespace facet

#endif
