// facet_validate.hpp - Facet - Composable Validators
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// A validator<I, A> reads an input I and yields a decoder<A>, which in turn
// reads the context path and yields validated<A>. Validators carry no
// state; every combinator builds a new one. The input and context given
// to a combined validator are passed unchanged to all of its parts.
//
// Combinators deduce I and A from their validator<I, A> arguments, so
// validators are built with the constructors in this file (make_validator,
// of, from_predicate, ...) rather than passed as bare lambdas.

#ifndef FACET_VALIDATE_HPP
#define FACET_VALIDATE_HPP

#include "facet_prism.hpp"
#include "facet_validation.hpp"

#include <string>
#include <vector>

namespace facet
{
    //========================================================================
    // VALIDATOR
    //========================================================================

    template <typename I, typename A>
    using validator = reader<I, decoder<A>>;

    template <typename T>
    struct validator_traits;

    template <typename I, typename A>
    struct validator_traits<validator<I, A>>
    {
        using input_type = I;
        using value_type = A;
    };

    template <typename T>
    using validator_input_t = typename validator_traits<std::decay_t<T>>::input_type;

    template <typename T>
    using validator_value_t = typename validator_traits<std::decay_t<T>>::value_type;

    namespace detail
    {
        // Lifts a combination of results to validators sharing input and context
        template <typename I, typename A>
        std::function<validator<I, A>(validator<I, A> const &, validator<I, A> const &)>
        lift_concat(monoid<validated<A>> m)
        {
            return [m](validator<I, A> const & first, validator<I, A> const & second) -> validator<I, A>
            {
                return [m, first, second](I const & input) -> decoder<A>
                {
                    return [m, d1 = first(input), d2 = second(input)](context const & ctx)
                    {
                        return m.concat(d1(ctx), d2(ctx));
                    };
                };
            };
        }
    }

    namespace validate
    {
        //====================================================================
        // Construction and running
        //====================================================================

        // fn(input, context) -> validated<A>
        template <typename I, typename Fn>
        auto make_validator(Fn fn)
            -> validator<I, validated_value_t<std::invoke_result_t<Fn const &, I const &, context const &>>>
        {
            using A = validated_value_t<std::invoke_result_t<Fn const &, I const &, context const &>>;
            return [fn = std::move(fn)](I const & input) -> decoder<A>
            {
                return [fn, input](context const & ctx) { return std::invoke(fn, input, ctx); };
            };
        }

        // Ignores the input and always succeeds with value
        template <typename I, typename A>
        validator<I, A> of(A value)
        {
            return [value = std::move(value)](I const &) -> decoder<A>
            {
                return [value](context const &) { return success(value); };
            };
        }

        template <typename I, typename A>
        validated<A> run(validator<I, A> const & v, I const & input, context const & ctx = {})
        {
            return v(input)(ctx);
        }

        //====================================================================
        // Functor / Applicative / Monad
        //====================================================================

        template <typename I, typename A, typename F>
        auto monad_map(validator<I, A> fa, F f) -> validator<I, detail::result_t<F, A>>
        {
            using B = detail::result_t<F, A>;
            return [fa = std::move(fa), f = std::move(f)](I const & input) -> decoder<B>
            {
                return [decode = fa(input), f](context const & ctx)
                {
                    return validation::monad_map(decode(ctx), f);
                };
            };
        }

        template <typename F>
        auto map(F f)
        {
            return [f = std::move(f)](auto const & fa) { return validate::monad_map(fa, f); };
        }

        // Both parts see the same input and context; when both fail the
        // function-side errors come first
        template <typename I, typename F, typename A>
        auto monad_ap(validator<I, F> fab, validator<I, A> fa) -> validator<I, detail::result_t<F, A>>
        {
            using B = detail::result_t<F, A>;
            return [fab = std::move(fab), fa = std::move(fa)](I const & input) -> decoder<B>
            {
                return [decode_f = fab(input), decode_a = fa(input)](context const & ctx)
                {
                    return validation::monad_ap(decode_f(ctx), decode_a(ctx));
                };
            };
        }

        template <typename I, typename A>
        auto ap(validator<I, A> fa)
        {
            return [fa = std::move(fa)](auto const & fab) { return validate::monad_ap(fab, fa); };
        }

//------------------------------------------------------------------------

        // f(a) is a validator<I, B> run on the same input and context
        template <typename I, typename A, typename F>
        auto monad_chain(validator<I, A> fa, F f) -> detail::result_t<F, A>
        {
            using out = detail::result_t<F, A>;
            using B = validator_value_t<out>;

            return [fa = std::move(fa), f = std::move(f)](I const & input) -> decoder<B>
            {
                return [decode = fa(input), f, input](context const & ctx) -> validated<B>
                {
                    auto a = decode(ctx);
                    if (a.is_left())
                        return failures<B>(a.get_left());
                    return std::invoke(f, a.get_right())(input)(ctx);
                };
            };
        }

        template <typename F>
        auto chain(F f)
        {
            return [f = std::move(f)](auto const & fa) { return validate::monad_chain(fa, f); };
        }

        // f(errors) is a validator<I, A> run on the same input and context.
        // Its success recovers; its failure is appended to the original errors.
        template <typename I, typename A, typename F>
        validator<I, A> monad_chain_left(validator<I, A> fa, F f)
        {
            return [fa = std::move(fa), f = std::move(f)](I const & input) -> decoder<A>
            {
                return [decode = fa(input), f, input](context const & ctx)
                {
                    return validation::monad_chain_left(decode(ctx), [&f, &input, &ctx](errors const & errs)
                    {
                        return std::invoke(f, errs)(input)(ctx);
                    });
                };
            };
        }

        template <typename F>
        auto chain_left(F f)
        {
            return [f = std::move(f)](auto const & fa) { return validate::monad_chain_left(fa, f); };
        }

        template <typename F>
        auto or_else(F f)
        {
            return validate::chain_left(std::move(f));
        }

        // second() is only evaluated when first fails
        template <typename I, typename A, typename Lazy>
        validator<I, A> monad_alt(validator<I, A> first, Lazy second)
        {
            return validate::monad_chain_left(std::move(first), [second = std::move(second)](errors const &)
                -> validator<I, A>
            {
                return std::invoke(second);
            });
        }

        template <typename Lazy>
        auto alt(Lazy second)
        {
            return [second = std::move(second)](auto const & first) { return validate::monad_alt(first, second); };
        }

        //====================================================================
        // Context
        //====================================================================

        // Runs v one level deeper, under {key, type, input}
        template <typename I, typename A>
        validator<I, A> at(std::string key, std::string type, validator<I, A> v)
        {
            return [key = std::move(key), type = std::move(type), v = std::move(v)](I const & input) -> decoder<A>
            {
                return [key, type, decode = v(input), input](context const & ctx)
                {
                    context inner = ctx;
                    inner.push_back(context_entry{ key, type, input });
                    return decode(inner);
                };
            };
        }

        // field<I>(key, type, getter, v) validates getter(input) with v under
        // the entry {key, type, getter(input)}
        template <typename I, typename Getter, typename F, typename A>
        validator<I, A> field(std::string key, std::string type, Getter getter, validator<F, A> v)
        {
            return [key = std::move(key), type = std::move(type), getter = std::move(getter), v = std::move(v)]
                (I const & input) -> decoder<A>
            {
                F value = std::invoke(getter, input);
                return [key, type, decode = v(value), value](context const & ctx)
                {
                    context inner = ctx;
                    inner.push_back(context_entry{ key, type, value });
                    return decode(inner);
                };
            };
        }

        // Validates every element under its index; all element errors are
        // reported, in element order
        template <typename I, typename A>
        validator<std::vector<I>, std::vector<A>> each(validator<I, A> item, std::string item_type)
        {
            return [item = std::move(item), item_type = std::move(item_type)](std::vector<I> const & inputs)
                -> decoder<std::vector<A>>
            {
                return [item, item_type, inputs](context const & ctx) -> validated<std::vector<A>>
                {
                    errors errs;
                    std::vector<A> values;
                    values.reserve(inputs.size());

                    for (size_t i = 0; i < inputs.size(); ++i)
                    {
                        context inner = ctx;
                        inner.push_back(context_entry{ std::to_string(i), item_type, inputs[i] });

                        auto v = item(inputs[i])(inner);
                        if (v.is_left())
                            errs = concat_errors(errs, v.get_left());
                        else
                            values.push_back(v.get_right());
                    }

                    if (!errs.empty())
                        return failures<std::vector<A>>(std::move(errs));
                    return success(std::move(values));
                };
            };
        }

        //====================================================================
        // Conversions
        //====================================================================

        // Accepts inputs satisfying pred, rejecting others with message
        template <typename A, typename Pred>
        validator<A, A> from_predicate(Pred pred, std::string message)
        {
            return [pred = std::move(pred), message = std::move(message)](A const & input) -> decoder<A>
            {
                if (std::invoke(pred, input))
                    return [input](context const &) { return success(input); };
                return failure_with_message<A>(input, message);
            };
        }

        // parser(input) -> result<A>; a failure is reported with the what()
        // of the exception it carries, which is kept as the cause
        template <typename I, typename Parser>
        auto from_parser(Parser parser)
            -> validator<I, right_value_t<std::invoke_result_t<Parser const &, I const &>>>
        {
            using A = right_value_t<std::invoke_result_t<Parser const &, I const &>>;
            return [parser = std::move(parser)](I const & input) -> decoder<A>
            {
                result<A> r = std::invoke(parser, input);
                if (r.is_left())
                    return failure_with_error<A>(input, describe(r.get_left()))(r.get_left());
                return [value = r.get_right()](context const &) { return success(value); };
            };
        }

        // rr(input) -> result<A>; a failure becomes "unable to decode" with
        // the exception kept as the cause
        template <typename I, typename ReaderResult>
        auto from_reader_result(ReaderResult rr)
            -> validator<I, right_value_t<std::invoke_result_t<ReaderResult const &, I const &>>>
        {
            using A = right_value_t<std::invoke_result_t<ReaderResult const &, I const &>>;
            return [rr = std::move(rr)](I const & input) -> decoder<A>
            {
                result<A> r = std::invoke(rr, input);
                if (r.is_left())
                    return failure_with_error<A>(input, "unable to decode")(r.get_left());
                return [value = r.get_right()](context const &) { return success(value); };
            };
        }

        // Inputs the prism matches are refined to its focus
        template <typename I, typename A>
        validator<I, A> from_prism(optics::prism<I, A> p)
        {
            return [p = std::move(p)](I const & input) -> decoder<A>
            {
                auto a = p.get_option(input);
                if (!a)
                    return failure_with_message<A>(input, "type cannot be refined: " + p.name);
                return [value = *a](context const &) { return success(value); };
            };
        }

        //====================================================================
        // Monoids
        //====================================================================

        // Both run; successes combine with m, errors accumulate
        template <typename I, typename A>
        monoid<validator<I, A>> applicative_monoid(monoid<A> m)
        {
            return monoid<validator<I, A>>{
                [m]() { return validate::of<I>(m.empty()); },
                facet::detail::lift_concat<I, A>(validation::applicative_monoid(m))
            };
        }

        // Both run; a single success wins, errors only when both fail
        template <typename I, typename A>
        monoid<validator<I, A>> alternative_monoid(monoid<A> m)
        {
            return monoid<validator<I, A>>{
                [m]() { return validate::of<I>(m.empty()); },
                facet::detail::lift_concat<I, A>(validation::alternative_monoid(m))
            };
        }

        // First success wins and the second validator is not run
        template <typename I, typename A>
        monoid<validator<I, A>> alt_monoid(lazy<validator<I, A>> zero)
        {
            return monoid<validator<I, A>>{
                std::move(zero),
                [](validator<I, A> const & first, validator<I, A> const & second)
                {
                    return validate::monad_alt(first, [second]() { return second; });
                }
            };
        }

    } // namespace validate

} // namespace facet

#endif
