// facet_format.hpp - Facet - Error Rendering
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Rendering of validation errors for people and for loggers. Nothing here
// writes anywhere unless handed a stream; callers choose the sink.
//
//     fmt::print("{}\n", err);     // at user.age: must be positive
//     fmt::print("{:+}\n", err);   // adds "caused by:" and "value:" lines
//     facet::write_report(std::cerr, errs);

#ifndef FACET_FORMAT_HPP
#define FACET_FORMAT_HPP

#include "facet_validation.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace facet
{
    //========================================================================
    // OPTIONS
    //========================================================================

    struct format_options
    {
        bool verbose = false;     // one line per detail instead of a single line
        bool show_value = true;   // verbose only: the offending value
        bool show_cause = true;
        int  indent = 2;          // leading spaces of detail and report lines
    };

    //========================================================================
    // SINGLE ERRORS
    //========================================================================

    inline std::string to_string(validation_error const & error, format_options const & options = {})
    {
        std::string out;
        if (!error.context.empty())
            out = fmt::format("at {}: ", format_path(error.context));
        out += error.message;

        bool show_cause = options.show_cause && error.cause;

        if (!options.verbose)
        {
            if (show_cause)
                out += fmt::format(" (caused by: {})", describe(error.cause));
            return out;
        }

        std::string pad(static_cast<size_t>(options.indent > 0 ? options.indent : 0), ' ');

        if (show_cause)
            out += fmt::format("\n{}caused by: {}", pad, describe(error.cause));
        if (options.show_value && error.value.has_value())
            out += fmt::format("\n{}value: {}", pad, error.value.to_string());

        return out;
    }

    // Key/value pairs for structured loggers: message and path always,
    // value and cause when present
    inline std::vector<std::pair<std::string, std::string>> log_fields(validation_error const & error)
    {
        std::vector<std::pair<std::string, std::string>> fields;
        fields.emplace_back("message", error.message);
        fields.emplace_back("path", format_path(error.context));

        if (error.value.has_value())
            fields.emplace_back("value", error.value.to_string());
        if (error.cause)
            fields.emplace_back("cause", describe(error.cause));

        return fields;
    }

    //========================================================================
    // ERROR SEQUENCES
    //========================================================================

    inline std::string to_string(errors const & errs, format_options const & options = {})
    {
        if (errs.empty())
            return "ValidationErrors: no errors";

        std::string pad(static_cast<size_t>(options.indent > 0 ? options.indent : 0), ' ');

        // detail lines of verbose errors sit under their entry
        format_options nested = options;
        nested.indent = options.indent * 2;

        std::string out = fmt::format("ValidationErrors ({}):", errs.size());
        for (size_t i = 0; i < errs.size(); ++i)
            out += fmt::format("\n{}[{}] {}", pad, i, to_string(errs[i], nested));
        return out;
    }

    inline void write_report(std::ostream & os, errors const & errs, format_options const & options = {})
    {
        fmt::print(os, "{}\n", to_string(errs, options));
    }

} // namespace facet

//========================================================================
// FMT FORMATTERS
//========================================================================

namespace facet::detail
{
    // Accepts "{}" and "{:+}"; '+' selects the verbose rendering
    struct verbose_flag_parser
    {
        bool verbose = false;

        constexpr auto parse(fmt::format_parse_context & ctx) -> decltype(ctx.begin())
        {
            auto it = ctx.begin();
            if (it != ctx.end() && *it == '+')
            {
                verbose = true;
                ++it;
            }
            if (it != ctx.end() && *it != '}')
                throw fmt::format_error("invalid format specifier for a validation error");
            return it;
        }
    };
}

template <>
struct fmt::formatter<facet::validation_error> : facet::detail::verbose_flag_parser
{
    template <typename FormatContext>
    auto format(facet::validation_error const & error, FormatContext & ctx) const -> decltype(ctx.out())
    {
        facet::format_options options;
        options.verbose = verbose;
        return fmt::format_to(ctx.out(), "{}", facet::to_string(error, options));
    }
};

template <>
struct fmt::formatter<facet::validation_errors> : facet::detail::verbose_flag_parser
{
    template <typename FormatContext>
    auto format(facet::validation_errors const & e, FormatContext & ctx) const -> decltype(ctx.out())
    {
        if (!verbose)
            return fmt::format_to(ctx.out(), "{}", e.what());

        auto out = fmt::format_to(ctx.out(), "{}", facet::to_string(e.error_list()));
        if (e.cause())
            out = fmt::format_to(out, "\n  root cause: {}", facet::describe(e.cause()));
        return out;
    }
};

#endif
