#ifndef FACET_TESTS_FORMAT__
#define FACET_TESTS_FORMAT__

#include "facet_test_harness.hpp"

#include "../include/facet_format.hpp"

#include <fmt/format.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace facet::tests
{
    using namespace facet;

    namespace
    {
        validation_error age_error()
        {
            return validation_error{ -1, { { "user", "User", {} }, { "age", "int", -1 } }, "must be positive", nullptr };
        }

        validation_error port_error()
        {
            auto cause = std::make_exception_ptr(std::runtime_error("bad digit"));
            return validation_error{ std::string("8o"), { { "", "Config", {} }, { "port", "int", std::string("8o") } },
                                     "unable to decode", cause };
        }
    }

    // -----------------------------------------------------------------
    // Single errors
    // -----------------------------------------------------------------

    bool single_error_compact_and_verbose()
    {
        EXPECT(fmt::format("{}", age_error()) == "at user.age: must be positive", "compact form is path and message");
        EXPECT(fmt::format("{:+}", age_error()) == "at user.age: must be positive\n  value: -1",
               "verbose form adds the value line");

        EXPECT(fmt::format("{}", port_error()) == "at Config.port: unable to decode (caused by: bad digit)",
               "an entry without a key contributes its type; the cause is appended");
        EXPECT(fmt::format("{:+}", port_error()) == "at Config.port: unable to decode\n  caused by: bad digit\n  value: 8o",
               "verbose form puts the cause and value on their own lines");

        validation_error bare{ {}, {}, "no path", nullptr };
        EXPECT(fmt::format("{:+}", bare) == "no path", "an error without context or value is just its message");

        return true;
    }

    bool format_options_select_details()
    {
        format_options quiet;
        quiet.show_cause = false;
        EXPECT(to_string(port_error(), quiet) == "at Config.port: unable to decode", "show_cause off hides the cause");

        format_options verbose;
        verbose.verbose = true;
        verbose.show_value = false;
        verbose.indent = 4;
        EXPECT(to_string(port_error(), verbose) == "at Config.port: unable to decode\n    caused by: bad digit",
               "show_value off hides the value; indent widens the padding");

        return true;
    }

    bool log_fields_pairs_the_details()
    {
        auto fields = log_fields(port_error());
        EXPECT(fields.size() == 4, "message, path, value and cause");
        EXPECT((fields[0] == std::pair<std::string, std::string>{ "message", "unable to decode" }), "message first");
        EXPECT((fields[1] == std::pair<std::string, std::string>{ "path", "Config.port" }), "path second");
        EXPECT((fields[2] == std::pair<std::string, std::string>{ "value", "8o" }), "value when present");
        EXPECT((fields[3] == std::pair<std::string, std::string>{ "cause", "bad digit" }), "cause when present");

        validation_error bare{ {}, {}, "no path", nullptr };
        EXPECT(log_fields(bare).size() == 2, "absent value and cause are omitted");

        return true;
    }

    bool invalid_spec_is_rejected()
    {
        bool threw = false;
        try
        {
            (void)fmt::format(fmt::runtime("{:x}"), age_error());
        }
        catch (fmt::format_error const &)
        {
            threw = true;
        }
        EXPECT(threw, "only {} and {:+} are accepted");

        return true;
    }

    // -----------------------------------------------------------------
    // Error lists
    // -----------------------------------------------------------------

    bool error_lists_are_numbered()
    {
        errors errs{ age_error(), validation_error{ {}, {}, "second", nullptr } };

        EXPECT(to_string(errs) == "ValidationErrors (2):\n  [0] at user.age: must be positive\n  [1] second",
               "entries are numbered from zero");
        EXPECT(to_string(errors{}) == "ValidationErrors: no errors", "an empty list has its own summary");

        format_options verbose;
        verbose.verbose = true;
        EXPECT(to_string(errors{ age_error() }, verbose) == "ValidationErrors (1):\n  [0] at user.age: must be positive\n    value: -1",
               "verbose details sit under their entry");

        return true;
    }

    bool write_report_ends_with_newline()
    {
        errors errs{ age_error() };
        std::ostringstream os;
        write_report(os, errs);

        EXPECT(os.str() == to_string(errs) + "\n", "the report is the rendered list and a newline");

        return true;
    }

    bool validation_errors_formatter()
    {
        errors errs{ age_error(), port_error() };
        validation_errors plain(errs);
        EXPECT(fmt::format("{}", plain) == "ValidationErrors: 2 errors", "compact form is the summary");
        EXPECT(fmt::format("{:+}", plain) == to_string(errs), "verbose form lists every error");

        validation_errors caused(errs, std::make_exception_ptr(std::runtime_error("config unreadable")));
        EXPECT(fmt::format("{:+}", caused) == to_string(errs) + "\n  root cause: config unreadable",
               "the root cause follows the list");

        return true;
    }

    void run_format_tests()
    {
        SUBCAT("Single errors");
        RUN_TEST(single_error_compact_and_verbose);
        RUN_TEST(format_options_select_details);
        RUN_TEST(log_fields_pairs_the_details);
        RUN_TEST(invalid_spec_is_rejected);
        SUBCAT("Error lists");
        RUN_TEST(error_lists_are_numbered);
        RUN_TEST(write_report_ends_with_newline);
        RUN_TEST(validation_errors_formatter);
    }
}

#endif
