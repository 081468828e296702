#include "include/facet.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iostream>
#include <string>
#include <vector>

// Raw sign-up form data, as it arrives from a form or a config file
struct raw_address
{
    std::string street;
    std::string city;
    std::string zip;
};

struct raw_user
{
    std::string name;
    std::string age;
    std::string email;
    raw_address address;
    std::vector<std::string> tags;
};

// The validated model
struct address
{
    std::string street;
    std::string city;
    int zip = 0;
};

struct user
{
    std::string name;
    int age = 0;
    std::string email;
    address home;
    std::vector<std::string> tags;
};

using namespace facet;

//========================================================================
// Optics over the model
//========================================================================

optics::lens<user, address> user_home()
{
    return optics::lenses::make_lens<user>(
        [](user const & u) { return u.home; },
        [](user u, address const & a) { u.home = a; return u; },
        "home");
}

optics::lens<address, std::string> address_city()
{
    return optics::lenses::make_lens<address>(
        [](address const & a) { return a.city; },
        [](address a, std::string const & c) { a.city = c; return a; },
        "city");
}

optics::lens<user, int> user_age()
{
    return optics::lenses::make_lens<user>(
        [](user const & u) { return u.age; },
        [](user u, int const & a) { u.age = a; return u; },
        "age");
}

optics::lens<user, std::vector<std::string>> user_tags()
{
    return optics::lenses::make_lens<user>(
        [](user const & u) { return u.tags; },
        [](user u, std::vector<std::string> const & t) { u.tags = t; return u; },
        "tags");
}

//========================================================================
// Validators
//========================================================================

validator<std::string, std::string> not_blank()
{
    return validate::from_predicate<std::string>(
        [](std::string const & s) { return s.find_first_not_of(" \t") != std::string::npos; },
        "must not be blank");
}

validator<std::string, std::string> email_address()
{
    return validate::from_predicate<std::string>(
        [](std::string const & s) { return s.find('@') != std::string::npos; },
        "must contain '@'");
}

validator<std::string, int> plausible_age()
{
    return pipe(validate::from_prism(optics::prisms::parse_int()),
                validate::chain([](int years)
                {
                    return validate::make_validator<std::string>([years](std::string const & input, context const & ctx)
                        -> validated<int>
                    {
                        if (years < 0 || years > 149)
                            return failure_with_message<int>(input, "must be between 0 and 149")(ctx);
                        return success(years);
                    });
                }));
}

validator<raw_address, address> address_validator()
{
    auto set_street = [](std::string s) { return [s](address a) { a.street = s; return a; }; };
    auto set_zip = [](int z) { return [z](address a) { a.zip = z; return a; }; };

    return pipe(validate::do_<raw_address>(address{}),
                validate::ap_s(set_street, validate::field<raw_address>("street", "string",
                    [](raw_address const & r) { return r.street; }, not_blank())),
                validate::ap_sl(address_city(), validate::field<raw_address>("city", "string",
                    [](raw_address const & r) { return r.city; }, not_blank())),
                validate::ap_s(set_zip, validate::field<raw_address>("zip", "int",
                    [](raw_address const & r) { return r.zip; },
                    validate::from_prism(optics::prisms::parse_int()))));
}

validator<raw_user, user> user_validator()
{
    auto set_name = [](std::string n) { return [n](user u) { u.name = n; return u; }; };
    auto set_email = [](std::string e) { return [e](user u) { u.email = e; return u; }; };
    auto set_tags = [](std::vector<std::string> t) { return [t](user u) { u.tags = t; return u; }; };

    return pipe(validate::do_<raw_user>(user{}),
                validate::ap_s(set_name, validate::field<raw_user>("name", "string",
                    [](raw_user const & r) { return r.name; }, not_blank())),
                validate::ap_sl(user_age(), validate::field<raw_user>("age", "int",
                    [](raw_user const & r) { return r.age; }, plausible_age())),
                validate::ap_s(set_email, validate::field<raw_user>("email", "string",
                    [](raw_user const & r) { return r.email; }, email_address())),
                validate::ap_sl(user_home(), validate::field<raw_user>("address", "Address",
                    [](raw_user const & r) { return r.address; }, address_validator())),
                validate::ap_s(set_tags, validate::field<raw_user>("tags", "string[]",
                    [](raw_user const & r) { return r.tags; }, validate::each(not_blank(), "string"))));
}

//========================================================================
// Demos
//========================================================================

void print_separator(std::string const & title)
{
    fmt::print("\n{}\n{}\n{}\n\n", std::string(70, '='), title, std::string(70, '='));
}

raw_user good_form()
{
    return raw_user{ "Ann", "34", "ann@example.com", { "1 Main St", "Oslo", "0150" }, { "admin", "ops" } };
}

raw_user bad_form()
{
    return raw_user{ "  ", "two hundred", "ann.example.com", { "1 Main St", "", "N-0150" }, { "admin", "" } };
}

// Root entry so every path starts at the validated type
context const root_context{ context_entry{ "", "User", {} } };

void demo_success()
{
    print_separator("DEMO 1: A Valid Form");

    auto result = validate::run(user_validator(), good_form(), root_context);
    if (result.is_left())
    {
        fmt::print("✗ Unexpected failure:\n{}\n", to_string(result.get_left()));
        return;
    }

    user const & u = result.get_right();
    fmt::print("✓ {} ({}), {}\n", u.name, u.age, u.email);
    fmt::print("  lives at {}, {} {}\n", u.home.street, u.home.zip, u.home.city);
    fmt::print("  tags: {}\n", u.tags);
}

void demo_accumulated_errors()
{
    print_separator("DEMO 2: Every Error At Once");

    auto result = validate::run(user_validator(), bad_form(), root_context);
    if (result.is_right())
    {
        fmt::print("✗ Expected validation errors but got none\n");
        return;
    }

    fmt::print("✓ {} errors detected:\n", result.get_left().size());
    for (auto const & err : result.get_left())
        fmt::print("  {}\n", err);

    fmt::print("\nVerbose report:\n");
    format_options options;
    options.verbose = true;
    write_report(std::cout, result.get_left(), options);
}

void demo_exceptions_and_logging()
{
    print_separator("DEMO 3: Exceptions and Structured Logging");

    auto collapsed = to_result(validate::run(user_validator(), bad_form(), root_context));
    if (collapsed.is_left())
    {
        try
        {
            std::rethrow_exception(collapsed.get_left());
        }
        catch (validation_errors const & e)
        {
            fmt::print("caught: {}\n", e);
            fmt::print("{:+}\n", e);

            auto const & first = e.error_list().front();
            fmt::print("\nlog line:");
            for (auto const & [key, value] : log_fields(first))
                fmt::print(" {}=\"{}\"", key, value);
            fmt::print("\n");
        }
    }
}

void demo_recovery()
{
    print_separator("DEMO 4: Recovering From Failures");

    // Any age that fails to validate falls back to zero
    auto age_or_zero = pipe(plausible_age(),
                            validate::or_else([](errors const &) { return validate::of<std::string>(0); }));

    for (std::string input : { "41", "", "-3" })
    {
        auto r = validate::run(age_or_zero, input);
        fmt::print("  age \"{}\" -> {}\n", input, r.get_or_else(-1));
    }

    // Three sources tried in order; the first success wins
    auto from_env = validate::from_predicate<std::string>([](std::string const &) { return false; }, "no environment value");
    auto port = pipe(from_env,
                     validate::alt([]() { return not_blank(); }));
    auto r = validate::run(port, std::string("8080"));
    fmt::print("  port source -> {}\n", r.get_or_else("<none>"));
}

void demo_optics()
{
    print_separator("DEMO 5: Optics");

    auto result = validate::run(user_validator(), good_form());
    if (result.is_left())
        return;

    user const & u = result.get_right();

    auto city = pipe(user_home(), optics::lenses::compose(address_city()));
    user moved = city.set("Bergen")(u);
    fmt::print("  {}: {} -> {}\n", city.name, city.get(u), city.get(moved));

    auto birthday = pipe(user_age(), optics::lenses::modify([](int a) { return a + 1; }));
    fmt::print("  after a birthday: {}\n", birthday(u).age);

    auto zip_text = optics::prisms::parse_int();
    fmt::print("  \"0150\" as {}: {}\n", zip_text.name, zip_text.get_option("0150").value_or(-1));
    fmt::print("  \"N-0150\" as {}: {}\n", zip_text.name, zip_text.get_option("N-0150").has_value() ? "match" : "no match");

    auto tag_line = optics::isos::joined(", ");
    user retagged = pipe(user_tags(), optics::lenses::compose_iso(tag_line)).set("ops, audit")(u);
    fmt::print("  tags {} -> {}\n", tag_line.get(u.tags), tag_line.get(retagged.tags));
}

int main()
{
    fmt::print(R"(
 ___             _
| __|_ _ __ ___ | |_
| _/ _` / _/ -_)|  _|
|_|\__,_\__\___| \__|

Composable validation and optics - Examples
Version 0.1.0
)");

    try
    {
        demo_success();
        demo_accumulated_errors();
        demo_exceptions_and_logging();
        demo_recovery();
        demo_optics();

        print_separator("ALL DEMOS COMPLETED");
        return 0;
    }
    catch (std::exception const & e)
    {
        fmt::print(stderr, "\n✗ Demo failed with exception: {}\n", e.what());
        return 1;
    }
}
