#ifndef FACET_TESTS_VALIDATION_BIND__
#define FACET_TESTS_VALIDATION_BIND__

#include "facet_test_harness.hpp"

#include "../include/facet_lens.hpp"
#include "../include/facet_validation_bind.hpp"

#include <string>

namespace facet::tests
{
    using namespace facet;

    struct point_state
    {
        int x = 0;
        int y = 0;
        std::string label;

        bool operator==(point_state const &) const = default;
    };

    namespace
    {
        auto set_x = [](int x) { return [x](point_state s) { s.x = x; return s; }; };
        auto set_y = [](int y) { return [y](point_state s) { s.y = y; return s; }; };
        auto set_label = [](std::string l) { return [l](point_state s) { s.label = l; return s; }; };

        validation_error message_error(std::string message)
        {
            return validation_error{ {}, {}, std::move(message), nullptr };
        }

        optics::lens<point_state, int> x_lens()
        {
            return optics::lenses::make_lens<point_state>(
                [](point_state const & s) { return s.x; },
                [](point_state s, int x) { s.x = x; return s; },
                "point_state.x");
        }
    }

    // -----------------------------------------------------------------
    // Bind and Let
    // -----------------------------------------------------------------

    bool do_bind_builds_state()
    {
        auto r = pipe(validation::do_(point_state{}),
                      validation::bind(set_x, [](point_state const &) { return success(10); }),
                      validation::bind(set_y, [](point_state const & s) { return success(s.x * 2); }));

        EXPECT_RIGHT(r, "both fields succeed");
        EXPECT((r.get_right() == point_state{ 10, 20, "" }), "state should be x:10 y:20");

        return true;
    }

    bool do_bind_stops_at_failed_field()
    {
        bool later_called = false;
        auto r = pipe(validation::do_(point_state{}),
                      validation::bind(set_x, [](point_state const &) { return success(10); }),
                      validation::bind(set_y, [](point_state const &) { return failure<int>(message_error("y failed")); }),
                      validation::let(set_label, [&](point_state const &) { later_called = true; return std::string("late"); }));

        EXPECT_LEFT(r, "the failing field should fail the pipeline");
        EXPECT((messages_of(r) == std::vector<std::string>{ "y failed" }), "exactly the field error");
        EXPECT(r.get_left().front().context.empty(), "no context entries were pushed");
        EXPECT(!later_called, "steps after a failure are not evaluated");

        return true;
    }

    bool let_and_let_to_compute_fields()
    {
        auto r = pipe(validation::do_(point_state{}),
                      validation::let_to(set_x, 3),
                      validation::let(set_y, [](point_state const & s) { return s.x + 4; }),
                      validation::let_to(set_label, std::string("p")));

        EXPECT((r == success(point_state{ 3, 7, "p" })), "let and let_to should set fields");

        return true;
    }

    bool bind_to_starts_from_a_value()
    {
        auto r = pipe(success(5),
                      validation::bind_to([](int x) { return point_state{ x, 0, "" }; }),
                      validation::let(set_y, [](point_state const & s) { return s.x * 10; }));

        EXPECT((r == success(point_state{ 5, 50, "" })), "bind_to should wrap the value into a state");

        return true;
    }

    // -----------------------------------------------------------------
    // ApS accumulation
    // -----------------------------------------------------------------

    bool ap_s_accumulates_state_then_value_errors()
    {
        auto r = pipe(validation::do_(point_state{}),
                      validation::ap_s(set_x, failure<int>(message_error("state error"))),
                      validation::ap_s(set_y, failure<int>(message_error("value error"))));

        EXPECT_LEFT(r, "both fields failed");
        EXPECT((messages_of(r) == std::vector<std::string>{ "state error", "value error" }),
               "state errors come before field errors");

        return true;
    }

    bool ap_s_sets_independent_fields()
    {
        auto r = pipe(validation::do_(point_state{}),
                      validation::ap_s(set_x, success(1)),
                      validation::ap_s(set_y, success(2)));

        EXPECT((r == success(point_state{ 1, 2, "" })), "independent fields should both be set");

        return true;
    }

    bool bind_after_failed_ap_s_only_propagates()
    {
        bool bind_called = false;
        auto r = pipe(validation::do_(point_state{}),
                      validation::ap_s(set_x, failure<int>(message_error("x error"))),
                      validation::bind(set_y, [&](point_state const &) { bind_called = true; return failure<int>(message_error("y error")); }),
                      validation::let_to(set_label, std::string("never")));

        EXPECT(!bind_called, "bind after a failure must not run");
        EXPECT((messages_of(r) == std::vector<std::string>{ "x error" }), "only the ap_s errors are reported");

        auto r2 = pipe(r, validation::ap_s(set_label, failure<std::string>(message_error("label error"))));
        EXPECT((messages_of(r2) == std::vector<std::string>{ "x error", "label error" }),
               "a later ap_s still accumulates");

        return true;
    }

    // -----------------------------------------------------------------
    // Lens variants
    // -----------------------------------------------------------------

    bool lens_variants_focus_a_field()
    {
        auto xl = x_lens();

        auto r = pipe(validation::do_(point_state{}),
                      validation::let_to_l(xl, 2),
                      validation::let_l(xl, [](int x) { return x * 5; }),
                      validation::bind_l(xl, [](int x) { return x > 5 ? success(x + 1) : failure<int>(message_error("small")); }));

        EXPECT((r == success(point_state{ 11, 0, "" })), "lens variants should update x in place");

        auto failed = pipe(validation::do_(point_state{}),
                           validation::bind_l(xl, [](int x) { return x > 5 ? success(x) : failure<int>(message_error("small")); }));
        EXPECT((messages_of(failed) == std::vector<std::string>{ "small" }), "bind_l should propagate failures");

        auto acc = pipe(validation::do_(point_state{}),
                        validation::ap_s(set_y, failure<int>(message_error("y"))),
                        validation::ap_sl(xl, failure<int>(message_error("x"))));
        EXPECT((messages_of(acc) == std::vector<std::string>{ "y", "x" }), "ap_sl should accumulate like ap_s");

        auto focused = pipe(validation::do_(point_state{}), validation::ap_sl(xl, success(9)));
        EXPECT((focused == success(point_state{ 9, 0, "" })), "ap_sl should set the focus");

        return true;
    }

    void run_validation_bind_tests()
    {
        SUBCAT("Bind and Let");
        RUN_TEST(do_bind_builds_state);
        RUN_TEST(do_bind_stops_at_failed_field);
        RUN_TEST(let_and_let_to_compute_fields);
        RUN_TEST(bind_to_starts_from_a_value);
        SUBCAT("ApS");
        RUN_TEST(ap_s_accumulates_state_then_value_errors);
        RUN_TEST(ap_s_sets_independent_fields);
        RUN_TEST(bind_after_failed_ap_s_only_propagates);
        SUBCAT("Lens variants");
        RUN_TEST(lens_variants_focus_a_field);
    }
}

#endif
