#ifndef FACET_TESTS_CORE__
#define FACET_TESTS_CORE__

#include "facet_test_harness.hpp"

#include "../include/facet_core.hpp"
#include "../include/facet_either.hpp"
#include "../include/facet_monoid.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace facet::tests
{
    using namespace facet;

    // -----------------------------------------------------------------
    // Function utilities
    // -----------------------------------------------------------------

    bool pipe_applies_left_to_right()
    {
        auto add_one = [](int x) { return x + 1; };
        auto twice = [](int x) { return x * 2; };

        EXPECT(pipe(3) == 3, "pipe without operators should return its value");
        EXPECT(pipe(3, add_one, twice) == 8, "pipe should apply add_one first");
        EXPECT(pipe(3, twice, add_one) == 7, "pipe should apply twice first");

        return true;
    }

    bool flow_composes_into_a_function()
    {
        auto describe_int = flow([](int x) { return x * 10; },
                                 [](int x) { return std::to_string(x); });

        EXPECT(describe_int(4) == "40", "flow should feed the first result into the second");
        EXPECT(identity(std::string("id")) == "id", "identity should return its argument");
        EXPECT(constant(7)("ignored", 1, 2.0) == 7, "constant should ignore its arguments");

        return true;
    }

    // -----------------------------------------------------------------
    // Either and Result
    // -----------------------------------------------------------------

    bool either_holds_exactly_one_side()
    {
        auto l = either<std::string, int>::left("bad");
        auto r = either<std::string, int>::right(5);

        EXPECT(l.is_left() && !l.is_right(), "left should only be left");
        EXPECT(r.is_right() && !r.is_left(), "right should only be right");
        EXPECT(l.get_left() == "bad", "left value should be kept");
        EXPECT(r.get_right() == 5, "right value should be kept");
        EXPECT(l.right_ptr() == nullptr, "left should have no right value");
        EXPECT(r.left_ptr() == nullptr, "right should have no left value");

        return true;
    }

    bool either_fold_and_fallback()
    {
        auto l = either<std::string, int>::left("bad");
        auto r = either<std::string, int>::right(5);

        auto size_or_value = [](auto const & e)
        {
            return e.fold([](std::string const & s) { return static_cast<int>(s.size()); },
                          [](int v) { return v; });
        };

        EXPECT(size_or_value(l) == 3, "fold should use the left handler on a left");
        EXPECT(size_or_value(r) == 5, "fold should use the right handler on a right");
        EXPECT(l.get_or_else(9) == 9, "get_or_else should fall back on a left");
        EXPECT(r.get_or_else(9) == 5, "get_or_else should keep a right");

        return true;
    }

    bool either_maps_one_side_only()
    {
        auto l = either<std::string, int>::left("bad");
        auto r = either<std::string, int>::right(5);

        auto l2 = map_left(l, [](std::string const & s) { return s + "!"; });
        auto r2 = map_left(r, [](std::string const & s) { return s + "!"; });
        auto r3 = map_right(r, [](int v) { return v * 3; });

        EXPECT(l2.get_left() == "bad!", "map_left should transform a left");
        EXPECT(r2 == r, "map_left should not touch a right");
        EXPECT(r3.get_right() == 15, "map_right should transform a right");
        EXPECT(map_right(l, [](int v) { return v * 3; }) == l, "map_right should not touch a left");

        return true;
    }

    bool result_carries_exceptions()
    {
        auto good = ok(1);
        auto bad = fail<int>(std::runtime_error("boom"));

        EXPECT(good.is_right() && good.get_right() == 1, "ok should be a success");
        EXPECT(bad.is_left(), "fail should be a failure");

        bool rethrown = false;
        try
        {
            std::rethrow_exception(bad.get_left());
        }
        catch (std::runtime_error const & e)
        {
            rethrown = std::string(e.what()) == "boom";
        }
        EXPECT(rethrown, "the stored exception should be the one given to fail");

        return true;
    }

    // -----------------------------------------------------------------
    // Monoids
    // -----------------------------------------------------------------

    bool builtin_monoids_combine()
    {
        auto s = string_monoid();
        auto sum = sum_monoid<int>();
        auto product = product_monoid<int>();
        auto vec = vector_monoid<int>();

        EXPECT(s.concat("ab", "cd") == "abcd", "string monoid should append");
        EXPECT(s.empty().empty(), "string monoid identity should be empty");
        EXPECT(sum.concat(2, 3) == 5 && sum.empty() == 0, "sum monoid is + with 0");
        EXPECT(product.concat(2, 3) == 6 && product.empty() == 1, "product monoid is * with 1");
        EXPECT((vec.concat({ 1 }, { 2, 3 }) == std::vector<int>{ 1, 2, 3 }), "vector monoid should append");

        return true;
    }

    bool monoid_identity_and_associativity()
    {
        auto s = string_monoid();

        EXPECT(s.concat(s.empty(), "x") == "x", "left identity");
        EXPECT(s.concat("x", s.empty()) == "x", "right identity");
        EXPECT(s.concat(s.concat("a", "b"), "c") == s.concat("a", s.concat("b", "c")), "associativity");

        return true;
    }

    bool concat_all_and_reverse()
    {
        auto s = string_monoid();

        EXPECT(concat_all(s, { "a", "b", "c" }) == "abc", "concat_all should fold left to right");
        EXPECT(concat_all(s, {}) == "", "concat_all of nothing should be the identity");
        EXPECT(concat_all(reverse(s), { "a", "b", "c" }) == "cba", "reverse should swap the operands");

        auto custom = make_monoid<int>([](int a, int b) { return a > b ? a : b; }, 0);
        EXPECT(concat_all(custom, { 3, 9, 4 }) == 9, "make_monoid should use the given operation");

        return true;
    }

    bool section_titles_are_upper_cased()
    {
        EXPECT(subcat_title("Either") == "EITHER", "ASCII letters are upper-cased");
        EXPECT(subcat_title("caf\xC3\xA9 2") == "CAF\xC3\xA9 2", "other bytes are left as they are");

        return true;
    }

    void run_core_tests()
    {
        SUBCAT("Functions");
        RUN_TEST(pipe_applies_left_to_right);
        RUN_TEST(flow_composes_into_a_function);
        SUBCAT("Either");
        RUN_TEST(either_holds_exactly_one_side);
        RUN_TEST(either_fold_and_fallback);
        RUN_TEST(either_maps_one_side_only);
        RUN_TEST(result_carries_exceptions);
        SUBCAT("Monoids");
        RUN_TEST(builtin_monoids_combine);
        RUN_TEST(monoid_identity_and_associativity);
        RUN_TEST(concat_all_and_reverse);
        SUBCAT("Harness");
        RUN_TEST(section_titles_are_upper_cased);
    }
}

#endif
