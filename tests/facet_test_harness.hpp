#ifndef FACET_TESTS_HARNESS__
#define FACET_TESTS_HARNESS__

#include "../include/facet_validation.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>
#include <string>

namespace facet::tests
{

    struct test_result
    {
        std::string name;
        bool passed;
        std::string failure;
    };

    extern std::vector<test_result> results;
    extern char const * last_error;

    #define EXPECT(cond, false_msg)                        \
        do                                                 \
        {                                                  \
            last_error = "";                               \
            if (!(cond)) {                                 \
                last_error = false_msg;                    \
                return false;                              \
            }                                              \
        } while (0)

    // Fails on the wrong side of an either before touching its value
    #define EXPECT_RIGHT(e, false_msg)  EXPECT((e).is_right(), false_msg)
    #define EXPECT_LEFT(e, false_msg)   EXPECT((e).is_left(), false_msg)

    #define RUN_TEST(fn)                                   \
        do                                                 \
        {                                                  \
            bool ok = fn();                                \
            results.push_back({ #fn, ok, ok ? "" : last_error }); \
            std::cout << (ok ? "[ ok ] " : "[FAIL] ")      \
                    << #fn;                                \
            if (!ok) std::cout << " FAILED: " << last_error;       \
            std::cout << "\n";                             \
        } while (0)

    // Upper-cased section title; bytes outside ASCII pass through
    inline std::string subcat_title(std::string str)
    {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return str;
    }

    #define SUBCAT(msg)                                                     \
        do                                                                  \
        {                                                                   \
            std::cout << "-------" << subcat_title(msg) << "--------------\n"; \
        }                                                                   \
        while (0)

    //------------------------------------------------------------------------
    // Shared helpers
    //------------------------------------------------------------------------

    // Messages of a failed validation in order; empty for a success
    template <typename A>
    std::vector<std::string> messages_of(validated<A> const & v)
    {
        std::vector<std::string> out;
        if (v.is_left())
        {
            for (auto const & e : v.get_left())
                out.push_back(e.message);
        }
        return out;
    }

    inline size_t failed_count()
    {
        return static_cast<size_t>(std::count_if(results.begin(), results.end(),
            [](test_result const & r) { return !r.passed; }));
    }
}

#endif
