//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathrules/matcher.hpp>

#include "test_helpers.hpp"

#include <initializer_list>

namespace pathrules {

struct matcher_test
{
    struct rule
    {
        pattern path;
        int id;
    };

    static
    basic_matcher<rule>
    make(std::initializer_list<char const*> pats)
    {
        std::vector<rule> v;
        int id = 0;
        for(auto s : pats)
            v.push_back({ test::pat(s), id++ });
        return basic_matcher<rule>(std::move(v));
    }

    // returns the index of the matching rule, or -1
    static
    int
    which(
        basic_matcher<rule> const& m,
        core::string_view path)
    {
        auto mr = m.match(path);
        if(! mr)
            return -1;
        return static_cast<int>(mr->index);
    }

    static
    bool
    matches(
        core::string_view pat,
        core::string_view path)
    {
        bindings b;
        return match_pattern(
            test::pat(pat), split_path(path), b);
    }

    void
    testSplit()
    {
        BOOST_TEST(split_path("").empty());
        BOOST_TEST(split_path("/").empty());
        BOOST_TEST(split_path("//").empty());
        auto const v = split_path("/a//b/c/");
        if(BOOST_TEST_EQ(v.size(), 3u))
        {
            BOOST_TEST_EQ(v[0], "a");
            BOOST_TEST_EQ(v[1], "b");
            BOOST_TEST_EQ(v[2], "c");
        }
        BOOST_TEST_EQ(split_path("a/b").size(), 2u);
    }

    void
    testStructural()
    {
        // literals
        BOOST_TEST(matches("/a/b", "/a/b"));
        BOOST_TEST(matches("/a/b", "/a/b/"));
        BOOST_TEST(! matches("/a/b", "/a"));
        BOOST_TEST(! matches("/a/b", "/a/b/c"));
        BOOST_TEST(! matches("/a/b", "/a/B"));
        BOOST_TEST(! matches("/a/b", "/a/b%20"));

        // root
        BOOST_TEST(matches("/", "/"));
        BOOST_TEST(matches("", ""));
        BOOST_TEST(! matches("/", "/a"));

        // captures match exactly one segment
        BOOST_TEST(matches("/a/{x}", "/a/b"));
        BOOST_TEST(! matches("/a/{x}", "/a"));
        BOOST_TEST(! matches("/a/{x}", "/a/b/c"));

        // wildcards match zero or more
        BOOST_TEST(matches("/a/{*x}", "/a"));
        BOOST_TEST(matches("/a/{*x}", "/a/"));
        BOOST_TEST(matches("/a/{*x}", "/a/b"));
        BOOST_TEST(matches("/a/{*x}", "/a/b/c/d"));
        BOOST_TEST(! matches("/a/{*x}", "/b/c"));
        BOOST_TEST(matches("/{*x}", "/"));

        // odd request paths are literal text
        BOOST_TEST(matches("/{x}", "/..%2f"));
        BOOST_TEST(matches("/a b", "/a b"));
        BOOST_TEST(matches("/{x}/c", "/?q=1/c"));
    }

    void
    testBindings()
    {
        {
            bindings b;
            BOOST_TEST(match_pattern(
                test::pat("/{a}/x"), split_path("/42/x"), b));
            BOOST_TEST_EQ(b.size(), 1u);
            if(BOOST_TEST(b.find("a")))
                BOOST_TEST_EQ(*b.find("a"), "42");
        }
        {
            bindings b;
            BOOST_TEST(match_pattern(
                test::pat("/{*rest}"), split_path("/en/docs/intro"), b));
            if(BOOST_TEST(b.find("rest")))
                BOOST_TEST_EQ(*b.find("rest"), "en/docs/intro");
        }
        {
            // empty suffix binds an empty string
            bindings b;
            BOOST_TEST(match_pattern(
                test::pat("/a/{*rest}"), split_path("/a"), b));
            BOOST_TEST(b.contains("rest"));
            if(BOOST_TEST(b.find("rest")))
                BOOST_TEST_EQ(*b.find("rest"), "");
        }
        {
            // repeated separators collapse
            bindings b;
            BOOST_TEST(match_pattern(
                test::pat("/{lang}/{*rest}"), split_path("/en//a///b/"), b));
            BOOST_TEST_EQ(*b.find("lang"), "en");
            BOOST_TEST_EQ(*b.find("rest"), "a/b");
        }
    }

    void
    testSpecificity()
    {
        // literal beats wildcard regardless of order
        {
            auto m = make({ "/{*any}", "/a" });
            BOOST_TEST_EQ(which(m, "/a"), 1);
            BOOST_TEST_EQ(which(m, "/b"), 0);
        }
        {
            auto m = make({ "/a", "/{*any}" });
            BOOST_TEST_EQ(which(m, "/a"), 0);
        }

        // literal beats capture, even for the same text
        {
            auto m = make({ "/a/{x}", "/a/b" });
            BOOST_TEST_EQ(which(m, "/a/b"), 1);
            BOOST_TEST_EQ(which(m, "/a/c"), 0);
        }

        // capture beats wildcard
        {
            auto m = make({ "/a/{*rest}", "/a/{x}", "/{*all}" });
            BOOST_TEST_EQ(which(m, "/a/b"), 1);
            BOOST_TEST_EQ(which(m, "/a/b/c"), 0);
            BOOST_TEST_EQ(which(m, "/z"), 2);
        }

        // same tier: first in file order
        {
            auto m = make({ "/{x}/b", "/a/{y}" });
            BOOST_TEST_EQ(which(m, "/a/b"), 0);
        }
        {
            auto m = make({ "/a/{y}", "/{x}/b" });
            BOOST_TEST_EQ(which(m, "/a/b"), 0);
        }
        {
            auto m = make({ "/{*a}", "/x/{*b}" });
            BOOST_TEST_EQ(which(m, "/x/y"), 0);
        }

        // identical patterns: first declared wins
        {
            auto m = make({ "/dup", "/dup" });
            BOOST_TEST_EQ(which(m, "/dup"), 0);
        }
    }

    void
    testNoMatch()
    {
        auto m = make({ "/only" });
        BOOST_TEST(! m.match("/other"));
        BOOST_TEST(! m.match("/"));
        BOOST_TEST(! m.match("/only/more"));

        basic_matcher<rule> empty;
        BOOST_TEST(empty.empty());
        BOOST_TEST(! empty.match("/"));
    }

    void
    testWinnerBindings()
    {
        // bindings come from the winning rule only
        auto m = make({ "/{*rest}", "/{a}/{b}" });
        auto mr = m.match("/x/y");
        if(! BOOST_TEST(mr))
            return;
        BOOST_TEST_EQ(mr->index, 1u);
        BOOST_TEST_EQ(mr->params.size(), 2u);
        BOOST_TEST(! mr->params.contains("rest"));
        BOOST_TEST_EQ(*mr->params.find("b"), "y");
    }

    void
    testMove()
    {
        auto m0 = make({ "/{x}", "/a" });
        auto m1 = std::move(m0);
        BOOST_TEST_EQ(m1.size(), 2u);
        BOOST_TEST_EQ(which(m1, "/a"), 1);
        BOOST_TEST_EQ(which(m1, "/b"), 0);
        BOOST_TEST_EQ(m1.rules()[1].id, 1);
    }

    void
    run()
    {
        testSplit();
        testStructural();
        testBindings();
        testSpecificity();
        testNoMatch();
        testWinnerBindings();
        testMove();
    }
};

} // pathrules

int
main()
{
    pathrules::matcher_test{}.run();
    return boost::report_errors();
}
