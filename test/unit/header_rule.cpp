//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathrules/header_rule.hpp>

#include "test_helpers.hpp"

namespace pathrules {

struct header_rule_test
{
    static
    void
    bad(
        core::string_view text,
        error e,
        std::size_t line0)
    {
        std::size_t line = 0;
        auto rv = parse_headers(text, line);
        if(! BOOST_TEST(rv.has_error()))
            return;
        BOOST_TEST(rv.error() == e);
        BOOST_TEST_EQ(line, line0);
    }

    void
    testParse()
    {
        auto const v = test::headers(
            "/example\n"
            "  X-Example-Header: example.org\n"
            "/subpath/{other}\n"
            "  X-Header-One: h1\n"
            "\tX-Header-Two:h2\n"
            "/wildcard/{*wildcard}\n"
            "  X-Header-A:   ha  \n"
            "  X-Header-B: hb\n");
        if(! BOOST_TEST_EQ(v.size(), 3u))
            return;

        BOOST_TEST(v[0].path == test::pat("/example"));
        BOOST_TEST_EQ(v[0].headers.size(), 1u);
        BOOST_TEST(v[0].headers[0] ==
            (header_field{ "X-Example-Header", "example.org" }));

        BOOST_TEST(v[1].path == test::pat("/subpath/{other}"));
        BOOST_TEST_EQ(v[1].headers.size(), 2u);
        BOOST_TEST(v[1].headers[1] ==
            (header_field{ "X-Header-Two", "h2" }));

        BOOST_TEST(v[2].path == test::pat("/wildcard/{*wildcard}"));
        BOOST_TEST_EQ(v[2].headers.size(), 2u);
        BOOST_TEST(v[2].headers[0] ==
            (header_field{ "X-Header-A", "ha" }));
    }

    void
    testValues()
    {
        // split on the first colon only
        auto const v = test::headers(
            "/a\n"
            "  Link: <https://example.com/style.css>; rel=preload\n"
            "  Content-Security-Policy: default-src 'self'\n"
            "  X-Empty:\n");
        if(! BOOST_TEST_EQ(v.size(), 1u))
            return;
        auto const& h = v[0].headers;
        if(! BOOST_TEST_EQ(h.size(), 3u))
            return;
        BOOST_TEST_EQ(h[0].value,
            "<https://example.com/style.css>; rel=preload");
        BOOST_TEST_EQ(h[1].value, "default-src 'self'");
        BOOST_TEST_EQ(h[2].name, "X-Empty");
        BOOST_TEST_EQ(h[2].value, "");
    }

    void
    testDuplicates()
    {
        // kept in file order
        auto const v = test::headers(
            "/a\n"
            "  X-A: 1\n"
            "  X-A: 2\n");
        if(! BOOST_TEST_EQ(v.size(), 1u))
            return;
        BOOST_TEST_EQ(v[0].headers.size(), 2u);
        BOOST_TEST_EQ(v[0].headers[1].value, "2");
    }

    void
    testLayout()
    {
        BOOST_TEST(test::headers("").empty());
        BOOST_TEST(test::headers("\n\n   \n\t\n").empty());

        // rule without headers
        {
            auto const v = test::headers("/a\n/b\n  X: 1\n");
            if(BOOST_TEST_EQ(v.size(), 2u))
            {
                BOOST_TEST(v[0].headers.empty());
                BOOST_TEST_EQ(v[1].headers.size(), 1u);
            }
        }

        // comments, blank lines, CRLF, missing final newline
        {
            auto const v = test::headers(
                "# cache policy\r\n"
                "\r\n"
                "/assets/{*file}\r\n"
                "  # immutable assets\r\n"
                "  Cache-Control: max-age=31536000\r\n"
                "\r\n"
                "/index.html\r\n"
                "  Cache-Control: no-cache");
            if(BOOST_TEST_EQ(v.size(), 2u))
            {
                BOOST_TEST_EQ(v[0].headers.size(), 1u);
                BOOST_TEST_EQ(v[0].headers[0].value, "max-age=31536000");
                BOOST_TEST_EQ(v[1].headers[0].value, "no-cache");
            }
        }

        // the pattern line is trimmed
        {
            auto const v = test::headers("/a/{b}   \n  X: 1\n");
            if(BOOST_TEST_EQ(v.size(), 1u))
                BOOST_TEST(v[0].path == test::pat("/a/{b}"));
        }
    }

    void
    testErrors()
    {
        bad("  X-A: 1\n", error::orphaned_header_line, 1);
        bad("\n\n\tX-A: 1\n/a\n", error::orphaned_header_line, 3);
        bad("/a\n  X-A 1\n", error::missing_header_colon, 2);
        bad("/a\n  : 1\n", error::invalid_header_name, 2);
        bad("/a\n  X A: 1\n", error::invalid_header_name, 2);
        bad("/a\n  X\x01: 1\n", error::invalid_header_name, 2);
        bad("/a\n  X: a\x7f" "b\n", error::invalid_header_value, 2);
        bad("/ok\n  X: 1\n/{*a}/b\n", error::wildcard_not_terminal, 3);
        bad("/{a}/{a}\n", error::duplicate_capture_name, 1);
        bad("/{a-b}\n", error::invalid_capture_name, 1);

        // conditions
        {
            auto rv = parse_headers("  X: 1");
            BOOST_TEST(rv.error() == condition::invalid_headers);
            BOOST_TEST(rv.error() != condition::invalid_redirects);
        }

        // line is reset on success
        std::size_t line = 99;
        BOOST_TEST(parse_headers("/a\n  X: 1\n", line).has_value());
        BOOST_TEST_EQ(line, 0u);
    }

    void
    run()
    {
        testParse();
        testValues();
        testDuplicates();
        testLayout();
        testErrors();
    }
};

} // pathrules

int
main()
{
    pathrules::header_rule_test{}.run();
    return boost::report_errors();
}
