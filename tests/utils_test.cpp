/*
 * Part of the HttpDispatch (HD) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpDispatch contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpDispatch (HD). See LICENSE for details.
 */
#include "hd/internal/utils.hpp"
#include "hd/http_response.hpp"
#include "hd/request.hpp"

#include <gtest/gtest.h>

#include <regex>

namespace hd {

TEST(UtilsTest, TrimInplace) {
    std::string s = " \t value \r\n";
    internal::trim_inplace(s);
    EXPECT_EQ(s, "value");
    std::string empty = "  \r\n";
    internal::trim_inplace(empty);
    EXPECT_EQ(empty, "");
}

TEST(UtilsTest, CaseHelpers) {
    EXPECT_EQ(internal::lower_copy("Content-TYPE"), "content-type");
    EXPECT_EQ(internal::upper_copy("post"), "POST");
    EXPECT_TRUE(internal::iequals("User-Agent", "user-agent"));
    EXPECT_FALSE(internal::iequals("User-Agent", "user-agents"));
    EXPECT_TRUE(internal::icontains("Application/JSON", "json"));
    EXPECT_FALSE(internal::icontains("image/png", "text"));
}

TEST(UtilsTest, ElapsedIsFormattedAsMilliseconds) {
    EXPECT_EQ(internal::format_elapsed_ms(0.012345), "12.345 ms");
    EXPECT_EQ(internal::format_elapsed_ms(0.0), "0.000 ms");
    EXPECT_EQ(internal::format_elapsed_ms(1.5), "1500.000 ms");
    EXPECT_EQ(internal::format_elapsed_ms(-1.0), "0.000 ms");
    const std::regex pattern(R"(\d+\.\d{3} ms)");
    EXPECT_TRUE(std::regex_match(internal::format_elapsed_ms(0.0004567), pattern));
}

TEST(RequestTest, HeadersMergeCaseInsensitively) {
    Request r("GET", "http://example.com/");
    r.add_header("Accept", "text/html").add_header("accept", "application/json");
    ASSERT_EQ(r.headers.size(), 1u);
    EXPECT_EQ(r.headers[0].first, "Accept");
    EXPECT_EQ(r.header_line("ACCEPT"), "text/html, application/json");
    EXPECT_TRUE(r.has_header("accept"));
    EXPECT_FALSE(r.has_header("User-Agent"));
    EXPECT_EQ(r.header_line("User-Agent"), "");
}

TEST(HttpResponseTest, DefaultFactory) {
    const HttpResponse r = make_response(404);
    EXPECT_EQ(r.status_code, 404);
    EXPECT_EQ(r.status_text, "Not Found");
    EXPECT_TRUE(r.headers.empty());
    EXPECT_TRUE(r.body.empty());
    EXPECT_EQ(make_response(0).status_text, "");
}

TEST(HttpResponseTest, HeaderLookupKeepsDuplicates) {
    HttpResponse r = make_response(200);
    r.add_header("set-cookie", "a=1").add_header("content-type", "text/html").add_header("set-cookie", "b=2");
    EXPECT_EQ(r.header("Set-Cookie"), "a=1");
    EXPECT_EQ(r.header_line("Set-Cookie"), "a=1, b=2");
    EXPECT_EQ(r.header_count("SET-COOKIE"), 2u);
    EXPECT_EQ(r.header("X-Missing"), "");
    EXPECT_EQ(r.headers[1].first, "content-type");
}

} // namespace hd
