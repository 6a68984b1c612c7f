/*
 * Unit tests for src/util/UriRelative.hxx and src/util/UriExtract.hxx
 */

#include "util/UriRelative.hxx"
#include "util/UriExtract.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(UriExtract, Scheme)
{
	EXPECT_EQ(uri_get_scheme("http://10.0.0.5:8080/desc.xml"), "http"sv);
	EXPECT_EQ(uri_get_scheme("https://host/"), "https"sv);
	EXPECT_EQ(uri_get_scheme("/desc.xml"), ""sv);
	EXPECT_EQ(uri_get_scheme("desc.xml"), ""sv);
	EXPECT_EQ(uri_get_scheme("HTTP://host/"), ""sv);

	EXPECT_TRUE(uri_has_scheme("http://host"));
	EXPECT_FALSE(uri_has_scheme("/ctl/AVTransport"));
}

TEST(UriExtract, Origin)
{
	EXPECT_EQ(uri_get_origin("http://10.0.0.5:8080/desc.xml"),
		  "http://10.0.0.5:8080"sv);
	EXPECT_EQ(uri_get_origin("http://10.0.0.5:8080"),
		  "http://10.0.0.5:8080"sv);
	EXPECT_EQ(uri_get_origin("http://host?x=1"), "http://host"sv);
	EXPECT_EQ(uri_get_origin("/desc.xml"), ""sv);
}

TEST(UriRelative, ApplyOrigin)
{
	static constexpr struct {
		const char *uri;
		const char *origin;
		const char *result;
	} tests[] = {
		{ "/ctl/AVTransport", "http://10.0.0.5:8080", "http://10.0.0.5:8080/ctl/AVTransport" },
		{ "ctl/AVTransport", "http://10.0.0.5:8080", "http://10.0.0.5:8080/ctl/AVTransport" },
		{ "/ctl", "http://host/", "http://host/ctl" },
		{ "ctl", "http://host/", "http://host/ctl" },
		{ "http://other:1234/ctl", "http://host", "http://other:1234/ctl" },
		{ "", "http://host", "" },
	};

	for (const auto &i : tests)
		EXPECT_EQ(uri_apply_origin(i.uri, i.origin), i.result);
}
