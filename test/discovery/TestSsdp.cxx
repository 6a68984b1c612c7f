/*
 * Unit tests for src/discovery/Ssdp.hxx and src/discovery/SsdpSearch.hxx
 */

#include "discovery/Ssdp.hxx"
#include "discovery/SsdpSearch.hxx"

#include <gtest/gtest.h>

#include <chrono>

using std::string_view_literals::operator""sv;

TEST(Ssdp, SearchRequest)
{
	EXPECT_EQ(BuildSsdpSearchRequest(MEDIA_RENDERER_DEVICE_TYPE),
		  "M-SEARCH * HTTP/1.1\r\n"
		  "HOST: 239.255.255.250:1900\r\n"
		  "MAN: \"ssdp:discover\"\r\n"
		  "MX: 3\r\n"
		  "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
		  "\r\n");
}

TEST(Ssdp, Location)
{
	EXPECT_EQ(ParseSsdpLocation("HTTP/1.1 200 OK\r\n"
				    "CACHE-CONTROL: max-age=1800\r\n"
				    "LOCATION: http://192.168.1.20:49152/description.xml\r\n"
				    "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
				    "\r\n"),
		  "http://192.168.1.20:49152/description.xml"sv);

	/* header names are case-insensitive */
	EXPECT_EQ(ParseSsdpLocation("HTTP/1.1 200 OK\r\n"
				    "Location:http://10.0.0.5/dd.xml\r\n"),
		  "http://10.0.0.5/dd.xml"sv);
	EXPECT_EQ(ParseSsdpLocation("HTTP/1.1 200 OK\n"
				    "location:   http://10.0.0.5/dd.xml"),
		  "http://10.0.0.5/dd.xml"sv);
}

TEST(Ssdp, NoLocation)
{
	EXPECT_EQ(ParseSsdpLocation(""), ""sv);
	EXPECT_EQ(ParseSsdpLocation("HTTP/1.1 200 OK\r\n"
				    "ST: upnp:rootdevice\r\n"
				    "\r\n"),
		  ""sv);

	/* must be at the start of a line */
	EXPECT_EQ(ParseSsdpLocation("HTTP/1.1 200 OK\r\n"
				    "X-LOCATION: http://10.0.0.5/dd.xml\r\n"),
		  ""sv);
}

TEST(SsdpSearch, Deadline)
{
	using namespace std::chrono_literals;

	/* whether or not there are renderers on this network (or a
	   network at all), the search ends on time */
	SsdpSearch search;
	const auto start = std::chrono::steady_clock::now();
	const auto locations = search.Search(700ms);
	const auto duration = std::chrono::steady_clock::now() - start;

	EXPECT_LT(duration, 1200ms);

	for (const auto &i : locations)
		EXPECT_FALSE(i.empty());
}
