/*
 * Unit tests for src/discovery/DiscoveryEngine.hxx
 */

#include "FakeDiscovery.hxx"
#include "SampleDocuments.hxx"
#include "discovery/DiscoveryEngine.hxx"

#include <gtest/gtest.h>

#include <algorithm>

using namespace std::chrono_literals;

class DiscoveryEngineTest : public ::testing::Test {
protected:
	FakeSearch search;
	FakeFetcher fetcher;

	/**
	 * Register a renderer at "http://{host}/desc.xml".
	 */
	void AddRenderer(std::string_view host, std::string_view name,
			 std::string_view udn, bool gapless) {
		const std::string origin = "http://" + std::string{host};
		const std::string location = origin + "/desc.xml";

		search.locations.push_back(location);
		fetcher.documents[location] = MakeDeviceDescription(name, udn);
		fetcher.documents[origin + "/AVTransport/scpd.xml"] =
			MakeAVTransportScpd(gapless);
	}

	static DiscoveryConfig MakeConfig(std::chrono::steady_clock::duration ttl=300s) {
		DiscoveryConfig config;
		config.search_timeout = 1s;
		config.cache_ttl = ttl;
		config.http_timeout = 1s;
		return config;
	}
};

TEST_F(DiscoveryEngineTest, Basic)
{
	AddRenderer("10.0.0.1:49152", "Living Room", "uuid:living", true);
	AddRenderer("10.0.0.2", "Kitchen", "uuid:kitchen", false);

	DiscoveryEngine engine(search, fetcher, MakeConfig());
	const auto list = engine.Discover();
	ASSERT_NE(list, nullptr);
	ASSERT_EQ(list->size(), 2u);

	const auto &living = (*list)[0];
	EXPECT_EQ(living.name, "Living Room");
	EXPECT_EQ(living.identity, "uuid:living");
	EXPECT_EQ(living.description_location, "http://10.0.0.1:49152/desc.xml");
	EXPECT_EQ(living.transport_control_url,
		  "http://10.0.0.1:49152/AVTransport/control");
	EXPECT_TRUE(living.supports_gapless_preload);

	const auto &kitchen = (*list)[1];
	EXPECT_EQ(kitchen.name, "Kitchen");
	EXPECT_FALSE(kitchen.supports_gapless_preload);

	/* one batch of descriptions, one batch of SCPDs */
	EXPECT_EQ(search.n_searches, 1u);
	EXPECT_EQ(fetcher.n_calls, 2u);
}

TEST_F(DiscoveryEngineTest, Cache)
{
	AddRenderer("10.0.0.1", "Living Room", "uuid:living", true);

	DiscoveryEngine engine(search, fetcher, MakeConfig());
	const auto a = engine.Discover();
	const auto b = engine.Discover();
	EXPECT_EQ(a, b);
	EXPECT_EQ(search.n_searches, 1u);

	ASSERT_TRUE(engine.Resolve("living"));
	EXPECT_EQ(search.n_searches, 1u);

	const auto c = engine.Discover(true);
	EXPECT_NE(a, c);
	EXPECT_EQ(search.n_searches, 2u);
	EXPECT_EQ(c->size(), 1u);
}

TEST_F(DiscoveryEngineTest, Expired)
{
	AddRenderer("10.0.0.1", "Living Room", "uuid:living", true);

	DiscoveryEngine engine(search, fetcher, MakeConfig(0s));
	engine.Discover();
	engine.Discover();
	EXPECT_EQ(search.n_searches, 2u);
}

TEST_F(DiscoveryEngineTest, EmptyIsCached)
{
	DiscoveryEngine engine(search, fetcher, MakeConfig());
	EXPECT_TRUE(engine.Discover()->empty());
	EXPECT_FALSE(engine.Resolve("anything"));
	EXPECT_EQ(search.n_searches, 1u);
}

TEST_F(DiscoveryEngineTest, FailuresAreSkipped)
{
	AddRenderer("10.0.0.1", "Good", "uuid:good", true);

	/* description can't be fetched */
	search.locations.push_back("http://10.0.0.2/desc.xml");

	/* malformed description */
	search.locations.push_back("http://10.0.0.3/desc.xml");
	fetcher.documents["http://10.0.0.3/desc.xml"] = "<root><device>";

	/* no AVTransport service */
	search.locations.push_back("http://10.0.0.4/desc.xml");
	fetcher.documents["http://10.0.0.4/desc.xml"] =
		MakeDeviceDescription("TV", "uuid:tv", false);

	/* SCPD can't be fetched: usable, but not gapless */
	search.locations.push_back("http://10.0.0.5/desc.xml");
	fetcher.documents["http://10.0.0.5/desc.xml"] =
		MakeDeviceDescription("Bedroom", "uuid:bedroom");

	DiscoveryEngine engine(search, fetcher, MakeConfig());
	const auto list = engine.Discover();
	ASSERT_EQ(list->size(), 2u);
	EXPECT_EQ((*list)[0].name, "Good");
	EXPECT_TRUE((*list)[0].supports_gapless_preload);
	EXPECT_EQ((*list)[1].name, "Bedroom");
	EXPECT_FALSE((*list)[1].supports_gapless_preload);

	/* the device without AVTransport has no SCPD request */
	EXPECT_EQ(std::count(fetcher.requests.begin(), fetcher.requests.end(),
			     "http://10.0.0.4/AVTransport/scpd.xml"),
		  0);
}

TEST_F(DiscoveryEngineTest, Resolve)
{
	AddRenderer("10.0.0.1", "Living Room Speaker", "uuid:speaker", true);
	AddRenderer("10.0.0.2", "Living Room", "uuid:living", false);
	AddRenderer("10.0.0.3", "Kitchen", "uuid:kitchen", false);

	DiscoveryEngine engine(search, fetcher, MakeConfig());

	/* exact match wins over an earlier substring match */
	auto r = engine.Resolve("living room");
	ASSERT_TRUE(r);
	EXPECT_EQ(r->identity, "uuid:living");

	/* substring match, first in list order */
	r = engine.Resolve("LIVING");
	ASSERT_TRUE(r);
	EXPECT_EQ(r->identity, "uuid:speaker");

	r = engine.Resolve("itch");
	ASSERT_TRUE(r);
	EXPECT_EQ(r->identity, "uuid:kitchen");

	EXPECT_FALSE(engine.Resolve("Garage"));
}

TEST(FindRenderer, Basic)
{
	RendererList list(2);
	list[0].name = "Büro Player";
	list[1].name = "Office";

	EXPECT_EQ(FindRenderer(list, "office"), &list[1]);
	EXPECT_EQ(FindRenderer(list, "Player"), &list[0]);
	EXPECT_EQ(FindRenderer(list, "garage"), nullptr);
	EXPECT_EQ(FindRenderer({}, "office"), nullptr);
}
