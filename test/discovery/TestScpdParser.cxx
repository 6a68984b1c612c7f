/*
 * Unit tests for src/discovery/ScpdParser.hxx
 */

#include "SampleDocuments.hxx"
#include "discovery/ScpdParser.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ScpdParser, Actions)
{
	const auto actions = ParseScpdActions(MakeAVTransportScpd(true));
	EXPECT_EQ(actions.size(), 4u);
	EXPECT_TRUE(actions.contains("SetAVTransportURI"));
	EXPECT_TRUE(actions.contains("Play"));
	EXPECT_TRUE(actions.contains("Stop"));
	EXPECT_TRUE(actions.contains(SET_NEXT_AV_TRANSPORT_URI));

	/* argument and state variable names are not actions */
	EXPECT_FALSE(actions.contains("InstanceID"));
	EXPECT_FALSE(actions.contains("NextURI"));
	EXPECT_FALSE(actions.contains("TransportState"));
}

TEST(ScpdParser, NoNext)
{
	const auto actions = ParseScpdActions(MakeAVTransportScpd(false));
	EXPECT_FALSE(actions.contains(SET_NEXT_AV_TRANSPORT_URI));
	EXPECT_TRUE(actions.contains("SetAVTransportURI"));
}

TEST(ScpdParser, Empty)
{
	EXPECT_TRUE(ParseScpdActions("<scpd><actionList/></scpd>").empty());
	EXPECT_TRUE(ParseScpdActions("<scpd/>").empty());
}

TEST(ScpdParser, Malformed)
{
	EXPECT_THROW(ParseScpdActions("<scpd><actionList>"), std::runtime_error);
	EXPECT_THROW(ParseScpdActions(""), std::runtime_error);
}
