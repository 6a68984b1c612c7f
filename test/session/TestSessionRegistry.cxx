/*
 * Unit tests for src/session/Registry.hxx
 */

#include "FakeControlPoint.hxx"
#include "session/Registry.hxx"
#include "session/QueueSession.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(SessionRegistry, PlayAndFinish)
{
	FakeControlPoint control_point;
	SessionRegistry registry(control_point);

	EXPECT_EQ(registry.GetSession("uuid:living"), nullptr);
	EXPECT_EQ(control_point.n_open, 0u);

	auto session = registry.PlayTracks(MakeTestRenderer(false),
					   MakeTestTracks(1));
	ASSERT_NE(session, nullptr);
	EXPECT_EQ(registry.GetSession("uuid:living"), session);
	EXPECT_EQ(registry.GetAllSessions().size(), 1u);
	EXPECT_EQ(control_point.n_open, 1u);
	EXPECT_TRUE(control_point.is_open);

	/* the queue ends: the session is removed and the control
	   point is closed */
	control_point.renderer_state->Emit(TransportState::STOPPED);
	EXPECT_EQ(registry.GetSession("uuid:living"), nullptr);
	EXPECT_TRUE(registry.GetAllSessions().empty());
	EXPECT_EQ(control_point.n_close, 1u);
	EXPECT_FALSE(control_point.is_open);
}

TEST(SessionRegistry, Replace)
{
	FakeControlPoint control_point;
	SessionRegistry registry(control_point);

	auto first = registry.PlayTracks(MakeTestRenderer(true),
					 MakeTestTracks(3));
	control_point.renderer_state->ClearCalls();

	auto second = registry.PlayTracks(MakeTestRenderer(true),
					  MakeTestTracks(2));
	ASSERT_NE(second, nullptr);
	EXPECT_NE(first, second);

	EXPECT_FALSE(first->GetStatus().playing);
	EXPECT_TRUE(second->GetStatus().playing);
	EXPECT_EQ(registry.GetSession("uuid:living"), second);
	EXPECT_EQ(registry.GetAllSessions().size(), 1u);

	EXPECT_EQ(control_point.renderer_state->GetCalls(),
		  (std::vector<std::string>{
			  "Stop",
			  "Unsubscribe",
			  "Subscribe",
			  "SetTransportUri http://music/1.flac",
			  "Play",
			  "SetNextTransportUri http://music/2.flac",
		  }));

	/* a late Stop() on the replaced session must not remove the
	   new one */
	first->Stop();
	EXPECT_EQ(registry.GetSession("uuid:living"), second);
	EXPECT_TRUE(control_point.is_open);
}

TEST(SessionRegistry, StopReleasesControlPoint)
{
	FakeControlPoint control_point;
	SessionRegistry registry(control_point);

	auto session = registry.PlayTracks(MakeTestRenderer(true),
					   MakeTestTracks(2));
	session->Stop();

	EXPECT_EQ(registry.GetSession("uuid:living"), nullptr);
	EXPECT_EQ(control_point.n_open, 1u);
	EXPECT_EQ(control_point.n_close, 1u);

	/* the next PlayTracks() opens it again */
	registry.PlayTracks(MakeTestRenderer(true), MakeTestTracks(2));
	EXPECT_EQ(control_point.n_open, 2u);
	EXPECT_TRUE(control_point.is_open);

	registry.StopAll();
	EXPECT_TRUE(registry.GetAllSessions().empty());
	EXPECT_EQ(control_point.n_close, 2u);
}

TEST(SessionRegistry, StartFailure)
{
	FakeControlPoint control_point;
	SessionRegistry registry(control_point);

	control_point.renderer_state->failing.insert("SetTransportUri");

	EXPECT_THROW(registry.PlayTracks(MakeTestRenderer(true),
					 MakeTestTracks(2)),
		     std::runtime_error);
	EXPECT_EQ(registry.GetSession("uuid:living"), nullptr);
	EXPECT_EQ(control_point.n_open, 1u);
	EXPECT_EQ(control_point.n_close, 1u);
}

TEST(SessionRegistry, InvalidTracks)
{
	FakeControlPoint control_point;
	SessionRegistry registry(control_point);

	EXPECT_THROW(registry.PlayTracks(MakeTestRenderer(true), {}),
		     std::invalid_argument);
	EXPECT_EQ(registry.GetSession("uuid:living"), nullptr);
	EXPECT_FALSE(control_point.is_open);
}

TEST(SessionRegistry, DestructorStopsSessions)
{
	FakeControlPoint control_point;

	{
		SessionRegistry registry(control_point);
		registry.PlayTracks(MakeTestRenderer(false), MakeTestTracks(2));
		control_point.renderer_state->ClearCalls();
	}

	EXPECT_EQ(control_point.renderer_state->GetCalls(),
		  (std::vector<std::string>{"Stop", "Unsubscribe"}));
	EXPECT_FALSE(control_point.is_open);
}
