/*
 * Unit tests for src/session/QueueSession.hxx
 */

#include "FakeControlPoint.hxx"
#include "session/QueueSession.hxx"
#include "session/Listener.hxx"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <thread>

using Calls = std::vector<std::string>;

namespace {

class CountingListener final : public QueueSessionListener {
public:
	unsigned n_finished = 0;

	void OnSessionFinished(QueueSession &) noexcept override {
		++n_finished;
	}
};

class QueueSessionTest : public ::testing::Test {
protected:
	std::shared_ptr<FakeRendererState> state =
		std::make_shared<FakeRendererState>();

	CountingListener listener;

	std::shared_ptr<QueueSession> MakeSession(const RendererRecord &renderer,
						  unsigned n_tracks) {
		return std::make_shared<QueueSession>(renderer,
						      MakeTestTracks(n_tracks),
						      std::make_unique<FakeAVControlPort>(state),
						      listener);
	}
};

} // anonymous namespace

TEST_F(QueueSessionTest, GaplessQueue)
{
	auto session = MakeSession(MakeTestRenderer(true), 3);
	session->Start();

	EXPECT_EQ(state->GetCalls(), (Calls{
		"Subscribe",
		"SetTransportUri http://music/1.flac",
		"Play",
		"SetNextTransportUri http://music/2.flac",
	}));
	EXPECT_EQ(session->GetPreloadedPosition(), 1u);
	state->ClearCalls();

	/* events which don't mention the preloaded track change
	   nothing */
	state->Emit(TransportState::PLAYING, "http://music/1.flac");
	state->Emit(TransportState::TRANSITIONING);
	EXPECT_TRUE(state->GetCalls().empty());
	EXPECT_EQ(session->GetStatus().track, 1u);

	/* the renderer has switched to track 2 on its own */
	state->Emit(TransportState::PLAYING, "http://music/2.flac");
	EXPECT_EQ(state->GetCalls(), (Calls{
		"SetNextTransportUri http://music/3.flac",
	}));
	EXPECT_EQ(session->GetPreloadedPosition(), 2u);

	auto status = session->GetStatus();
	EXPECT_TRUE(status.playing);
	EXPECT_EQ(status.track, 2u);
	EXPECT_EQ(status.total_tracks, 3u);
	EXPECT_EQ(status.title, "Track 2");
	state->ClearCalls();

	state->Emit(TransportState::PLAYING, "http://music/3.flac");
	EXPECT_TRUE(state->GetCalls().empty());
	EXPECT_FALSE(session->GetPreloadedPosition());
	EXPECT_EQ(session->GetStatus().track, 3u);
	EXPECT_EQ(listener.n_finished, 0u);

	/* end of the last track */
	state->Emit(TransportState::STOPPED, "http://music/3.flac");
	EXPECT_EQ(state->GetCalls(), (Calls{"Unsubscribe"}));
	EXPECT_EQ(listener.n_finished, 1u);

	status = session->GetStatus();
	EXPECT_FALSE(status.playing);
	EXPECT_EQ(status.track, 3u);
}

TEST_F(QueueSessionTest, AutoAdvance)
{
	auto session = MakeSession(MakeTestRenderer(false), 2);
	session->Start();

	EXPECT_EQ(state->GetCalls(), (Calls{
		"Subscribe",
		"SetTransportUri http://music/1.flac",
		"Play",
	}));
	EXPECT_FALSE(session->GetPreloadedPosition());
	state->ClearCalls();

	state->Emit(TransportState::STOPPED);
	EXPECT_EQ(state->GetCalls(), (Calls{
		"SetTransportUri http://music/2.flac",
		"Play",
	}));
	EXPECT_EQ(session->GetStatus().track, 2u);
	EXPECT_EQ(listener.n_finished, 0u);
	state->ClearCalls();

	state->Emit(TransportState::PLAYING, "http://music/2.flac");
	EXPECT_TRUE(state->GetCalls().empty());

	state->Emit(TransportState::STOPPED);
	EXPECT_EQ(state->GetCalls(), (Calls{"Unsubscribe"}));
	EXPECT_EQ(listener.n_finished, 1u);
	EXPECT_FALSE(session->GetStatus().playing);
}

TEST_F(QueueSessionTest, StoppedOnPreloadedTrack)
{
	auto session = MakeSession(MakeTestRenderer(true), 2);
	session->Start();
	EXPECT_EQ(session->GetPreloadedPosition(), 1u);
	state->ClearCalls();

	/* the renderer reports STOPPED while already pointing at the
	   preloaded track: this is a transition, not the end */
	state->Emit(TransportState::STOPPED, "http://music/2.flac");
	EXPECT_TRUE(state->GetCalls().empty());
	EXPECT_FALSE(session->GetPreloadedPosition());
	EXPECT_EQ(listener.n_finished, 0u);

	auto status = session->GetStatus();
	EXPECT_TRUE(status.playing);
	EXPECT_EQ(status.track, 2u);
	EXPECT_EQ(status.title, "Track 2");

	/* now the last track really ends */
	state->Emit(TransportState::STOPPED, "http://music/2.flac");
	EXPECT_EQ(state->GetCalls(), (Calls{"Unsubscribe"}));
	EXPECT_EQ(listener.n_finished, 1u);
}

TEST_F(QueueSessionTest, SingleTrack)
{
	auto session = MakeSession(MakeTestRenderer(true), 1);
	session->Start();

	EXPECT_EQ(state->GetCalls(), (Calls{
		"Subscribe",
		"SetTransportUri http://music/1.flac",
		"Play",
	}));

	state->Emit(TransportState::STOPPED);
	EXPECT_EQ(listener.n_finished, 1u);

	/* late events after the end are ignored */
	state->ClearCalls();
	state->Emit(TransportState::STOPPED);
	EXPECT_TRUE(state->GetCalls().empty());
	EXPECT_EQ(listener.n_finished, 1u);
}

TEST_F(QueueSessionTest, Skip)
{
	auto session = MakeSession(MakeTestRenderer(true), 3);
	session->Start();
	state->ClearCalls();

	EXPECT_FALSE(session->SkipPrevious());
	EXPECT_TRUE(state->GetCalls().empty());

	auto track = session->SkipNext();
	ASSERT_TRUE(track);
	EXPECT_EQ(track->title, "Track 2");
	EXPECT_EQ(state->GetCalls(), (Calls{
		"SetTransportUri http://music/2.flac",
		"Play",
		"SetNextTransportUri http://music/3.flac",
	}));
	state->ClearCalls();

	track = session->SkipNext();
	ASSERT_TRUE(track);
	EXPECT_EQ(track->title, "Track 3");
	EXPECT_EQ(state->GetCalls(), (Calls{
		"SetTransportUri http://music/3.flac",
		"Play",
	}));
	EXPECT_FALSE(session->GetPreloadedPosition());
	state->ClearCalls();

	EXPECT_FALSE(session->SkipNext());
	EXPECT_TRUE(state->GetCalls().empty());
	EXPECT_EQ(session->GetStatus().track, 3u);

	track = session->SkipPrevious();
	ASSERT_TRUE(track);
	EXPECT_EQ(track->title, "Track 2");
	EXPECT_EQ(session->GetStatus().track, 2u);
	EXPECT_EQ(session->GetPreloadedPosition(), 2u);
}

TEST_F(QueueSessionTest, EventDuringCommand)
{
	auto session = MakeSession(MakeTestRenderer(true), 4);
	session->Start();
	state->ClearCalls();

	{
		const std::scoped_lock lock{state->mutex};
		state->blocking = "SetTransportUri";
	}

	std::optional<Track> track;
	std::thread command([&]{ track = session->SkipNext(); });

	/* the command holds the session lock while it waits for the
	   renderer; an event arriving now must be deferred, not
	   dropped */
	state->WaitBlocked();
	state->Emit(TransportState::PLAYING, "http://music/3.flac");

	state->Unblock();
	command.join();

	ASSERT_TRUE(track);
	EXPECT_EQ(track->title, "Track 2");

	EXPECT_EQ(state->GetCalls(), (Calls{
		"SetTransportUri http://music/2.flac",
		"Play",
		"SetNextTransportUri http://music/3.flac",
		"SetNextTransportUri http://music/4.flac",
	}));
	EXPECT_EQ(session->GetStatus().track, 3u);
	EXPECT_EQ(session->GetPreloadedPosition(), 3u);
	EXPECT_EQ(listener.n_finished, 0u);
}

TEST_F(QueueSessionTest, Volume)
{
	auto session = MakeSession(MakeTestRenderer(true), 1);
	session->Start();

	session->SetVolume(42);
	EXPECT_DOUBLE_EQ(state->volume, 0.42);

	session->SetVolume(150);
	EXPECT_DOUBLE_EQ(state->volume, 1.0);

	session->SetVolume(-5);
	EXPECT_DOUBLE_EQ(state->volume, 0.0);
}

TEST_F(QueueSessionTest, NoRenderingControl)
{
	auto session = MakeSession(MakeTestRenderer(true, false), 1);
	session->Start();
	state->ClearCalls();

	EXPECT_THROW(session->SetVolume(50), std::runtime_error);
	EXPECT_TRUE(state->GetCalls().empty());
}

TEST_F(QueueSessionTest, PauseResume)
{
	auto session = MakeSession(MakeTestRenderer(false), 2);
	session->Start();
	state->ClearCalls();

	session->Pause();
	session->Resume();
	EXPECT_EQ(state->GetCalls(), (Calls{"Pause", "Play"}));

	state->failing.insert("Pause");
	EXPECT_THROW(session->Pause(), std::runtime_error);

	/* the session survives a failed command */
	EXPECT_TRUE(session->GetStatus().playing);
}

TEST_F(QueueSessionTest, Stop)
{
	auto session = MakeSession(MakeTestRenderer(true), 3);
	session->Start();
	state->ClearCalls();

	session->Stop();
	EXPECT_EQ(state->GetCalls(), (Calls{"Stop", "Unsubscribe"}));
	EXPECT_EQ(listener.n_finished, 1u);
	EXPECT_FALSE(state->IsSubscribed());
	EXPECT_FALSE(session->GetStatus().playing);
	EXPECT_FALSE(session->GetPreloadedPosition());

	/* stopping again is harmless */
	state->ClearCalls();
	session->Stop();
	EXPECT_TRUE(state->GetCalls().empty());

	EXPECT_THROW(session->SkipNext(), std::runtime_error);
	EXPECT_THROW(session->Pause(), std::runtime_error);
	EXPECT_THROW(session->Resume(), std::runtime_error);
	EXPECT_THROW(session->SetVolume(10), std::runtime_error);
}

TEST_F(QueueSessionTest, StopErrorsIgnored)
{
	auto session = MakeSession(MakeTestRenderer(true), 1);
	session->Start();

	state->failing.insert("Stop");
	state->failing.insert("Unsubscribe");
	session->Stop();
	EXPECT_EQ(listener.n_finished, 1u);
	EXPECT_FALSE(session->GetStatus().playing);
}

TEST_F(QueueSessionTest, StartFailure)
{
	state->failing.insert("Play");

	auto session = MakeSession(MakeTestRenderer(true), 2);
	EXPECT_THROW(session->Start(), std::runtime_error);

	EXPECT_EQ(state->GetCalls(), (Calls{
		"Subscribe",
		"SetTransportUri http://music/1.flac",
		"Play",
		"Unsubscribe",
	}));
	EXPECT_EQ(listener.n_finished, 1u);
	EXPECT_FALSE(session->GetStatus().playing);
}

TEST_F(QueueSessionTest, PreloadFailure)
{
	state->failing.insert("SetNextTransportUri");

	auto session = MakeSession(MakeTestRenderer(true), 2);
	session->Start();

	EXPECT_TRUE(session->GetStatus().playing);
	EXPECT_FALSE(session->GetPreloadedPosition());
	EXPECT_EQ(listener.n_finished, 0u);
}

TEST(QueueSession, InvalidTracks)
{
	CountingListener listener;
	auto state = std::make_shared<FakeRendererState>();

	EXPECT_THROW(std::make_shared<QueueSession>(MakeTestRenderer(true),
						    std::vector<Track>{},
						    std::make_unique<FakeAVControlPort>(state),
						    listener),
		     std::invalid_argument);
}
