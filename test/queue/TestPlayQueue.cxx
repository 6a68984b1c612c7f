/*
 * Unit tests for src/queue/PlayQueue.hxx
 */

#include "queue/PlayQueue.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

static std::vector<Track>
MakeTracks(unsigned n)
{
	std::vector<Track> tracks(n);
	for (unsigned i = 0; i < n; ++i)
		tracks[i].url = "http://music/" + std::to_string(i);
	return tracks;
}

TEST(PlayQueue, Invalid)
{
	EXPECT_THROW(PlayQueue{std::vector<Track>{}}, std::invalid_argument);

	auto tracks = MakeTracks(2);
	tracks[1].url.clear();
	EXPECT_THROW(PlayQueue{std::move(tracks)}, std::invalid_argument);
}

TEST(PlayQueue, Single)
{
	PlayQueue queue(MakeTracks(1));
	EXPECT_EQ(queue.GetLength(), 1u);
	EXPECT_EQ(queue.GetCurrentPosition(), 0u);
	EXPECT_TRUE(queue.IsLast());
	EXPECT_FALSE(queue.HasNext());
	EXPECT_FALSE(queue.HasPrevious());
	EXPECT_FALSE(queue.HasPreloaded());
	EXPECT_EQ(queue.GetCurrent().mime_type, DEFAULT_TRACK_MIME_TYPE);
}

TEST(PlayQueue, Preload)
{
	PlayQueue queue(MakeTracks(3));
	EXPECT_TRUE(queue.HasNext());
	EXPECT_FALSE(queue.IsPreloadedUri("http://music/1"));

	queue.SetPreloaded();
	ASSERT_TRUE(queue.HasPreloaded());
	EXPECT_EQ(*queue.GetPreloaded(), 1u);
	EXPECT_TRUE(queue.IsPreloadedUri("http://music/1"));
	EXPECT_FALSE(queue.IsPreloadedUri("http://music/0"));
	EXPECT_FALSE(queue.IsPreloadedUri(""));

	queue.AdvanceToPreloaded();
	EXPECT_EQ(queue.GetCurrentPosition(), 1u);
	EXPECT_FALSE(queue.HasPreloaded());
	EXPECT_TRUE(queue.HasPrevious());

	queue.SetPreloaded();
	EXPECT_EQ(*queue.GetPreloaded(), 2u);
	queue.ClearPreloaded();
	EXPECT_FALSE(queue.HasPreloaded());
}

TEST(PlayQueue, MoveTo)
{
	PlayQueue queue(MakeTracks(3));
	queue.SetPreloaded();

	queue.MoveTo(2);
	EXPECT_EQ(queue.GetCurrentPosition(), 2u);
	EXPECT_EQ(queue.GetCurrent().url, "http://music/2");
	EXPECT_TRUE(queue.IsLast());
	EXPECT_FALSE(queue.HasPreloaded());

	queue.MoveTo(0);
	EXPECT_FALSE(queue.HasPrevious());
	EXPECT_EQ(queue.Get(1).url, "http://music/1");
}
