// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_PLAY_QUEUE_HXX
#define DLNAQ_PLAY_QUEUE_HXX

#include "Track.hxx"

#include <cassert>
#include <optional>
#include <string_view>
#include <vector>

/**
 * The fixed list of tracks played by one session, the current
 * position and the position of the track which was handed to the
 * renderer as "next" (the preload).
 *
 * The preloaded position, if any, is always the current position
 * plus one.
 */
class PlayQueue {
	std::vector<Track> tracks;

	unsigned current = 0;

	std::optional<unsigned> preloaded;

public:
	/**
	 * Throws std::invalid_argument if the list is empty or a
	 * track has no URL.
	 */
	explicit PlayQueue(std::vector<Track> &&_tracks);

	unsigned GetLength() const noexcept {
		return tracks.size();
	}

	unsigned GetCurrentPosition() const noexcept {
		return current;
	}

	const Track &GetCurrent() const noexcept {
		return tracks[current];
	}

	const Track &Get(unsigned position) const noexcept {
		assert(position < tracks.size());

		return tracks[position];
	}

	bool IsLast() const noexcept {
		return current + 1 >= tracks.size();
	}

	bool HasNext() const noexcept {
		return !IsLast();
	}

	bool HasPrevious() const noexcept {
		return current > 0;
	}

	const std::optional<unsigned> &GetPreloaded() const noexcept {
		return preloaded;
	}

	bool HasPreloaded() const noexcept {
		return preloaded.has_value();
	}

	/**
	 * Is the given URI the one of the preloaded track?
	 */
	[[gnu::pure]]
	bool IsPreloadedUri(std::string_view uri) const noexcept;

	/**
	 * Record that the track after the current one was handed to
	 * the renderer.
	 */
	void SetPreloaded() noexcept {
		assert(HasNext());

		preloaded = current + 1;
	}

	void ClearPreloaded() noexcept {
		preloaded.reset();
	}

	/**
	 * The renderer has started playing the preloaded track:
	 * make it the current one and clear the preload.
	 */
	void AdvanceToPreloaded() noexcept {
		assert(preloaded);

		current = *preloaded;
		preloaded.reset();
	}

	/**
	 * Jump to another position.  This clears the preload.
	 */
	void MoveTo(unsigned position) noexcept {
		assert(position < tracks.size());

		current = position;
		preloaded.reset();
	}
};

#endif
