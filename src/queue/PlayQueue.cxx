// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "PlayQueue.hxx"

#include <stdexcept>

PlayQueue::PlayQueue(std::vector<Track> &&_tracks)
	:tracks(std::move(_tracks))
{
	if (tracks.empty())
		throw std::invalid_argument("Empty track list");

	for (const auto &i : tracks)
		if (i.url.empty())
			throw std::invalid_argument("Track without URL");
}

bool
PlayQueue::IsPreloadedUri(std::string_view uri) const noexcept
{
	return preloaded && !uri.empty() && tracks[*preloaded].url == uri;
}
