// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_TRACK_HXX
#define DLNAQ_TRACK_HXX

#include <string>

static constexpr const char *DEFAULT_TRACK_MIME_TYPE = "audio/flac";

/**
 * One playable item of a #PlayQueue.
 */
struct Track {
	/**
	 * The URL the renderer fetches the audio from; never empty.
	 */
	std::string url;

	std::string title, artist, album;

	/**
	 * URL of the cover art; may be empty.
	 */
	std::string art_url;

	std::string mime_type = DEFAULT_TRACK_MIME_TYPE;
};

#endif
