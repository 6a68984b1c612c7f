// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_TRACK_LIST_PARSER_HXX
#define DLNAQ_TRACK_LIST_PARSER_HXX

#include "queue/Track.hxx"

#include <string_view>
#include <vector>

/**
 * Parse a JSON array of track objects.  Each object must have a
 * non-empty "url" string; "title", "artist", "album", "art_url" and
 * "mime_type" are optional.
 *
 * Throws std::invalid_argument on malformed input.
 */
std::vector<Track>
ParseTrackList(std::string_view json);

#endif
