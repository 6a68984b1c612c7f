// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "TrackListParser.hxx"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

using std::string_view_literals::operator""sv;

/**
 * Copy an optional string member.  A missing or null member leaves
 * the destination unchanged.
 */
static void
GetOptionalString(const nlohmann::json &j, std::string_view key,
		  std::size_t idx, std::string &dest)
{
	const auto i = j.find(key);
	if (i == j.end() || i->is_null())
		return;

	if (!i->is_string())
		throw std::invalid_argument(fmt::format("Track {}: '{}' must be a string",
							idx, key));

	dest = i->get<std::string>();
}

static Track
ParseTrack(const nlohmann::json &j, std::size_t idx)
{
	if (!j.is_object())
		throw std::invalid_argument(fmt::format("Track {} missing required 'url' field",
							idx));

	const auto url = j.find("url"sv);
	if (url == j.end() || !url->is_string() ||
	    url->get_ref<const std::string &>().empty())
		throw std::invalid_argument(fmt::format("Track {} missing required 'url' field",
							idx));

	Track track;
	track.url = url->get<std::string>();
	GetOptionalString(j, "title"sv, idx, track.title);
	GetOptionalString(j, "artist"sv, idx, track.artist);
	GetOptionalString(j, "album"sv, idx, track.album);
	GetOptionalString(j, "art_url"sv, idx, track.art_url);
	GetOptionalString(j, "mime_type"sv, idx, track.mime_type);

	if (track.mime_type.empty())
		track.mime_type = DEFAULT_TRACK_MIME_TYPE;

	return track;
}

std::vector<Track>
ParseTrackList(std::string_view json)
{
	nlohmann::json j;

	try {
		j = nlohmann::json::parse(json);
	} catch (const nlohmann::json::parse_error &e) {
		throw std::invalid_argument(fmt::format("Invalid tracks JSON: {}",
							e.what()));
	}

	if (!j.is_array() || j.empty())
		throw std::invalid_argument("tracks must be a non-empty JSON array");

	std::vector<Track> tracks;
	tracks.reserve(j.size());

	for (std::size_t i = 0; i < j.size(); ++i)
		tracks.emplace_back(ParseTrack(j[i], i));

	return tracks;
}
