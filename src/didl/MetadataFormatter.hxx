// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_METADATA_FORMATTER_HXX
#define DLNAQ_METADATA_FORMATTER_HXX

#include <string>
#include <string_view>

struct Track;

/**
 * Generate a DIDL-Lite document describing one music track, to be
 * passed as "CurrentURIMetaData" / "NextURIMetaData" to the
 * AVTransport service.  Empty optional fields are omitted; an empty
 * title becomes "Unknown".
 */
[[gnu::pure]]
std::string
FormatDidlMetadata(std::string_view url, std::string_view title,
		   std::string_view artist, std::string_view album,
		   std::string_view art_url, std::string_view mime_type);

[[gnu::pure]]
std::string
FormatDidlMetadata(const Track &track);

#endif
