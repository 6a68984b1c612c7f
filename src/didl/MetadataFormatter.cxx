// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "MetadataFormatter.hxx"
#include "queue/Track.hxx"

#include <fmt/format.h>

#include <iterator>

static void
AppendEscaped(fmt::memory_buffer &buffer, std::string_view s)
{
	for (const char ch : s) {
		switch (ch) {
		case '&':
			buffer.append(std::string_view{"&amp;"});
			break;

		case '<':
			buffer.append(std::string_view{"&lt;"});
			break;

		case '>':
			buffer.append(std::string_view{"&gt;"});
			break;

		case '"':
			buffer.append(std::string_view{"&quot;"});
			break;

		case '\'':
			buffer.append(std::string_view{"&apos;"});
			break;

		default:
			buffer.push_back(ch);
		}
	}
}

static void
AppendElement(fmt::memory_buffer &buffer, std::string_view name,
	      std::string_view value)
{
	fmt::format_to(std::back_inserter(buffer), "<{}>", name);
	AppendEscaped(buffer, value);
	fmt::format_to(std::back_inserter(buffer), "</{}>", name);
}

std::string
FormatDidlMetadata(std::string_view url, std::string_view title,
		   std::string_view artist, std::string_view album,
		   std::string_view art_url, std::string_view mime_type)
{
	if (title.empty())
		title = "Unknown";

	if (mime_type.empty())
		mime_type = DEFAULT_TRACK_MIME_TYPE;

	fmt::memory_buffer buffer;
	buffer.append(std::string_view{
		"<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\""
		" xmlns:dc=\"http://purl.org/dc/elements/1.1/\""
		" xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\">"
		"<item id=\"0\" parentID=\"-1\" restricted=\"1\">"});

	AppendElement(buffer, "dc:title", title);

	if (!artist.empty()) {
		AppendElement(buffer, "dc:creator", artist);
		AppendElement(buffer, "upnp:artist", artist);
	}

	if (!album.empty())
		AppendElement(buffer, "upnp:album", album);

	if (!art_url.empty())
		AppendElement(buffer, "upnp:albumArtURI", art_url);

	AppendElement(buffer, "upnp:class", "object.item.audioItem.musicTrack");

	buffer.append(std::string_view{"<res protocolInfo=\"http-get:*:"});
	AppendEscaped(buffer, mime_type);
	buffer.append(std::string_view{":*\">"});
	AppendEscaped(buffer, url);
	buffer.append(std::string_view{"</res></item></DIDL-Lite>"});

	return fmt::to_string(buffer);
}

std::string
FormatDidlMetadata(const Track &track)
{
	return FormatDidlMetadata(track.url, track.title, track.artist,
				  track.album, track.art_url, track.mime_type);
}
