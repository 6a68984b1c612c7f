/*
 * Unit tests for src/didl/MetadataFormatter.hxx
 */

#include "didl/MetadataFormatter.hxx"
#include "queue/Track.hxx"

#include <gtest/gtest.h>

static constexpr const char *didl_head =
	"<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\""
	" xmlns:dc=\"http://purl.org/dc/elements/1.1/\""
	" xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\">"
	"<item id=\"0\" parentID=\"-1\" restricted=\"1\">";

TEST(MetadataFormatter, Full)
{
	Track t;
	t.url = "http://nas:8000/music/1.flac";
	t.title = "So What";
	t.artist = "Miles Davis";
	t.album = "Kind of Blue";
	t.art_url = "http://nas:8000/art/1.jpg";

	EXPECT_EQ(FormatDidlMetadata(t),
		  std::string{didl_head} +
		  "<dc:title>So What</dc:title>"
		  "<dc:creator>Miles Davis</dc:creator>"
		  "<upnp:artist>Miles Davis</upnp:artist>"
		  "<upnp:album>Kind of Blue</upnp:album>"
		  "<upnp:albumArtURI>http://nas:8000/art/1.jpg</upnp:albumArtURI>"
		  "<upnp:class>object.item.audioItem.musicTrack</upnp:class>"
		  "<res protocolInfo=\"http-get:*:audio/flac:*\">http://nas:8000/music/1.flac</res>"
		  "</item></DIDL-Lite>");
}

TEST(MetadataFormatter, Minimal)
{
	EXPECT_EQ(FormatDidlMetadata("http://h/a.mp3", "", "", "", "",
				     "audio/mpeg"),
		  std::string{didl_head} +
		  "<dc:title>Unknown</dc:title>"
		  "<upnp:class>object.item.audioItem.musicTrack</upnp:class>"
		  "<res protocolInfo=\"http-get:*:audio/mpeg:*\">http://h/a.mp3</res>"
		  "</item></DIDL-Lite>");
}

TEST(MetadataFormatter, DefaultMimeType)
{
	const auto s = FormatDidlMetadata("http://h/a", "x", "", "", "", "");
	EXPECT_NE(s.find("http-get:*:audio/flac:*"), std::string::npos);
}

TEST(MetadataFormatter, Escape)
{
	const auto s = FormatDidlMetadata("http://h/a?x=1&y=2",
					  "Rock & Roll <Live>",
					  "Guns N' Roses", "\"Greatest\"",
					  "", "audio/flac");

	EXPECT_NE(s.find("<dc:title>Rock &amp; Roll &lt;Live&gt;</dc:title>"),
		  std::string::npos);
	EXPECT_NE(s.find("<upnp:artist>Guns N&apos; Roses</upnp:artist>"),
		  std::string::npos);
	EXPECT_NE(s.find("<upnp:album>&quot;Greatest&quot;</upnp:album>"),
		  std::string::npos);
	EXPECT_NE(s.find(">http://h/a?x=1&amp;y=2</res>"), std::string::npos);
	EXPECT_EQ(s.find("Rock & Roll"), std::string::npos);
}
