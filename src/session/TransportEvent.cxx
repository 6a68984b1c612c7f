// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "TransportEvent.hxx"
#include "lib/expat/ExpatParser.hxx"

#include <string.h>

static constexpr struct {
	TransportState state;
	const char *name;
} transport_state_names[] = {
	{ TransportState::STOPPED, "STOPPED" },
	{ TransportState::PLAYING, "PLAYING" },
	{ TransportState::PAUSED_PLAYBACK, "PAUSED_PLAYBACK" },
	{ TransportState::TRANSITIONING, "TRANSITIONING" },
	{ TransportState::NO_MEDIA_PRESENT, "NO_MEDIA_PRESENT" },
};

TransportState
ParseTransportState(std::string_view s) noexcept
{
	for (const auto &i : transport_state_names)
		if (s == i.name)
			return i.state;

	return TransportState::UNKNOWN;
}

const char *
ToString(TransportState state) noexcept
{
	for (const auto &i : transport_state_names)
		if (i.state == state)
			return i.name;

	return "UNKNOWN";
}

namespace {

class LastChangeParser final : public CommonExpatParser {
	TransportEvent &event;

	/**
	 * Are we inside <InstanceID val="0">?
	 */
	bool in_instance = false;

public:
	explicit LastChangeParser(TransportEvent &_event) noexcept
		:event(_event) {}

protected:
	void StartElement(const XML_Char *name,
			  const XML_Char **attrs) override {
		const char *colon = strrchr(name, ':');
		const std::string_view local = colon != nullptr ? colon + 1 : name;

		if (local == "InstanceID") {
			const char *val = GetAttribute(attrs, "val");
			in_instance = val != nullptr && strcmp(val, "0") == 0;
			return;
		}

		if (!in_instance)
			return;

		const char *val = GetAttribute(attrs, "val");
		if (val == nullptr)
			return;

		if (local == "TransportState")
			event.state = ParseTransportState(val);
		else if (local == "CurrentTrackURI")
			event.current_track_uri = val;
	}

	void EndElement(const XML_Char *name) override {
		const char *colon = strrchr(name, ':');
		const std::string_view local = colon != nullptr ? colon + 1 : name;

		if (local == "InstanceID")
			in_instance = false;
	}

	void CharacterData(const XML_Char *, int) override {
	}
};

} // anonymous namespace

TransportEvent
ParseLastChange(std::string_view document)
{
	TransportEvent event;
	LastChangeParser parser(event);
	parser.CompleteParse(document);
	return event;
}
