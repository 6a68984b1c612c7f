// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_TRANSPORT_EVENT_HXX
#define DLNAQ_TRANSPORT_EVENT_HXX

#include <cstdint>
#include <string>
#include <string_view>

/**
 * The AVTransport "TransportState" state variable.
 */
enum class TransportState : uint8_t {
	/**
	 * The notification did not carry the variable, or it had a
	 * value not listed here.
	 */
	UNKNOWN,

	STOPPED,
	PLAYING,
	PAUSED_PLAYBACK,
	TRANSITIONING,
	NO_MEDIA_PRESENT,
};

/**
 * An AVTransport state change reported by a renderer.
 */
struct TransportEvent {
	TransportState state = TransportState::UNKNOWN;

	/**
	 * The "CurrentTrackURI" state variable; empty if the
	 * notification did not carry it.
	 */
	std::string current_track_uri;
};

[[gnu::pure]]
TransportState
ParseTransportState(std::string_view s) noexcept;

[[gnu::const]]
const char *
ToString(TransportState state) noexcept;

/**
 * Decode the value of the AVTransport "LastChange" state variable
 * (an XML document of the form
 * <Event><InstanceID val="0"><TransportState val="..."/>...).  Only
 * instance 0 is considered.
 *
 * Throws on malformed XML.
 */
TransportEvent
ParseLastChange(std::string_view document);

#endif
