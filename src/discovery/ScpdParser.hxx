// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_SCPD_PARSER_HXX
#define DLNAQ_SCPD_PARSER_HXX

#include <set>
#include <string>
#include <string_view>

/**
 * The action which makes gapless playback possible.
 */
static constexpr std::string_view SET_NEXT_AV_TRANSPORT_URI =
	"SetNextAVTransportURI";

/**
 * Parse a service control protocol description (SCPD) and return the
 * names of all actions it declares.
 *
 * Throws on malformed XML.
 */
std::set<std::string, std::less<>>
ParseScpdActions(std::string_view document);

#endif
