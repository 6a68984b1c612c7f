// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Ssdp.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

std::string
BuildSsdpSearchRequest(std::string_view search_target) noexcept
{
	return fmt::format("M-SEARCH * HTTP/1.1\r\n"
			   "HOST: 239.255.255.250:{}\r\n"
			   "MAN: \"ssdp:discover\"\r\n"
			   "MX: {}\r\n"
			   "ST: {}\r\n"
			   "\r\n",
			   SSDP_PORT, SSDP_MX, search_target);
}

std::string_view
ParseSsdpLocation(std::string_view datagram) noexcept
{
	static constexpr std::string_view header = "location:";

	while (!datagram.empty()) {
		std::string_view line;
		const auto eol = datagram.find('\n');
		if (eol == std::string_view::npos) {
			line = datagram;
			datagram = {};
		} else {
			line = datagram.substr(0, eol);
			datagram = datagram.substr(eol + 1);
		}

		if (StringStartsWithIgnoreCase(line, header))
			return Strip(line.substr(header.size()));
	}

	return {};
}
