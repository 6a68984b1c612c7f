// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Instance.hxx"

Instance::Instance(const DiscoveryConfig &discovery_config,
		   const std::string &listen_address, unsigned listen_port)
	:discovery(search, fetcher, discovery_config),
	 control_point(listen_address, listen_port),
	 sessions(control_point)
{
}
