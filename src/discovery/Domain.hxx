// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_DISCOVERY_DOMAIN_HXX
#define DLNAQ_DISCOVERY_DOMAIN_HXX

class Domain;

extern const Domain discovery_domain;
extern const Domain ssdp_domain;

#endif
