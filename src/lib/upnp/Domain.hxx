// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_UPNP_DOMAIN_HXX
#define DLNAQ_UPNP_DOMAIN_HXX

class Domain;

extern const Domain upnp_domain;

#endif
