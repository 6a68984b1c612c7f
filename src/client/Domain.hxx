// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CLIENT_DOMAIN_HXX
#define DLNAQ_CLIENT_DOMAIN_HXX

extern const class Domain client_domain;

#endif
