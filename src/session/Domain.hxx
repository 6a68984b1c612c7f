// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_SESSION_DOMAIN_HXX
#define DLNAQ_SESSION_DOMAIN_HXX

class Domain;

extern const Domain session_domain;

#endif
