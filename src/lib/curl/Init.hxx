// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CURL_INIT_HXX
#define DLNAQ_CURL_INIT_HXX

/**
 * Initialize libCURL's global state for the lifetime of this object.
 * Instances may be nested; only the first calls curl_global_init()
 * and only the last calls curl_global_cleanup().
 */
class ScopeCurlInit {
public:
	ScopeCurlInit();
	~ScopeCurlInit() noexcept;

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};

#endif
