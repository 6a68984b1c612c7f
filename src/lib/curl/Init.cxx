// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Init.hxx"
#include "Error.hxx"
#include "thread/Mutex.hxx"

#include <curl/curl.h>

static Mutex curl_init_mutex;
static unsigned curl_init_ref;

ScopeCurlInit::ScopeCurlInit()
{
	const std::scoped_lock lock{curl_init_mutex};
	if (curl_init_ref == 0) {
		CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
		if (code != CURLE_OK)
			throw CurlError(code, "CURL initialization failed");
	}

	++curl_init_ref;
}

ScopeCurlInit::~ScopeCurlInit() noexcept
{
	const std::scoped_lock lock{curl_init_mutex};
	if (--curl_init_ref == 0)
		curl_global_cleanup();
}
