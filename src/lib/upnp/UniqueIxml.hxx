// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_UPNP_UNIQUE_XML_HXX
#define DLNAQ_UPNP_UNIQUE_XML_HXX

#include <upnp/ixml.h>

#include <memory>

struct UpnpIxmlDeleter {
	void operator()(IXML_Document *doc) noexcept {
		ixmlDocument_free(doc);
	}

	void operator()(DOMString s) noexcept {
		ixmlFreeDOMString(s);
	}
};

using UniqueIxmlDocument = std::unique_ptr<IXML_Document, UpnpIxmlDeleter>;
using UniqueIxmlString = std::unique_ptr<char, UpnpIxmlDeleter>;

#endif
