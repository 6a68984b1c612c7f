// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_IXMLWRAP_HXX
#define DLNAQ_IXMLWRAP_HXX

#include <upnp/ixml.h>

namespace ixmlwrap {

/**
 * Retrieve the text content for the first element of given
 * name.  Returns nullptr if the element does not
 * contain a text node
 */
[[gnu::pure]]
const char *
getFirstElementValue(IXML_Document *doc, const char *name) noexcept;

} // namespace ixmlwrap

#endif
