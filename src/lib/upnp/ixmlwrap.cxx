// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ixmlwrap.hxx"

namespace ixmlwrap {

const char *
getFirstElementValue(IXML_Document *doc, const char *name) noexcept
{
	const char *ret = nullptr;
	IXML_NodeList *nodes =
		ixmlDocument_getElementsByTagName(doc, name);

	if (nodes) {
		IXML_Node *first = ixmlNodeList_item(nodes, 0);
		if (first) {
			IXML_Node *dnode = ixmlNode_getFirstChild(first);
			if (dnode) {
				ret = ixmlNode_getNodeValue(dnode);
			}
		}

		ixmlNodeList_free(nodes);
	}

	return ret;
}

} // namespace ixmlwrap
