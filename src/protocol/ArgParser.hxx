// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_PROTOCOL_ARGPARSER_HXX
#define DLNAQ_PROTOCOL_ARGPARSER_HXX

/* the functions in this header throw #ProtocolError with
   #ACK_ERROR_ARG on malformed input */

int
ParseCommandArgInt(const char *s);

/**
 * Parse the optional argument of "list_renderers": "force", "1" or
 * "0".
 */
bool
ParseCommandArgForce(const char *s);

/**
 * Parse a volume level; values outside 0..100 are clamped.
 */
unsigned
ParseCommandArgVolume(const char *s);

#endif
