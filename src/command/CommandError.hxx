// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_COMMAND_ERROR_HXX
#define DLNAQ_COMMAND_ERROR_HXX

#include <exception>

class Response;

/**
 * Send the exception to the client as an "ACK" line.
 */
void
PrintError(Response &r, const std::exception_ptr &ep);

#endif
