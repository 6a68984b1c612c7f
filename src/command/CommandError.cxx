// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandError.hxx"
#include "client/Response.hxx"
#include "Log.hxx"
#include "util/Exception.hxx"

#include <stdexcept>

[[gnu::pure]]
static enum ack
ToAck(const std::exception_ptr &ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const ProtocolError &pe) {
		return pe.GetCode();
	} catch (const std::invalid_argument &e) {
		return ACK_ERROR_ARG;
	} catch (const std::out_of_range &e) {
		return ACK_ERROR_ARG;
	} catch (const std::runtime_error &e) {
		/* SOAP faults, HTTP and socket errors while talking
		   to a renderer */
		return ACK_ERROR_SYSTEM;
	} catch (...) {
		try {
			std::rethrow_if_nested(ep);
			return ACK_ERROR_UNKNOWN;
		} catch (...) {
			return ToAck(std::current_exception());
		}
	}
}

void
PrintError(Response &r, const std::exception_ptr &ep)
{
	LogError(ep);
	r.Error(ToAck(ep), GetFullMessage(ep));
}
