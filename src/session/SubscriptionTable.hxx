// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_SUBSCRIPTION_TABLE_HXX
#define DLNAQ_SUBSCRIPTION_TABLE_HXX

#include "AVControlPort.hxx"
#include "TransportEvent.hxx"
#include "thread/Mutex.hxx"

#include <map>
#include <string>
#include <string_view>

/**
 * Routes event notifications to the handlers of the subscriptions
 * they belong to, identified by the subscription id (SID) the
 * renderer assigned.
 *
 * A notification may arrive before the subscriber learns its SID
 * (i.e. before Add() is called); such notifications are held back
 * and delivered by Add().  The initial notification (sequence number
 * 0) only describes the state before the subscriber issued any
 * command and is ignored.
 *
 * This class is thread-safe.  Handlers are never invoked while the
 * internal mutex is held.
 */
class SubscriptionTable {
	/**
	 * Held back notifications are discarded once there are more
	 * than this; they were not for us.
	 */
	static constexpr std::size_t MAX_EARLY = 16;

	mutable Mutex mutex;

	std::map<std::string, TransportEventHandler, std::less<>> handlers;

	std::map<std::string, TransportEvent, std::less<>> early;

public:
	void Add(std::string_view sid, TransportEventHandler &&handler) noexcept;
	void Remove(std::string_view sid) noexcept;
	void Clear() noexcept;

	[[gnu::pure]]
	bool Contains(std::string_view sid) const noexcept;

	/**
	 * @param seq the GENA event key
	 * @return true if the event was delivered to a handler
	 */
	bool Dispatch(std::string_view sid, unsigned seq,
		      TransportEvent &&event) noexcept;
};

#endif
