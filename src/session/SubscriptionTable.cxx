// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SubscriptionTable.hxx"
#include "Domain.hxx"
#include "Log.hxx"

#include <optional>

void
SubscriptionTable::Add(std::string_view sid,
		       TransportEventHandler &&handler) noexcept
{
	std::optional<TransportEvent> pending;
	TransportEventHandler h;

	{
		const std::scoped_lock lock{mutex};

		if (auto i = early.find(sid); i != early.end()) {
			pending = std::move(i->second);
			early.erase(i);
			h = handler;
		}

		handlers.insert_or_assign(std::string{sid}, std::move(handler));
	}

	if (pending) {
		FmtDebug(session_domain, "Delivering early event for {:?}",
			 sid);
		h(*pending);
	}
}

void
SubscriptionTable::Remove(std::string_view sid) noexcept
{
	const std::scoped_lock lock{mutex};

	if (auto i = handlers.find(sid); i != handlers.end())
		handlers.erase(i);
}

void
SubscriptionTable::Clear() noexcept
{
	const std::scoped_lock lock{mutex};
	handlers.clear();
	early.clear();
}

bool
SubscriptionTable::Contains(std::string_view sid) const noexcept
{
	const std::scoped_lock lock{mutex};
	return handlers.find(sid) != handlers.end();
}

bool
SubscriptionTable::Dispatch(std::string_view sid, unsigned seq,
			    TransportEvent &&event) noexcept
{
	if (seq == 0) {
		FmtDebug(session_domain, "Ignoring initial event for {:?}",
			 sid);
		return false;
	}

	TransportEventHandler handler;

	{
		const std::scoped_lock lock{mutex};

		auto i = handlers.find(sid);
		if (i == handlers.end()) {
			/* the subscriber may not know its SID yet;
			   keep only the most recent event */
			if (early.size() >= MAX_EARLY &&
			    early.find(sid) == early.end())
				early.clear();

			early.insert_or_assign(std::string{sid},
					       std::move(event));
			return false;
		}

		/* copy the handler so it can be invoked without
		   holding the mutex */
		handler = i->second;
	}

	handler(event);
	return true;
}
