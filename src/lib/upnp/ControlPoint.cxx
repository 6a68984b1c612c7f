// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ControlPoint.hxx"
#include "AVTransport.hxx"
#include "Error.hxx"
#include "Domain.hxx"
#include "ixmlwrap.hxx"
#include "session/TransportEvent.hxx"
#include "net/LocalAddress.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "Log.hxx"

UpnpControlPoint::UpnpControlPoint(const std::string &_listen_address,
				   unsigned _listen_port)
	:listen_address(_listen_address), listen_port(_listen_port),
	 worker([this]{ RunWorker(); })
{
}

UpnpControlPoint::~UpnpControlPoint() noexcept
{
	Close();

	{
		const std::scoped_lock lock{queue_mutex};
		quit = true;
	}

	queue_cond.notify_one();
	worker.join();
}

void
UpnpControlPoint::Open()
{
	if (initialized)
		return;

	std::string interface;
	if (listen_address != "0.0.0.0") {
		interface = FindInterfaceByAddress(listen_address.c_str());
		if (interface.empty())
			FmtWarning(upnp_domain,
				   "No interface has address {:?}; using the default",
				   listen_address);
	}

	int code = UpnpInit2(interface.empty() ? nullptr : interface.c_str(),
			     listen_port);
	if (code != UPNP_E_SUCCESS)
		throw UpnpError(code, "UpnpInit2() failed");

	UpnpSetMaxContentLength(2000*1024);

	code = UpnpRegisterClient(Callback, this, &handle);
	if (code != UPNP_E_SUCCESS) {
		UpnpFinish();
		throw UpnpError(code, "UpnpRegisterClient() failed");
	}

	// Servers sometimes make error (e.g.: minidlna returns bad utf-8)
	ixmlRelaxParser(1);

	initialized = true;
	FmtInfo(upnp_domain, "Event listener on {}:{}",
		UpnpGetServerIpAddress(), UpnpGetServerPort());
}

void
UpnpControlPoint::Close() noexcept
{
	if (!initialized)
		return;

	initialized = false;

	UpnpUnRegisterClient(handle);
	handle = -1;

	int code = UpnpFinish();
	if (code != UPNP_E_SUCCESS)
		FmtError(upnp_domain, "UpnpFinish() failed: {}",
			 UpnpGetErrorMessage(code));

	subscriptions.Clear();
}

std::unique_ptr<AVControlPort>
UpnpControlPoint::Connect(const RendererRecord &renderer)
{
	if (!initialized)
		throw std::runtime_error("UPnP control point is not open");

	return std::make_unique<UpnpAVTransport>(*this, renderer);
}

void
UpnpControlPoint::AddSubscription(const std::string &sid,
				  TransportEventHandler &&handler) noexcept
{
	subscriptions.Add(sid, std::move(handler));
}

void
UpnpControlPoint::RemoveSubscription(const std::string &sid) noexcept
{
	subscriptions.Remove(sid);
}

void
UpnpControlPoint::PushEvent(PendingEvent &&event) noexcept
{
	{
		const std::scoped_lock lock{queue_mutex};
		queue.emplace_back(std::move(event));
	}

	queue_cond.notify_one();
}

void
UpnpControlPoint::DispatchEvent(const PendingEvent &event) noexcept
{
	TransportEvent transport_event;
	try {
		transport_event = ParseLastChange(event.last_change);
	} catch (...) {
		FmtWarning(upnp_domain, "Malformed LastChange from {:?}: {}",
			   event.sid, std::current_exception());
		return;
	}

	subscriptions.Dispatch(event.sid, event.seq,
			       std::move(transport_event));
}

void
UpnpControlPoint::RunWorker() noexcept
{
	std::unique_lock lock{queue_mutex};

	while (true) {
		queue_cond.wait(lock, [this]{ return quit || !queue.empty(); });
		if (quit)
			break;

		auto event = std::move(queue.front());
		queue.pop_front();

		const ScopeUnlock unlock(lock);
		DispatchEvent(event);
	}
}

void
UpnpControlPoint::OnEventReceived(const UpnpEvent &event) noexcept
{
	IXML_Document *changed = UpnpEvent_get_ChangedVariables(&event);
	if (changed == nullptr)
		return;

	const char *last_change =
		ixmlwrap::getFirstElementValue(changed, "LastChange");
	if (last_change == nullptr)
		/* not an AVTransport notification */
		return;

	PushEvent({
		UpnpEvent_get_SID_cstr(&event),
		unsigned(UpnpEvent_get_EventKey(&event)),
		last_change,
	});
}

int
UpnpControlPoint::Callback(Upnp_EventType et, const void *event,
			   void *cookie) noexcept
{
	auto &cp = *(UpnpControlPoint *)cookie;

	switch (et) {
	case UPNP_EVENT_RECEIVED:
		cp.OnEventReceived(*(const UpnpEvent *)event);
		break;

	case UPNP_EVENT_AUTORENEWAL_FAILED:
	case UPNP_EVENT_SUBSCRIPTION_EXPIRED:
		FmtWarning(upnp_domain, "Subscription {:?} has expired",
			   UpnpEventSubscribe_get_SID_cstr((const UpnpEventSubscribe *)event));
		break;

	default:
		break;
	}

	return UPNP_E_SUCCESS;
}
