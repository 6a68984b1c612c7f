// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_UPNP_CONTROL_POINT_HXX
#define DLNAQ_UPNP_CONTROL_POINT_HXX

#include "session/ControlPoint.hxx"
#include "session/AVControlPort.hxx"
#include "session/SubscriptionTable.hxx"
#include "thread/Mutex.hxx"
#include "thread/Cond.hxx"

#include <upnp/upnp.h>

#include <deque>
#include <string>
#include <thread>

/**
 * A #ControlPoint implemented with libupnp.  Opening it initializes
 * libupnp, which starts the HTTP server receiving GENA event
 * notifications.
 *
 * Notifications arrive on libupnp's threads; they are passed to a
 * worker thread owned by this object, which decodes them and invokes
 * the subscriber's handler.  Handlers may therefore call any method
 * of this object, including Close().
 */
class UpnpControlPoint final : public ControlPoint {
	/**
	 * The local IPv4 address for the event callback URL;
	 * "0.0.0.0" lets libupnp choose.
	 */
	const std::string listen_address;

	const unsigned listen_port;

	UpnpClient_Handle handle = -1;

	bool initialized = false;

	SubscriptionTable subscriptions;

	struct PendingEvent {
		std::string sid;

		/**
		 * The GENA event key; 0 for the initial notification.
		 */
		unsigned seq;

		/**
		 * The value of the "LastChange" state variable.
		 */
		std::string last_change;
	};

	Mutex queue_mutex;
	Cond queue_cond;
	std::deque<PendingEvent> queue;
	bool quit = false;

	std::thread worker;

public:
	UpnpControlPoint(const std::string &_listen_address,
			 unsigned _listen_port);
	~UpnpControlPoint() noexcept override;

	UpnpControlPoint(const UpnpControlPoint &) = delete;
	UpnpControlPoint &operator=(const UpnpControlPoint &) = delete;

	UpnpClient_Handle GetHandle() const noexcept {
		return handle;
	}

	void AddSubscription(const std::string &sid,
			     TransportEventHandler &&handler) noexcept;
	void RemoveSubscription(const std::string &sid) noexcept;

	/* virtual methods from ControlPoint */
	void Open() override;
	void Close() noexcept override;
	std::unique_ptr<AVControlPort> Connect(const RendererRecord &renderer) override;

private:
	void PushEvent(PendingEvent &&event) noexcept;
	void DispatchEvent(const PendingEvent &event) noexcept;
	void RunWorker() noexcept;

	void OnEventReceived(const UpnpEvent &event) noexcept;

	static int Callback(Upnp_EventType et, const void *event,
			    void *cookie) noexcept;
};

#endif
