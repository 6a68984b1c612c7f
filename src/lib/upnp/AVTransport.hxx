// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_UPNP_AV_TRANSPORT_HXX
#define DLNAQ_UPNP_AV_TRANSPORT_HXX

#include "session/AVControlPort.hxx"

#include <initializer_list>
#include <string>
#include <utility>

struct RendererRecord;
class UpnpControlPoint;

static constexpr const char *AV_TRANSPORT_SERVICE_TYPE_1 =
	"urn:schemas-upnp-org:service:AVTransport:1";
static constexpr const char *RENDERING_CONTROL_SERVICE_TYPE_1 =
	"urn:schemas-upnp-org:service:RenderingControl:1";

/**
 * An #AVControlPort which sends SOAP actions with libupnp.
 */
class UpnpAVTransport final : public AVControlPort {
	UpnpControlPoint &control_point;

	const std::string name;
	const std::string transport_control_url;
	const std::string transport_event_url;
	const std::string rendering_control_url;

	/**
	 * The SID of the AVTransport event subscription; empty if
	 * not subscribed.
	 */
	std::string sid;

public:
	UpnpAVTransport(UpnpControlPoint &_control_point,
			const RendererRecord &renderer) noexcept;
	~UpnpAVTransport() noexcept override;

	UpnpAVTransport(const UpnpAVTransport &) = delete;
	UpnpAVTransport &operator=(const UpnpAVTransport &) = delete;

	/* virtual methods from AVControlPort */
	void SetTransportUri(const std::string &url, const std::string &title,
			     const std::string &metadata) override;
	void SetNextTransportUri(const std::string &url,
				 const std::string &title,
				 const std::string &metadata) override;
	void Play() override;
	void Pause() override;
	void Stop() override;
	void SetVolume(double fraction) override;
	void Subscribe(TransportEventHandler handler) override;
	void Unsubscribe() override;

private:
	using Arguments = std::initializer_list<std::pair<const char *, const char *>>;

	/**
	 * Send a SOAP action and wait for the response.  Throws
	 * #UpnpError on error.
	 */
	void SendAction(const std::string &url, const char *service_type,
			const char *action, Arguments args);
};

#endif
