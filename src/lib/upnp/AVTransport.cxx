// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "AVTransport.hxx"
#include "ControlPoint.hxx"
#include "Error.hxx"
#include "Domain.hxx"
#include "UniqueIxml.hxx"
#include "discovery/Renderer.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>

/**
 * The requested subscription duration in seconds; libupnp renews it
 * automatically.
 */
static constexpr int SUBSCRIPTION_TIMEOUT = 1800;

UpnpAVTransport::UpnpAVTransport(UpnpControlPoint &_control_point,
				 const RendererRecord &renderer) noexcept
	:control_point(_control_point),
	 name(renderer.name),
	 transport_control_url(renderer.transport_control_url),
	 transport_event_url(renderer.transport_event_url),
	 rendering_control_url(renderer.rendering_control_url)
{
}

UpnpAVTransport::~UpnpAVTransport() noexcept
{
	if (sid.empty())
		return;

	try {
		Unsubscribe();
	} catch (...) {
		FmtDebug(upnp_domain, "[{}] {}", name, std::current_exception());
	}
}

void
UpnpAVTransport::SendAction(const std::string &url, const char *service_type,
			    const char *action, Arguments args)
{
	IXML_Document *request = nullptr;
	for (const auto &[arg_name, arg_value] : args) {
		int code = UpnpAddToAction(&request, action, service_type,
					   arg_name, arg_value);
		if (code != UPNP_E_SUCCESS) {
			ixmlDocument_free(request);
			throw UpnpError(code, "UpnpAddToAction() failed");
		}
	}

	const UniqueIxmlDocument request_doc(request);

	IXML_Document *response = nullptr;
	int code = UpnpSendAction(control_point.GetHandle(), url.c_str(),
				  service_type, nullptr, request, &response);
	const UniqueIxmlDocument response_doc(response);

	if (code != UPNP_E_SUCCESS)
		throw UpnpError(code, fmt::format("{} failed", action).c_str());

	FmtDebug(upnp_domain, "[{}] {} ok", name, action);
}

void
UpnpAVTransport::SetTransportUri(const std::string &url,
				 const std::string &title,
				 const std::string &metadata)
{
	FmtDebug(upnp_domain, "[{}] SetAVTransportURI {:?} ({})",
		 name, url, title);

	SendAction(transport_control_url, AV_TRANSPORT_SERVICE_TYPE_1,
		   "SetAVTransportURI",
		   {{"InstanceID", "0"},
		    {"CurrentURI", url.c_str()},
		    {"CurrentURIMetaData", metadata.c_str()}});
}

void
UpnpAVTransport::SetNextTransportUri(const std::string &url,
				     const std::string &title,
				     const std::string &metadata)
{
	FmtDebug(upnp_domain, "[{}] SetNextAVTransportURI {:?} ({})",
		 name, url, title);

	SendAction(transport_control_url, AV_TRANSPORT_SERVICE_TYPE_1,
		   "SetNextAVTransportURI",
		   {{"InstanceID", "0"},
		    {"NextURI", url.c_str()},
		    {"NextURIMetaData", metadata.c_str()}});
}

void
UpnpAVTransport::Play()
{
	SendAction(transport_control_url, AV_TRANSPORT_SERVICE_TYPE_1, "Play",
		   {{"InstanceID", "0"}, {"Speed", "1"}});
}

void
UpnpAVTransport::Pause()
{
	SendAction(transport_control_url, AV_TRANSPORT_SERVICE_TYPE_1, "Pause",
		   {{"InstanceID", "0"}});
}

void
UpnpAVTransport::Stop()
{
	SendAction(transport_control_url, AV_TRANSPORT_SERVICE_TYPE_1, "Stop",
		   {{"InstanceID", "0"}});
}

void
UpnpAVTransport::SetVolume(double fraction)
{
	if (rendering_control_url.empty())
		throw std::runtime_error("Renderer has no RenderingControl service");

	const auto volume = fmt::format("{}", std::lround(fraction * 100));

	SendAction(rendering_control_url, RENDERING_CONTROL_SERVICE_TYPE_1,
		   "SetVolume",
		   {{"InstanceID", "0"},
		    {"Channel", "Master"},
		    {"DesiredVolume", volume.c_str()}});
}

void
UpnpAVTransport::Subscribe(TransportEventHandler handler)
{
	if (transport_event_url.empty())
		throw std::runtime_error("Renderer has no AVTransport event URL");

	int timeout = SUBSCRIPTION_TIMEOUT;
	Upnp_SID new_sid;
	int code = UpnpSubscribe(control_point.GetHandle(),
				 transport_event_url.c_str(),
				 &timeout, new_sid);
	if (code != UPNP_E_SUCCESS)
		throw UpnpError(code, "UpnpSubscribe() failed");

	/* notifications which arrived before UpnpSubscribe()
	   returned have been held back; they are delivered now */
	sid = new_sid;
	control_point.AddSubscription(sid, std::move(handler));

	FmtDebug(upnp_domain, "[{}] Subscribed {} for {}s",
		 name, sid, timeout);
}

void
UpnpAVTransport::Unsubscribe()
{
	if (sid.empty())
		return;

	const auto old_sid = std::move(sid);
	sid.clear();

	control_point.RemoveSubscription(old_sid);

	int code = UpnpUnSubscribe(control_point.GetHandle(), old_sid.c_str());
	if (code != UPNP_E_SUCCESS)
		throw UpnpError(code, "UpnpUnSubscribe() failed");
}
