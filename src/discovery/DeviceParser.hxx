// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_DEVICE_PARSER_HXX
#define DLNAQ_DEVICE_PARSER_HXX

#include "Renderer.hxx"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

static constexpr std::string_view AV_TRANSPORT_SERVICE_TYPE =
	"urn:schemas-upnp-org:service:AVTransport:";
static constexpr std::string_view RENDERING_CONTROL_SERVICE_TYPE =
	"urn:schemas-upnp-org:service:RenderingControl:";

/**
 * One entry of a device's "serviceList".  All URLs are absolute.
 */
struct UPnPService {
	std::string service_type;
	std::string control_url;
	std::string event_sub_url;
	std::string scpd_url;
};

/**
 * The parsed device description.  Services of embedded devices are
 * flattened into #services; the other attributes describe the root
 * device.
 */
struct UPnPDevice {
	std::string friendly_name;
	std::string udn;
	std::string manufacturer;
	std::string model_name;

	/**
	 * Scheme, host and port of the location the description was
	 * fetched from; relative URLs were resolved against this.
	 */
	std::string base_url;

	std::vector<UPnPService> services;

	/**
	 * Find the first service of the given type, ignoring the
	 * version suffix.
	 *
	 * @param type a service type without the version number,
	 * e.g. #AV_TRANSPORT_SERVICE_TYPE
	 */
	[[gnu::pure]]
	const UPnPService *FindService(std::string_view type) const noexcept;
};

/**
 * Does the given service type match the versionless type prefix?
 */
[[gnu::pure]]
bool
IsServiceType(std::string_view service_type, std::string_view type) noexcept;

/**
 * Parse a UPnP device description document.
 *
 * Throws on error (malformed XML, no device, no UDN, no service
 * list).
 *
 * @param location the URL the document was fetched from
 */
UPnPDevice
ParseDeviceDescription(std::string_view document, std::string_view location);

/**
 * Build a #RendererRecord from a parsed device.
 *
 * @param supports_gapless_preload the result of inspecting the
 * AVTransport service's action list
 * @return the record, or std::nullopt if the device has no usable
 * AVTransport control URL
 */
std::optional<RendererRecord>
MakeRendererRecord(const UPnPDevice &device, std::string_view location,
		   bool supports_gapless_preload) noexcept;

#endif
