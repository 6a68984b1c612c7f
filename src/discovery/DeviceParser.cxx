// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "DeviceParser.hxx"
#include "Renderer.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/StringStrip.hxx"
#include "util/UriExtract.hxx"
#include "util/UriRelative.hxx"

#include <stdexcept>

#include <string.h>

/**
 * Strip the namespace prefix from an element name.
 */
[[gnu::pure]]
static std::string_view
LocalName(const XML_Char *name) noexcept
{
	const char *colon = strrchr(name, ':');
	return colon != nullptr ? colon + 1 : name;
}

/**
 * An XML parser which constructs an UPnP device object from the
 * device descriptor.
 */
class UPnPDeviceParser final : public CommonExpatParser {
	UPnPDevice &device;

	std::vector<std::string_view> path;

	/**
	 * The text of the current leaf element.
	 */
	std::string value;

	UPnPService service;

	bool have_device = false, have_service_list = false;

public:
	explicit UPnPDeviceParser(UPnPDevice &_device) noexcept
		:device(_device) {}

	void Check() const {
		if (!have_device)
			throw std::runtime_error("No device element");

		if (device.udn.empty())
			throw std::runtime_error("No UDN");

		if (!have_service_list)
			throw std::runtime_error("No serviceList");
	}

protected:
	void StartElement(const XML_Char *name, const XML_Char **) override {
		path.emplace_back(Intern(LocalName(name)));
		value.clear();

		if (path.size() == 2 && path.back() == "device")
			have_device = true;
		else if (path.back() == "serviceList")
			have_service_list = true;
		else if (path.back() == "service")
			service = {};
	}

	void EndElement(const XML_Char *) override {
		const auto current = path.back();
		const auto text = Strip(std::string_view{value});

		if (IsRootDeviceField()) {
			if (current == "friendlyName")
				device.friendly_name = text;
			else if (current == "UDN")
				device.udn = text;
			else if (current == "manufacturer")
				device.manufacturer = text;
			else if (current == "modelName")
				device.model_name = text;
		}

		if (IsServiceField()) {
			if (current == "serviceType")
				service.service_type = text;
			else if (current == "controlURL")
				service.control_url = text;
			else if (current == "eventSubURL")
				service.event_sub_url = text;
			else if (current == "SCPDURL")
				service.scpd_url = text;
		} else if (current == "service" && path.size() >= 2 &&
			   path[path.size() - 2] == "serviceList") {
			device.services.emplace_back(std::move(service));
			service = {};
		}

		value.clear();
		path.pop_back();
	}

	void CharacterData(const XML_Char *s, int len) override {
		value.append(s, len);
	}

private:
	/**
	 * Is the current element a direct child of the root
	 * "device" element?
	 */
	bool IsRootDeviceField() const noexcept {
		return path.size() == 3 && path[1] == "device";
	}

	bool IsServiceField() const noexcept {
		return path.size() >= 2 && path[path.size() - 2] == "service";
	}

	/**
	 * Map the element name to a string with static storage
	 * duration if it is one we look at; the others are never
	 * compared after the element is closed.
	 */
	static std::string_view Intern(std::string_view name) noexcept {
		static constexpr std::string_view known[] = {
			"device", "serviceList", "service",
			"friendlyName", "UDN", "manufacturer", "modelName",
			"serviceType", "controlURL", "eventSubURL", "SCPDURL",
		};

		for (auto i : known)
			if (i == name)
				return i;

		return {};
	}
};

bool
IsServiceType(std::string_view service_type, std::string_view type) noexcept
{
	return service_type.starts_with(type);
}

const UPnPService *
UPnPDevice::FindService(std::string_view type) const noexcept
{
	for (const auto &i : services)
		if (IsServiceType(i.service_type, type))
			return &i;

	return nullptr;
}

UPnPDevice
ParseDeviceDescription(std::string_view document, std::string_view location)
{
	UPnPDevice device;

	{
		UPnPDeviceParser parser(device);
		parser.CompleteParse(document);
		parser.Check();
	}

	device.base_url = uri_get_origin(location);

	for (auto &i : device.services) {
		i.control_url = uri_apply_origin(i.control_url, device.base_url);
		i.event_sub_url = uri_apply_origin(i.event_sub_url, device.base_url);
		i.scpd_url = uri_apply_origin(i.scpd_url, device.base_url);
	}

	return device;
}

std::optional<RendererRecord>
MakeRendererRecord(const UPnPDevice &device, std::string_view location,
		   bool supports_gapless_preload) noexcept
{
	const auto *av_transport = device.FindService(AV_TRANSPORT_SERVICE_TYPE);
	if (av_transport == nullptr || av_transport->control_url.empty())
		return std::nullopt;

	RendererRecord r;
	r.name = device.friendly_name;
	r.identity = device.udn;
	r.description_location = location;
	r.base_url = device.base_url;
	r.transport_control_url = av_transport->control_url;
	r.transport_event_url = av_transport->event_sub_url;
	r.manufacturer = device.manufacturer;
	r.model_name = device.model_name;
	r.supports_gapless_preload = supports_gapless_preload;

	if (const auto *rendering_control = device.FindService(RENDERING_CONTROL_SERVICE_TYPE))
		r.rendering_control_url = rendering_control->control_url;

	return r;
}
