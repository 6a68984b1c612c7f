// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_RENDERER_HXX
#define DLNAQ_RENDERER_HXX

#include <string>

/**
 * One discovered media renderer.  Built once per discovery pass and
 * never modified afterwards.
 */
struct RendererRecord {
	/**
	 * The "friendlyName" of the root device; not necessarily
	 * unique.
	 */
	std::string name;

	/**
	 * The UDN of the root device; this is the key for session
	 * lookups.
	 */
	std::string identity;

	/**
	 * The URL the device description was fetched from.
	 */
	std::string description_location;

	/**
	 * Scheme, host and port of #description_location.
	 */
	std::string base_url;

	/**
	 * Absolute control URL of the AVTransport service; never
	 * empty.
	 */
	std::string transport_control_url;

	/**
	 * Absolute event subscription URL of the AVTransport service.
	 */
	std::string transport_event_url;

	/**
	 * Absolute control URL of the RenderingControl service; empty
	 * if the device has none.
	 */
	std::string rendering_control_url;

	std::string manufacturer, model_name;

	/**
	 * Does the AVTransport service implement
	 * "SetNextAVTransportURI"?
	 */
	bool supports_gapless_preload = false;

	bool HasRenderingControl() const noexcept {
		return !rendering_control_url.empty();
	}
};

#endif
