// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_AV_CONTROL_PORT_HXX
#define DLNAQ_AV_CONTROL_PORT_HXX

#include <functional>
#include <string>

struct TransportEvent;

using TransportEventHandler = std::function<void(const TransportEvent &)>;

/**
 * Sends AVTransport and RenderingControl commands to one renderer and
 * delivers its AVTransport events.  All command methods block until
 * the renderer has replied and throw on error.
 */
class AVControlPort {
public:
	virtual ~AVControlPort() noexcept = default;

	/**
	 * @param metadata a DIDL-Lite document
	 */
	virtual void SetTransportUri(const std::string &url,
				     const std::string &title,
				     const std::string &metadata) = 0;

	virtual void SetNextTransportUri(const std::string &url,
					 const std::string &title,
					 const std::string &metadata) = 0;

	virtual void Play() = 0;
	virtual void Pause() = 0;
	virtual void Stop() = 0;

	/**
	 * @param fraction the volume between 0.0 and 1.0
	 */
	virtual void SetVolume(double fraction) = 0;

	/**
	 * Subscribe to AVTransport events.  The handler may be invoked
	 * from any thread, until Unsubscribe() is called or this
	 * object is destroyed.
	 */
	virtual void Subscribe(TransportEventHandler handler) = 0;

	virtual void Unsubscribe() = 0;
};

#endif
