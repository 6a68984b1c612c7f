// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_CONTROL_POINT_HXX
#define DLNAQ_CONTROL_POINT_HXX

#include <memory>

struct RendererRecord;
class AVControlPort;

/**
 * The process-wide infrastructure which sends commands to renderers
 * and receives their event notifications.  It is opened while at
 * least one session exists; see #SessionRegistry.
 */
class ControlPoint {
public:
	virtual ~ControlPoint() noexcept = default;

	/**
	 * Start the event listener.  Throws on error.
	 */
	virtual void Open() = 0;

	virtual void Close() noexcept = 0;

	/**
	 * Create a port for controlling the given renderer.  May only
	 * be called while open.  Throws on error.
	 */
	virtual std::unique_ptr<AVControlPort> Connect(const RendererRecord &renderer) = 0;
};

#endif
