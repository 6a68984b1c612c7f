// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_QUEUE_SESSION_HXX
#define DLNAQ_QUEUE_SESSION_HXX

#include "TransportEvent.hxx"
#include "discovery/Renderer.hxx"
#include "queue/PlayQueue.hxx"
#include "thread/Mutex.hxx"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class AVControlPort;
class QueueSessionListener;

/**
 * A snapshot of a session's state for the "status" command.
 */
struct QueueStatus {
	std::string renderer;

	/**
	 * Does the session still control the renderer?
	 */
	bool playing;

	/**
	 * The current track number, starting at 1.
	 */
	unsigned track;

	unsigned total_tracks;

	std::string title, artist, album;
};

/**
 * Plays a #PlayQueue on one renderer.
 *
 * Track changes are detected from the renderer's AVTransport events.
 * If the renderer implements "SetNextAVTransportURI", the next track
 * is always handed to it in advance so it can switch gaplessly;
 * otherwise the session starts the next track when the renderer
 * reports STOPPED.
 *
 * All commands and event handling are serialized by #mutex.  Events
 * are queued and handled by whichever thread owns the mutex next, so
 * the event thread never waits for a command in progress.
 *
 * Instances must be managed by std::shared_ptr.
 */
class QueueSession final : public std::enable_shared_from_this<QueueSession> {
	const RendererRecord renderer;

	QueueSessionListener &listener;

	/**
	 * Serializes all commands sent to the renderer and protects
	 * #queue and #port.
	 */
	mutable Mutex mutex;

	PlayQueue queue;

	/**
	 * The renderer connection; nullptr after the session has been
	 * stopped or has finished.
	 */
	std::unique_ptr<AVControlPort> port;

	/**
	 * Protects #pending_events.
	 */
	Mutex event_mutex;

	std::deque<TransportEvent> pending_events;

	/**
	 * Calls DrainEvents() when leaving the scope; declare it
	 * before the std::unique_lock so it runs after unlocking.
	 */
	class ScopeDrainEvents {
		QueueSession &session;

	public:
		explicit ScopeDrainEvents(QueueSession &_session) noexcept
			:session(_session) {}

		~ScopeDrainEvents() noexcept {
			session.DrainEvents();
		}

		ScopeDrainEvents(const ScopeDrainEvents &) = delete;
		ScopeDrainEvents &operator=(const ScopeDrainEvents &) = delete;
	};

public:
	/**
	 * Throws std::invalid_argument if the track list is empty or
	 * a track has no URL.
	 */
	QueueSession(const RendererRecord &_renderer,
		     std::vector<Track> &&tracks,
		     std::unique_ptr<AVControlPort> &&_port,
		     QueueSessionListener &_listener);

	~QueueSession() noexcept;

	QueueSession(const QueueSession &) = delete;
	QueueSession &operator=(const QueueSession &) = delete;

	const RendererRecord &GetRenderer() const noexcept {
		return renderer;
	}

	/**
	 * Subscribe to events, play the first track and preload the
	 * second one.
	 *
	 * Throws if the subscription or the first track could not be
	 * started; in that case, the session has already been torn
	 * down.  A failed preload is only logged.
	 */
	void Start();

	/**
	 * Enqueue an event from the renderer.  It is handled right
	 * away unless another thread is currently sending a command;
	 * that thread will handle it afterwards.  May be called from
	 * any thread.
	 */
	void OnTransportEvent(const TransportEvent &event) noexcept;

	/**
	 * Jump to the next track.
	 *
	 * Throws if the renderer has rejected the command.
	 *
	 * @return the new current track, or std::nullopt if the
	 * current track is the last one
	 */
	std::optional<Track> SkipNext();

	/**
	 * Jump to the previous track.
	 *
	 * @return the new current track, or std::nullopt if the
	 * current track is the first one
	 */
	std::optional<Track> SkipPrevious();

	/**
	 * @param level the volume between 0 and 100; values out of
	 * range are clamped
	 */
	void SetVolume(int level);

	void Pause();
	void Resume();

	/**
	 * Stop playback and release the renderer.  Errors are logged
	 * and ignored.  Calling this on a session which is already
	 * stopped is allowed.
	 */
	void Stop() noexcept;

	QueueStatus GetStatus() const noexcept;

	/**
	 * The position of the track handed to the renderer as "next",
	 * if any.
	 */
	std::optional<unsigned> GetPreloadedPosition() const noexcept;

private:
	/**
	 * Throws if the session has no renderer connection.
	 */
	AVControlPort &GetPort() const;

	void CheckPort() const {
		GetPort();
	}

	/**
	 * Handle all queued events, unless another thread owns the
	 * mutex.
	 */
	void DrainEvents() noexcept;

	std::optional<TransportEvent> PopEvent() noexcept;

	/**
	 * Evaluate one event.  Caller must hold the mutex.
	 *
	 * @return true if the queue has finished
	 */
	bool HandleEvent(const TransportEvent &event) noexcept;

	/**
	 * Send "SetAVTransportURI" and "Play" for the current track.
	 * Throws on error.
	 */
	void PlayCurrent();

	/**
	 * Hand the track after the current one to the renderer, if
	 * it supports that.  Errors are logged.
	 */
	void PreloadNext() noexcept;

	/**
	 * Advance to the next track on a renderer which cannot
	 * preload.  Errors are logged.
	 */
	void AutoAdvance() noexcept;

	/**
	 * Release the renderer and notify the listener.  The lock is
	 * released while the listener runs.
	 *
	 * @param send_stop send a "Stop" command before
	 * unsubscribing
	 */
	void Teardown(std::unique_lock<Mutex> &lock, bool send_stop) noexcept;
};

#endif
