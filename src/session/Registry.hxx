// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_SESSION_REGISTRY_HXX
#define DLNAQ_SESSION_REGISTRY_HXX

#include "Listener.hxx"
#include "thread/Mutex.hxx"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct RendererRecord;
struct Track;
class ControlPoint;
class QueueSession;

using SessionMap = std::map<std::string, std::shared_ptr<QueueSession>, std::less<>>;

/**
 * Owns all #QueueSession instances, at most one per renderer
 * identity, and keeps the #ControlPoint open while at least one of
 * them exists.
 */
class SessionRegistry final : public QueueSessionListener {
	ControlPoint &control_point;

	/**
	 * Serializes PlayTracks() calls.
	 */
	Mutex play_mutex;

	/**
	 * Protects #sessions and #control_point_refs.
	 */
	mutable Mutex mutex;

	SessionMap sessions;

	/**
	 * One reference per registered session plus one for each
	 * PlayTracks() call in progress.  The #ControlPoint is open
	 * while this is non-zero.
	 */
	unsigned control_point_refs = 0;

public:
	explicit SessionRegistry(ControlPoint &_control_point) noexcept
		:control_point(_control_point) {}

	~SessionRegistry() noexcept;

	SessionRegistry(const SessionRegistry &) = delete;
	SessionRegistry &operator=(const SessionRegistry &) = delete;

	/**
	 * Start playing the given tracks on a renderer.  An existing
	 * session for the same renderer is stopped first.
	 *
	 * Throws if the new session could not be started.
	 */
	std::shared_ptr<QueueSession> PlayTracks(const RendererRecord &renderer,
						 std::vector<Track> &&tracks);

	std::shared_ptr<QueueSession> GetSession(std::string_view identity) const noexcept;

	SessionMap GetAllSessions() const noexcept;

	/**
	 * Stop all sessions (at shutdown).
	 */
	void StopAll() noexcept;

private:
	void AcquireControlPoint();
	void ReleaseControlPoint() noexcept;

	/* virtual methods from QueueSessionListener */
	void OnSessionFinished(QueueSession &session) noexcept override;
};

#endif
