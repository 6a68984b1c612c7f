// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_SESSION_LISTENER_HXX
#define DLNAQ_SESSION_LISTENER_HXX

class QueueSession;

class QueueSessionListener {
public:
	/**
	 * The session has released its renderer, either because it
	 * was stopped or because the queue has finished.  This may be
	 * called more than once for the same session, and from any
	 * thread; it is never called while the session's lock is
	 * held.
	 */
	virtual void OnSessionFinished(QueueSession &session) noexcept = 0;
};

#endif
