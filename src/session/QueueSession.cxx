// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "QueueSession.hxx"
#include "AVControlPort.hxx"
#include "Listener.hxx"
#include "Domain.hxx"
#include "didl/MetadataFormatter.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "Log.hxx"

#include <algorithm>
#include <stdexcept>

QueueSession::QueueSession(const RendererRecord &_renderer,
			   std::vector<Track> &&tracks,
			   std::unique_ptr<AVControlPort> &&_port,
			   QueueSessionListener &_listener)
	:renderer(_renderer), listener(_listener),
	 queue(std::move(tracks)), port(std::move(_port))
{
}

QueueSession::~QueueSession() noexcept = default;

AVControlPort &
QueueSession::GetPort() const
{
	if (!port)
		throw std::runtime_error("No active playback session");

	return *port;
}

void
QueueSession::PlayCurrent()
{
	auto &p = GetPort();
	const auto &track = queue.GetCurrent();
	p.SetTransportUri(track.url, track.title, FormatDidlMetadata(track));
	p.Play();
}

void
QueueSession::PreloadNext() noexcept
{
	queue.ClearPreloaded();

	if (!renderer.supports_gapless_preload || !queue.HasNext() || !port)
		return;

	const unsigned position = queue.GetCurrentPosition() + 1;
	const auto &track = queue.Get(position);

	try {
		port->SetNextTransportUri(track.url, track.title,
					  FormatDidlMetadata(track));
	} catch (...) {
		FmtWarning(session_domain, "[{}] Preload failed: {}",
			   renderer.name, std::current_exception());
		return;
	}

	queue.SetPreloaded();
	FmtDebug(session_domain, "[{}] Preloaded track {}: {}",
		 renderer.name, position + 1, track.title);
}

void
QueueSession::Start()
{
	std::unique_lock lock{mutex};

	try {
		GetPort().Subscribe([weak = weak_from_this()](const TransportEvent &event){
			if (auto session = weak.lock())
				session->OnTransportEvent(event);
		});

		PlayCurrent();
	} catch (...) {
		FmtError(session_domain, "[{}] Failed to start playback: {}",
			 renderer.name, std::current_exception());
		Teardown(lock, false);
		throw;
	}

	FmtInfo(session_domain, "[{}] Playing track 1/{}: {}",
		renderer.name, queue.GetLength(), queue.GetCurrent().title);

	PreloadNext();

	lock.unlock();
	DrainEvents();
}

void
QueueSession::OnTransportEvent(const TransportEvent &event) noexcept
{
	{
		const std::scoped_lock lock{event_mutex};
		pending_events.push_back(event);
	}

	DrainEvents();
}

std::optional<TransportEvent>
QueueSession::PopEvent() noexcept
{
	const std::scoped_lock lock{event_mutex};
	if (pending_events.empty())
		return std::nullopt;

	auto event = std::move(pending_events.front());
	pending_events.pop_front();
	return event;
}

void
QueueSession::DrainEvents() noexcept
{
	while (true) {
		std::unique_lock lock{mutex, std::try_to_lock};
		if (!lock.owns_lock())
			/* the owner will see our events when it calls
			   DrainEvents() after unlocking */
			return;

		bool finished = false;
		while (auto event = PopEvent())
			if (HandleEvent(*event))
				finished = true;

		if (finished) {
			FmtInfo(session_domain, "[{}] Queue finished",
				renderer.name);
			Teardown(lock, false);
		}

		lock.unlock();

		/* an event may have been queued after the last
		   PopEvent() while we still held the lock */
		const std::scoped_lock event_lock{event_mutex};
		if (pending_events.empty())
			return;
	}
}

bool
QueueSession::HandleEvent(const TransportEvent &event) noexcept
{
	FmtDebug(session_domain, "[{}] Event: state={}, uri={:?}",
		 renderer.name, ToString(event.state),
		 event.current_track_uri);

	if (!port)
		/* already finished; late events are ignored */
		return false;

	if (queue.IsPreloadedUri(event.current_track_uri)) {
		/* the renderer has switched to the preloaded track
		   on its own */
		queue.AdvanceToPreloaded();
		FmtInfo(session_domain, "[{}] Transitioned to track {}/{}: {}",
			renderer.name, queue.GetCurrentPosition() + 1,
			queue.GetLength(), queue.GetCurrent().title);
		PreloadNext();
		return false;
	}

	if (event.state != TransportState::STOPPED)
		return false;

	if (!renderer.supports_gapless_preload && queue.HasNext()) {
		FmtInfo(session_domain, "[{}] Track ended, advancing",
			renderer.name);
		AutoAdvance();
		return false;
	}

	return queue.IsLast();
}

void
QueueSession::AutoAdvance() noexcept
{
	queue.MoveTo(queue.GetCurrentPosition() + 1);

	try {
		PlayCurrent();
	} catch (...) {
		FmtError(session_domain, "[{}] Auto-advance failed: {}",
			 renderer.name, std::current_exception());
		return;
	}

	FmtInfo(session_domain, "[{}] Auto-advanced to track {}/{}: {}",
		renderer.name, queue.GetCurrentPosition() + 1,
		queue.GetLength(), queue.GetCurrent().title);
}

std::optional<Track>
QueueSession::SkipNext()
{
	const ScopeDrainEvents drain(*this);
	const std::scoped_lock lock{mutex};

	CheckPort();

	if (!queue.HasNext())
		return std::nullopt;

	queue.MoveTo(queue.GetCurrentPosition() + 1);
	PlayCurrent();
	PreloadNext();

	FmtInfo(session_domain, "[{}] Skipped to track {}/{}: {}",
		renderer.name, queue.GetCurrentPosition() + 1,
		queue.GetLength(), queue.GetCurrent().title);
	return queue.GetCurrent();
}

std::optional<Track>
QueueSession::SkipPrevious()
{
	const ScopeDrainEvents drain(*this);
	const std::scoped_lock lock{mutex};

	CheckPort();

	if (!queue.HasPrevious())
		return std::nullopt;

	queue.MoveTo(queue.GetCurrentPosition() - 1);
	PlayCurrent();
	PreloadNext();

	FmtInfo(session_domain, "[{}] Back to track {}/{}: {}",
		renderer.name, queue.GetCurrentPosition() + 1,
		queue.GetLength(), queue.GetCurrent().title);
	return queue.GetCurrent();
}

void
QueueSession::SetVolume(int level)
{
	level = std::clamp(level, 0, 100);

	const ScopeDrainEvents drain(*this);
	const std::scoped_lock lock{mutex};

	auto &p = GetPort();

	if (!renderer.HasRenderingControl())
		throw std::runtime_error("Renderer has no RenderingControl service");

	p.SetVolume(level / 100.0);
	FmtDebug(session_domain, "[{}] Volume set to {}",
		 renderer.name, level);
}

void
QueueSession::Pause()
{
	const ScopeDrainEvents drain(*this);
	const std::scoped_lock lock{mutex};

	GetPort().Pause();
}

void
QueueSession::Resume()
{
	const ScopeDrainEvents drain(*this);
	const std::scoped_lock lock{mutex};

	GetPort().Play();
}

void
QueueSession::Stop() noexcept
{
	std::unique_lock lock{mutex};
	Teardown(lock, true);
	FmtInfo(session_domain, "[{}] Stopped", renderer.name);
}

void
QueueSession::Teardown(std::unique_lock<Mutex> &lock, bool send_stop) noexcept
{
	if (auto old_port = std::move(port)) {
		queue.ClearPreloaded();

		if (send_stop) {
			try {
				old_port->Stop();
			} catch (...) {
				FmtDebug(session_domain, "[{}] Stop failed: {}",
					 renderer.name, std::current_exception());
			}
		}

		try {
			old_port->Unsubscribe();
		} catch (...) {
			FmtDebug(session_domain, "[{}] Unsubscribe failed: {}",
				 renderer.name, std::current_exception());
		}
	}

	const ScopeUnlock unlock(lock);
	listener.OnSessionFinished(*this);
}

QueueStatus
QueueSession::GetStatus() const noexcept
{
	const std::scoped_lock lock{mutex};
	const auto &track = queue.GetCurrent();

	return {
		renderer.name,
		port != nullptr,
		queue.GetCurrentPosition() + 1,
		queue.GetLength(),
		track.title,
		track.artist,
		track.album,
	};
}

std::optional<unsigned>
QueueSession::GetPreloadedPosition() const noexcept
{
	const std::scoped_lock lock{mutex};
	return queue.GetPreloaded();
}
