// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Registry.hxx"
#include "QueueSession.hxx"
#include "ControlPoint.hxx"
#include "AVControlPort.hxx"
#include "Domain.hxx"
#include "Log.hxx"

#include <cassert>

SessionRegistry::~SessionRegistry() noexcept
{
	StopAll();
}

void
SessionRegistry::AcquireControlPoint()
{
	const std::scoped_lock lock{mutex};

	if (control_point_refs == 0) {
		control_point.Open();
		LogInfo(session_domain, "Control point opened");
	}

	++control_point_refs;
}

void
SessionRegistry::ReleaseControlPoint() noexcept
{
	const std::scoped_lock lock{mutex};
	assert(control_point_refs > 0);

	if (--control_point_refs == 0) {
		control_point.Close();
		LogInfo(session_domain, "Control point closed");
	}
}

std::shared_ptr<QueueSession>
SessionRegistry::PlayTracks(const RendererRecord &renderer,
			    std::vector<Track> &&tracks)
{
	const std::scoped_lock play_lock{play_mutex};

	if (auto old = GetSession(renderer.identity)) {
		FmtInfo(session_domain, "[{}] Replacing the current session",
			renderer.name);
		old->Stop();
	}

	AcquireControlPoint();

	std::shared_ptr<QueueSession> session;
	try {
		session = std::make_shared<QueueSession>(renderer,
							 std::move(tracks),
							 control_point.Connect(renderer),
							 *this);
	} catch (...) {
		ReleaseControlPoint();
		throw;
	}

	{
		/* the reference obtained above now belongs to the
		   map entry */
		const std::scoped_lock lock{mutex};
		sessions.insert_or_assign(renderer.identity, session);
	}

	/* on failure, Start() has already called
	   OnSessionFinished() */
	session->Start();
	return session;
}

std::shared_ptr<QueueSession>
SessionRegistry::GetSession(std::string_view identity) const noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = sessions.find(identity);
	if (i == sessions.end())
		return nullptr;

	return i->second;
}

SessionMap
SessionRegistry::GetAllSessions() const noexcept
{
	const std::scoped_lock lock{mutex};
	return sessions;
}

void
SessionRegistry::StopAll() noexcept
{
	for (const auto &i : GetAllSessions())
		i.second->Stop();
}

void
SessionRegistry::OnSessionFinished(QueueSession &session) noexcept
{
	{
		const std::scoped_lock lock{mutex};

		auto i = sessions.find(session.GetRenderer().identity);
		if (i == sessions.end() || i->second.get() != &session)
			/* already removed or replaced */
			return;

		sessions.erase(i);
	}

	ReleaseControlPoint();
}
