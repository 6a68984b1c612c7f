// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "RendererCommands.hxx"
#include "Request.hxx"
#include "TrackListParser.hxx"
#include "client/Client.hxx"
#include "client/Response.hxx"
#include "discovery/DiscoveryEngine.hxx"
#include "session/QueueSession.hxx"
#include "session/Registry.hxx"

#include <fmt/format.h>

static RendererRecord
ResolveRenderer(Client &client, const char *name)
{
	auto renderer = client.GetDiscovery().Resolve(name);
	if (!renderer)
		throw ProtocolError(ACK_ERROR_NO_EXIST,
				    fmt::format("Renderer '{}' not found", name));

	return std::move(*renderer);
}

static std::shared_ptr<QueueSession>
GetActiveSession(Client &client, const RendererRecord &renderer)
{
	auto session = client.GetSessions().GetSession(renderer.identity);
	if (!session)
		throw ProtocolError(ACK_ERROR_NO_EXIST,
				    fmt::format("No active playback on '{}'",
						renderer.name));

	return session;
}

static void
PrintRenderer(Response &r, const RendererRecord &renderer) noexcept
{
	r.Fmt(FMT_STRING("renderer: {}\n"
			 "identity: {}\n"),
	      renderer.name, renderer.identity);

	if (!renderer.manufacturer.empty())
		r.Fmt(FMT_STRING("manufacturer: {}\n"), renderer.manufacturer);

	if (!renderer.model_name.empty())
		r.Fmt(FMT_STRING("model: {}\n"), renderer.model_name);

	r.Fmt(FMT_STRING("supports_queue: {}\n"),
	      unsigned(renderer.supports_gapless_preload));
}

CommandResult
handle_list_renderers(Client &client, Request args, Response &r)
{
	const bool force = !args.empty() && args.ParseForce(0);

	const auto renderers = client.GetDiscovery().Discover(force);
	for (const auto &i : *renderers)
		PrintRenderer(r, i);

	r.Fmt(FMT_STRING("total: {}\n"), renderers->size());
	return CommandResult::OK;
}

CommandResult
handle_play(Client &client, Request args, Response &r)
{
	/* validate the track list before talking to the network */
	auto tracks = ParseTrackList(args[1]);

	const auto renderer = ResolveRenderer(client, args.GetRendererName());

	const Track first = tracks.front();
	const std::size_t n_tracks = tracks.size();

	client.GetSessions().PlayTracks(renderer, std::move(tracks));

	r.Fmt(FMT_STRING("renderer: {}\n"
			 "total_tracks: {}\n"
			 "supports_gapless: {}\n"
			 "track: 1\n"
			 "title: {}\n"
			 "artist: {}\n"
			 "album: {}\n"),
	      renderer.name, n_tracks,
	      unsigned(renderer.supports_gapless_preload),
	      first.title, first.artist, first.album);
	return CommandResult::OK;
}

static void
PrintAction(Response &r, const RendererRecord &renderer,
	    const char *action) noexcept
{
	r.Fmt(FMT_STRING("renderer: {}\n"
			 "action: {}\n"),
	      renderer.name, action);
}

CommandResult
handle_stop(Client &client, Request args, Response &r)
{
	const auto renderer = ResolveRenderer(client, args.GetRendererName());
	GetActiveSession(client, renderer)->Stop();

	PrintAction(r, renderer, "stopped");
	return CommandResult::OK;
}

CommandResult
handle_pause(Client &client, Request args, Response &r)
{
	const auto renderer = ResolveRenderer(client, args.GetRendererName());
	GetActiveSession(client, renderer)->Pause();

	PrintAction(r, renderer, "paused");
	return CommandResult::OK;
}

CommandResult
handle_resume(Client &client, Request args, Response &r)
{
	const auto renderer = ResolveRenderer(client, args.GetRendererName());
	GetActiveSession(client, renderer)->Resume();

	PrintAction(r, renderer, "resumed");
	return CommandResult::OK;
}

static void
PrintNowPlaying(Response &r, const RendererRecord &renderer,
		const QueueStatus &status, const Track &track) noexcept
{
	r.Fmt(FMT_STRING("renderer: {}\n"
			 "track: {}\n"
			 "total_tracks: {}\n"
			 "title: {}\n"
			 "artist: {}\n"),
	      renderer.name, status.track, status.total_tracks,
	      track.title, track.artist);
}

CommandResult
handle_next(Client &client, Request args, Response &r)
{
	const auto renderer = ResolveRenderer(client, args.GetRendererName());
	const auto session = GetActiveSession(client, renderer);

	const auto track = session->SkipNext();
	if (!track)
		throw ProtocolError(ACK_ERROR_NO_EXIST, "Already at last track");

	PrintNowPlaying(r, renderer, session->GetStatus(), *track);
	return CommandResult::OK;
}

CommandResult
handle_previous(Client &client, Request args, Response &r)
{
	const auto renderer = ResolveRenderer(client, args.GetRendererName());
	const auto session = GetActiveSession(client, renderer);

	const auto track = session->SkipPrevious();
	if (!track)
		throw ProtocolError(ACK_ERROR_NO_EXIST, "Already at first track");

	PrintNowPlaying(r, renderer, session->GetStatus(), *track);
	return CommandResult::OK;
}

CommandResult
handle_status(Client &client, Request args, Response &r)
{
	const auto renderer = ResolveRenderer(client, args.GetRendererName());
	const auto session = client.GetSessions().GetSession(renderer.identity);
	if (!session) {
		r.Fmt(FMT_STRING("renderer: {}\n"
				 "state: idle\n"),
		      renderer.name);
		return CommandResult::OK;
	}

	const auto status = session->GetStatus();
	r.Fmt(FMT_STRING("renderer: {}\n"
			 "state: {}\n"
			 "track: {}\n"
			 "total_tracks: {}\n"
			 "title: {}\n"
			 "artist: {}\n"
			 "album: {}\n"),
	      status.renderer,
	      status.playing ? "playing" : "stopped",
	      status.track, status.total_tracks,
	      status.title, status.artist, status.album);
	return CommandResult::OK;
}

CommandResult
handle_setvol(Client &client, Request args, Response &r)
{
	const unsigned volume = args.ParseVolume(1);

	const auto renderer = ResolveRenderer(client, args.GetRendererName());
	GetActiveSession(client, renderer)->SetVolume(volume);

	r.Fmt(FMT_STRING("renderer: {}\n"
			 "volume: {}\n"),
	      renderer.name, volume);
	return CommandResult::OK;
}
