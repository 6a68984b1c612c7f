// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef DLNAQ_RENDERER_COMMANDS_HXX
#define DLNAQ_RENDERER_COMMANDS_HXX

#include "CommandResult.hxx"

class Client;
class Request;
class Response;

CommandResult
handle_list_renderers(Client &client, Request request, Response &response);

CommandResult
handle_play(Client &client, Request request, Response &response);

CommandResult
handle_stop(Client &client, Request request, Response &response);

CommandResult
handle_pause(Client &client, Request request, Response &response);

CommandResult
handle_resume(Client &client, Request request, Response &response);

CommandResult
handle_next(Client &client, Request request, Response &response);

CommandResult
handle_previous(Client &client, Request request, Response &response);

CommandResult
handle_status(Client &client, Request request, Response &response);

CommandResult
handle_setvol(Client &client, Request request, Response &response);

#endif
