// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Client.hxx"
#include "Domain.hxx"
#include "command/AllCommands.hxx"
#include "Log.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

CommandResult
Client::ProcessLine(char *line) noexcept
{
	line = Strip(line);
	if (*line == 0)
		/* ignore empty lines */
		return CommandResult::OK;

	const unsigned id = num++;

	if (!IsLowerAlphaASCII(*line)) {
		/* all valid commands begin with a lower case
		   letter */
		FmtWarning(client_domain, "[{}] malformed command {:?}",
			   id, line);
		Write("ACK [5@0] {} malformed command\n");
		return CommandResult::ERROR;
	}

	FmtDebug(client_domain, "[{}] process command {:?}", id, line);
	auto ret = command_process(*this, line);
	FmtDebug(client_domain, "[{}] command returned {}",
		 id, unsigned(ret));

	if (ret == CommandResult::OK)
		WriteOK();

	return ret;
}
