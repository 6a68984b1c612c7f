// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ScpdParser.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/StringStrip.hxx"

#include <string.h>

namespace {

/**
 * Collects the text of all "actionList/action/name" elements.
 */
class ScpdParser final : public CommonExpatParser {
	std::set<std::string, std::less<>> &actions;

	enum class State {
		NONE,
		ACTION_LIST,
		ACTION,
		NAME,
	} state = State::NONE;

	/**
	 * Nesting depth of unrelated elements below "action"
	 * (e.g. "argumentList" which has "name" children too).
	 */
	unsigned skip_depth = 0;

	std::string value;

public:
	explicit ScpdParser(std::set<std::string, std::less<>> &_actions) noexcept
		:actions(_actions) {}

protected:
	void StartElement(const XML_Char *name, const XML_Char **) override {
		const char *colon = strrchr(name, ':');
		const std::string_view local = colon != nullptr ? colon + 1 : name;

		if (skip_depth > 0) {
			++skip_depth;
			return;
		}

		switch (state) {
		case State::NONE:
			if (local == "actionList")
				state = State::ACTION_LIST;
			break;

		case State::ACTION_LIST:
			if (local == "action")
				state = State::ACTION;
			else
				skip_depth = 1;
			break;

		case State::ACTION:
			if (local == "name") {
				state = State::NAME;
				value.clear();
			} else
				skip_depth = 1;
			break;

		case State::NAME:
			break;
		}
	}

	void EndElement(const XML_Char *) override {
		if (skip_depth > 0) {
			--skip_depth;
			return;
		}

		switch (state) {
		case State::NONE:
			break;

		case State::ACTION_LIST:
			state = State::NONE;
			break;

		case State::ACTION:
			state = State::ACTION_LIST;
			break;

		case State::NAME:
			if (const auto name = Strip(std::string_view{value});
			    !name.empty())
				actions.emplace(name);
			state = State::ACTION;
			break;
		}
	}

	void CharacterData(const XML_Char *s, int len) override {
		if (state == State::NAME)
			value.append(s, len);
	}
};

} // anonymous namespace

std::set<std::string, std::less<>>
ParseScpdActions(std::string_view document)
{
	std::set<std::string, std::less<>> actions;
	ScpdParser parser(actions);
	parser.CompleteParse(document);
	return actions;
}
