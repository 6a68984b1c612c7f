// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Tokenizer.hxx"
#include "CharUtil.hxx"
#include "StringStrip.hxx"

#include <stdexcept>

Tokenizer::Tokenizer(char *_input) noexcept
	:input(StripLeft(_input)) {}

template<typename P>
inline char *
Tokenizer::NextToken(P &&is_valid_char, const char *error_message)
{
	char *const word = input;

	if (*input == 0)
		return nullptr;

	for (; *input != 0; ++input) {
		if (IsWhitespaceNotNull(*input)) {
			/* the token ends here; skip all following
			   spaces, too */
			*input = 0;
			input = StripLeft(input + 1);
			break;
		}

		if (!is_valid_char(*input, input == word))
			throw std::runtime_error(error_message);
	}

	return word;
}

char *
Tokenizer::NextWord()
{
	return NextToken([](char ch, bool first){
		return first
			? IsAlphaASCII(ch)
			: IsAlphaNumericASCII(ch) || ch == '_';
	}, "Invalid word character");
}

char *
Tokenizer::NextUnquoted()
{
	return NextToken([](char ch, bool){
		return (unsigned char)ch > 0x20 && ch != '"' && ch != '\'';
	}, "Invalid unquoted character");
}

char *
Tokenizer::NextString()
{
	char *const word = input, *dest = input;

	if (*input == 0)
		return nullptr;

	if (*input != '"')
		throw std::runtime_error("'\"' expected");

	++input;

	while (*input != '"') {
		if (*input == '\\')
			/* the backslash escapes the following
			   character */
			++input;

		if (*input == 0)
			throw std::runtime_error("Missing closing '\"'");

		*dest++ = *input++;
	}

	++input;
	if (!IsWhitespaceOrNull(*input))
		throw std::runtime_error("Space expected after closing '\"'");

	*dest = 0;
	input = StripLeft(input);
	return word;
}

char *
Tokenizer::NextParam()
{
	if (*input == '"')
		return NextString();
	else
		return NextUnquoted();
}
