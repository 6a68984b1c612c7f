// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef TOKENIZER_HXX
#define TOKENIZER_HXX

/**
 * Splits a line into words and quoted strings.  Operates in place:
 * the input buffer is modified and the returned pointers point into
 * it.
 */
class Tokenizer {
	char *input;

public:
	/**
	 * @param _input the input string; the contents will be
	 * modified by this class
	 */
	explicit Tokenizer(char *_input) noexcept;

	Tokenizer(const Tokenizer &) = delete;
	Tokenizer &operator=(const Tokenizer &) = delete;

	char *Rest() noexcept {
		return input;
	}

	char CurrentChar() const noexcept {
		return *input;
	}

	bool IsEnd() const noexcept {
		return CurrentChar() == 0;
	}

	/**
	 * Reads the next word (a letter followed by letters, digits
	 * or underscores).  Throws std::runtime_error on error.
	 *
	 * @return a pointer to the null-terminated word, or nullptr
	 * on end of line
	 */
	char *NextWord();

	/**
	 * Reads the next unquoted word.  Throws std::runtime_error on
	 * error.
	 */
	char *NextUnquoted();

	/**
	 * Reads the next quoted string.  A backslash escapes the
	 * following character.  Throws std::runtime_error on error.
	 */
	char *NextString();

	/**
	 * Reads the next unquoted word or quoted string.
	 */
	char *NextParam();

private:
	template<typename P>
	char *NextToken(P &&is_valid_char, const char *error_message);
};

#endif
