// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Exception.hxx"
#include "StringStrip.hxx"

static void
AppendMessage(std::string &dest, const char *src) noexcept
{
	dest += Strip(std::string_view{src});
}

static void
AppendNested(std::string &result, const std::exception &e,
	     const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		result += separator;
		AppendMessage(result, nested.what());
		AppendNested(result, nested, fallback, separator);
	} catch (...) {
		result += separator;
		result += fallback;
	}
}

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
{
	std::string result;
	AppendMessage(result, e.what());
	AppendNested(result, e, fallback, separator);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	if (!ep)
		return fallback;

	try {
		std::rethrow_exception(std::move(ep));
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}
