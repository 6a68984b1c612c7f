// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef EXCEPTION_HXX
#define EXCEPTION_HXX

#include <exception>
#include <string>
#include <utility>

/**
 * Wrap the currently handled exception in a new one of type T and
 * return it as #std::exception_ptr.
 */
template<typename T>
inline std::exception_ptr
NestCurrentException(T &&t) noexcept
{
	try {
		std::throw_with_nested(std::forward<T>(t));
	} catch (...) {
		return std::current_exception();
	}
}

/**
 * Obtain the full concatenated message of an exception and its
 * nested chain.
 */
std::string
GetFullMessage(const std::exception &e,
	       const char *fallback="Unknown exception",
	       const char *separator=": ") noexcept;

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback="Unknown exception",
	       const char *separator=": ") noexcept;

#endif
