/*
 * Unit tests for src/util/Exception.hxx
 */

#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, Null)
{
	ASSERT_EQ(GetFullMessage(std::exception_ptr{}), "Unknown exception");
}

TEST(ExceptionTest, Nested)
{
	std::exception_ptr ep;

	try {
		throw std::runtime_error("Connection refused");
	} catch (...) {
		ep = NestCurrentException(std::runtime_error("Failed to fetch description"));
	}

	ASSERT_EQ(GetFullMessage(ep),
		  "Failed to fetch description: Connection refused");
	ASSERT_EQ(GetFullMessage(ep, "?", " / "),
		  "Failed to fetch description / Connection refused");
}

TEST(ExceptionTest, NestedNonStandard)
{
	std::exception_ptr ep;

	try {
		throw 42;
	} catch (...) {
		ep = NestCurrentException(std::runtime_error("Outer"));
	}

	ASSERT_EQ(GetFullMessage(ep), "Outer: Unknown exception");
}
