/*
 * The main() function of all unit test programs.  Set the environment
 * variable DLNAQ_TEST_VERBOSE=1 to see debug log messages.
 */

#include "LogBackend.hxx"

#include <gtest/gtest.h>

#include <stdlib.h>
#include <string.h>

int
main(int argc, char **argv)
{
	testing::InitGoogleTest(&argc, argv);

	if (const char *verbose = getenv("DLNAQ_TEST_VERBOSE");
	    verbose != nullptr && strcmp(verbose, "1") == 0)
		SetLogThreshold(LogLevel::DEBUG);
	else
		SetLogThreshold(LogLevel::ERROR);

	return RUN_ALL_TESTS();
}
