#pragma once

#include <gtest/gtest.h>

/*
 * Dispatches to the standard gtest main function, while adding the LoggingUtil cmdline params.
 *
 * Every test binary's main() should be:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */
int launch_gtest(int argc, char** argv);
