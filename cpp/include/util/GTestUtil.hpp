#pragma once

#include <gtest/gtest.h>

/*
 * Entry point shared by all unit-test executables:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 *
 * Runs testing::InitGoogleTest(), then parses the util::Logging options from what remains of argv,
 * initializes logging, and runs all tests. --help prints our options before handing
 * over to gtest's own help.
 */
int launch_gtest(int argc, char** argv);
