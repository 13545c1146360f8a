#pragma once

// Process exit codes shared by every fguard_cli subcommand.
constexpr int kExitValid = 0;
constexpr int kExitError = 1;    // usage, I/O or malformed input
constexpr int kExitInvalid = 2;  // input processed, validation failed
