#pragma once

// cmd_check: check a single value against one rule kind.
int cmd_check(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
