#pragma once

// cmd_validate: validate a JSON record against a named or file-defined schema.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
