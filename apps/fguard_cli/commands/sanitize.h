#pragma once

// cmd_sanitize: print the sanitized form of a JSON document.
int cmd_sanitize(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
