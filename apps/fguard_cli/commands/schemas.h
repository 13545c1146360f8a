#pragma once

// cmd_schemas: list registered schemas, or describe one with --name.
int cmd_schemas(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
