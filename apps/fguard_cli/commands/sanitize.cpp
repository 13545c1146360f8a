#include "sanitize.h"

#include "fguard/sanitize/sanitizer.h"

#include "exit_codes.h"
#include "shared/arg_parser.h"
#include "shared/json_input.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct SanitizeCliConfig {
  std::string input_path{"-"};
};

}  // namespace

int cmd_sanitize(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fguard::apps::Option<SanitizeCliConfig>> options = {
      {"--input", true, "JSON input file, or - for stdin (default: -)",
       [](SanitizeCliConfig& c, const std::string& v) {
         c.input_path = v;
         return true;
       }},
  };
  const auto parsed = fguard::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    return kExitError;
  }

  auto input = fguard::apps::read_json_input(parsed.config.input_path);
  if (!input.has_value()) {
    std::cerr << "Error: " << input.error() << "\n";
    return kExitError;
  }

  std::cout << fguard::sanitize::sanitize(input.value()).dump(2) << "\n";
  return kExitValid;
}
