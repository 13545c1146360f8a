#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fguard::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false when the value is rejected; the flag is then
// reported in ParsedOptions::errors.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config with every problem found.
// Unknown flags, missing values and rejected values are all errors; the caller
// decides how to report them. Non-flag tokens are skipped (positional arguments
// belong to the caller).
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      std::string value;
      if (opt->requires_value) {
        if (i + 1 >= argc) {
          parsed.errors.push_back("Option " + arg + " requires a value");
          continue;
        }
        value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      if (!opt->handler(parsed.config, value)) {
        parsed.errors.push_back("Invalid value for " + arg + ": " + value);
      }
    } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
      parsed.errors.push_back("Unknown option: " + arg);
    }
  }

  return parsed;
}

// One "  --flag <value>  description" line per option, for usage text.
template <typename Config>
std::string describe_options(const std::vector<Option<Config>>& options) {
  std::string out;
  for (const auto& opt : options) {
    out += "  " + opt.name;
    if (opt.requires_value) {
      out += " <value>";
    }
    out += "  " + opt.description + "\n";
  }
  return out;
}

}  // namespace fguard::apps
