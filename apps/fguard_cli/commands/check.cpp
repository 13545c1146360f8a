#include "check.h"

#include "check_logic.h"
#include "exit_codes.h"
#include "shared/arg_parser.h"
#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

std::optional<double> parse_bound(const std::string& text) {
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

int cmd_check(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  bool has_value = false;
  const std::vector<fguard::apps::Option<CheckRequest>> options = {
      {"--kind", true, "Rule kind (cpf, cnpj, isbn, email, ...)",
       [](CheckRequest& c, const std::string& v) {
         c.kind = v;
         return true;
       }},
      {"--value", true, "Value to check (a string unless --json is given)",
       [&has_value](CheckRequest& c, const std::string& v) {
         c.value = v;
         has_value = true;
         return true;
       }},
      {"--json", false, "Parse --value as a JSON document",
       [](CheckRequest& c, const std::string& /*v*/) {
         c.value_is_json = true;
         return true;
       }},
      {"--min", true, "Lower bound (length, value or password length)",
       [](CheckRequest& c, const std::string& v) {
         c.min = parse_bound(v);
         return c.min.has_value();
       }},
      {"--max", true, "Upper bound",
       [](CheckRequest& c, const std::string& v) {
         c.max = parse_bound(v);
         return c.max.has_value();
       }},
      {"--pattern", true, "ECMAScript regular expression the value must match",
       [](CheckRequest& c, const std::string& v) {
         c.pattern = v;
         return true;
       }},
  };
  const auto parsed = fguard::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    std::cerr << "Usage: fguard_cli check [options]\n" << fguard::apps::describe_options(options);
    return kExitError;
  }

  if (parsed.config.kind.empty() || !has_value) {
    std::cerr << "Error: --kind <kind> and --value <text> are required\n";
    return kExitError;
  }

  const auto outcome = execute_check(parsed.config);
  if (!outcome.error.empty()) {
    std::cerr << "Error: " << outcome.error << "\n";
    return outcome.exit_code;
  }
  std::cout << outcome.output.dump(2) << "\n";
  return outcome.exit_code;
}
