#include "fguard/validation/validation_rule.h"

#include <utility>

namespace fguard::validation {

Pattern make_pattern(std::string source) {
  std::regex compiled(source, std::regex::ECMAScript);
  return Pattern{std::move(source), std::move(compiled)};
}

}  // namespace fguard::validation
