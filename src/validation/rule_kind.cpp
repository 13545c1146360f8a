#include "fguard/validation/rule_kind.h"

#include <cstddef>
#include <type_traits>
#include <utility>

namespace fguard::validation {

namespace {

template <std::size_t... Is>
std::optional<RuleKind> find_kind(std::string_view name, std::index_sequence<Is...> /*unused*/) {
  std::optional<RuleKind> found;
  // Fold over every alternative; the first matching name wins.
  (void)((std::variant_alternative_t<Is, RuleKind>::kName == name
              ? (found.emplace(std::in_place_index<Is>), true)
              : false) ||
         ...);
  return found;
}

}  // namespace

std::string_view kind_name(const RuleKind& kind) noexcept {
  return std::visit([](const auto& k) { return std::decay_t<decltype(k)>::kName; }, kind);
}

ErrorCode kind_error_code(const RuleKind& kind) noexcept {
  return std::visit([](const auto& k) { return std::decay_t<decltype(k)>::kCode; }, kind);
}

std::optional<RuleKind> kind_from_name(std::string_view name) {
  return find_kind(name, std::make_index_sequence<std::variant_size_v<RuleKind>>{});
}

}  // namespace fguard::validation
