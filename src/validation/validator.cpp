#include "fguard/validation/validator.h"

#include "fguard/validation/rule_kind.h"
#include "fguard/validation/type_checkers.h"

#include <algorithm>
#include <exception>
#include <regex>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace fguard::validation {

using json = nlohmann::json;

namespace {

bool is_empty(const json& value) {
  return value.is_null() || (value.is_string() && value.get_ref<const json::string_t&>().empty());
}

// Strings render unquoted; everything else as compact JSON.
std::string display(const json& value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

std::string message_or(const ValidationRule& rule, std::string fallback) {
  return rule.message.has_value() ? rule.message.value() : std::move(fallback);
}

std::string enum_message(const std::string& field, const std::vector<json>& allowed) {
  std::string out = field + " must be one of: ";
  for (std::size_t i = 0; i < allowed.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += display(allowed[i]);
  }
  return out;
}

ValidationErrorItem make_error(const std::string& field, std::string message, const json& value,
                               ErrorCode code) {
  return ValidationErrorItem{field, std::move(message), value, code};
}

}  // namespace

Validator::Validator(json data) : data_(std::move(data)) {
  if (!data_.is_object()) {
    throw std::invalid_argument("validation input must be a JSON object");
  }
  sanitized_ = data_;
}

std::optional<ValidationErrorItem> Validator::apply_rule(const std::string& field,
                                                         const ValidationRule& rule,
                                                         json& current) {
  // (1) required, (2) empty and optional
  if (is_empty(current)) {
    if (rule.required) {
      return make_error(field, message_or(rule, field + " is required"), current,
                        ErrorCode::kRequired);
    }
    if (rule.default_value.has_value()) {
      current = rule.default_value.value();
      sanitized_[field] = current;
    }
    return std::nullopt;
  }

  // (3) transform; recorded even if a later step fails
  if (rule.transform) {
    try {
      current = rule.transform(current);
    } catch (const std::exception& e) {
      return make_error(field, message_or(rule, field + " could not be transformed: " + e.what()),
                        current, ErrorCode::kValidationFailed);
    } catch (...) {
      return make_error(field, message_or(rule, field + " could not be transformed: unknown error"),
                        current, ErrorCode::kValidationFailed);
    }
    sanitized_[field] = current;
  }

  // (4) kind
  if (!check_kind(rule.kind, current, Bounds{rule.min, rule.max})) {
    const std::string tail = std::visit(
        [](const auto& k) { return std::string(std::decay_t<decltype(k)>::kDefaultMessage); },
        rule.kind);
    return make_error(field, message_or(rule, field + " " + tail), current,
                      kind_error_code(rule.kind));
  }

  // (5) custom predicate
  if (rule.custom) {
    bool passed = false;
    std::string failure = field + " failed custom validation";
    try {
      passed = rule.custom(current);
    } catch (const std::exception& e) {
      failure += ": ";
      failure += e.what();
    } catch (...) {
      failure += ": unknown error";
    }
    if (!passed) {
      return make_error(field, message_or(rule, std::move(failure)), current,
                        ErrorCode::kCustomValidationFailed);
    }
  }

  // (6) enum membership by JSON equality
  if (rule.allowed_values.has_value()) {
    const auto& allowed = rule.allowed_values.value();
    if (std::find(allowed.begin(), allowed.end(), current) == allowed.end()) {
      return make_error(field, message_or(rule, enum_message(field, allowed)), current,
                        ErrorCode::kInvalidEnumValue);
    }
  }

  // (7) pattern, search semantics
  if (rule.pattern.has_value()) {
    const std::string text = display(current);
    if (text.size() > kMaxPatternInputBytes || !std::regex_search(text, rule.pattern->regex)) {
      return make_error(field, message_or(rule, field + " has an invalid format"), current,
                        ErrorCode::kPatternMismatch);
    }
  }

  return std::nullopt;
}

Validator& Validator::validate_field(const std::string& field, const ValidationRule& rule) {
  return validate_field(field, FieldRules{rule});
}

Validator& Validator::validate_field(const std::string& field, const FieldRules& rules) {
  json current = data_.contains(field) ? data_.at(field) : json(nullptr);
  for (const auto& rule : rules) {
    auto error = apply_rule(field, rule, current);
    if (error.has_value()) {
      errors_.push_back(std::move(error.value()));
      break;
    }
  }
  return *this;
}

Validator& Validator::validate_fields(const schema::Schema& schema) {
  for (const auto& spec : schema.fields) {
    validate_field(spec.field, spec.rules);
  }
  for (const auto& check : schema.record_checks) {
    custom(check);
  }
  return *this;
}

Validator& Validator::custom(const schema::RecordCheck& check) {
  if (!check) {
    return *this;
  }
  try {
    auto error = check(data_);
    if (error.has_value()) {
      errors_.push_back(std::move(error.value()));
    }
  } catch (const std::exception& e) {
    errors_.push_back(make_error("", std::string("Custom validation failed: ") + e.what(),
                                 json(nullptr), ErrorCode::kCustomValidationFailed));
  } catch (...) {
    errors_.push_back(make_error("", "Custom validation failed: unknown error", json(nullptr),
                                 ErrorCode::kCustomValidationFailed));
  }
  return *this;
}

ValidationResult Validator::result() const {
  ValidationResult out;
  out.is_valid = errors_.empty();
  out.errors = errors_;
  out.sanitized_data = sanitized_;
  return out;
}

void Validator::throw_if_invalid(const std::string& message) const {
  if (!errors_.empty()) {
    throw ValidationFailed(message, errors_);
  }
}

bool validate_value(const json& value, const ValidationRule& rule) {
  json data = json::object();
  data["value"] = value;
  Validator validator(std::move(data));
  validator.validate_field("value", rule);
  return validator.result().is_valid;
}

ValidationResult validate_object(const json& data, const schema::Schema& schema) {
  Validator validator(data);
  validator.validate_fields(schema);
  return validator.result();
}

}  // namespace fguard::validation
