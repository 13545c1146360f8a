#include "fguard/schema/schema_json.h"

#include "fguard/validation/rule_kind.h"
#include "fguard/validation/transforms.h"

#include <array>
#include <optional>
#include <regex>
#include <string_view>
#include <utility>
#include <vector>

namespace fguard::schema {

using json = nlohmann::json;
using validation::Transform;
using validation::ValidationRule;
using RuleResult = core::Result<ValidationRule, std::string>;
using SchemaResult = core::Result<Schema, std::string>;

namespace {

constexpr std::array<std::string_view, 9> kRuleKeys{
    "type", "required", "min", "max", "pattern", "enum", "message", "default", "transform"};

std::optional<Transform> transform_from_name(std::string_view name) {
  namespace transforms = validation::transforms;
  if (name == "digits_only") {
    return Transform(transforms::digits_only);
  }
  if (name == "strip_isbn") {
    return Transform(transforms::strip_isbn);
  }
  if (name == "format_isbn") {
    return Transform(transforms::format_isbn);
  }
  if (name == "lower_trim") {
    return Transform(transforms::lower_trim);
  }
  if (name == "to_upper") {
    return Transform(transforms::to_upper);
  }
  if (name == "sanitize_text") {
    return Transform(transforms::sanitize_text);
  }
  return std::nullopt;
}

std::optional<std::string> read_bound(const json& j, const char* key, std::optional<double>& out) {
  if (!j.contains(key)) {
    return std::nullopt;
  }
  const json& bound = j.at(key);
  if (!bound.is_number()) {
    return std::string("'") + key + "' must be a number";
  }
  out = bound.get<double>();
  return std::nullopt;
}

json rule_to_json(const ValidationRule& rule) {
  json j;
  j["type"] = std::string(validation::kind_name(rule.kind));
  j["required"] = rule.required;
  if (rule.min.has_value()) {
    j["min"] = rule.min.value();
  }
  if (rule.max.has_value()) {
    j["max"] = rule.max.value();
  }
  if (rule.pattern.has_value()) {
    j["pattern"] = rule.pattern->source;
  }
  if (rule.allowed_values.has_value()) {
    j["enum"] = rule.allowed_values.value();
  }
  if (rule.message.has_value()) {
    j["message"] = rule.message.value();
  }
  if (rule.default_value.has_value()) {
    j["default"] = rule.default_value.value();
  }
  if (rule.custom) {
    j["custom"] = true;
  }
  if (rule.transform) {
    j["transform"] = true;
  }
  return j;
}

}  // namespace

RuleResult rule_from_json(const json& j) {
  if (!j.is_object()) {
    return RuleResult::err("rule must be a JSON object");
  }
  for (const auto& item : j.items()) {
    bool known = false;
    for (const auto key : kRuleKeys) {
      known = known || item.key() == key;
    }
    if (!known) {
      return RuleResult::err("unknown rule option '" + item.key() + "'");
    }
  }

  if (!j.contains("type") || !j.at("type").is_string()) {
    return RuleResult::err("rule needs a string 'type'");
  }
  const auto type = j.at("type").get<std::string>();
  const auto kind = validation::kind_from_name(type);
  if (!kind.has_value()) {
    return RuleResult::err("unknown rule type '" + type + "'");
  }

  ValidationRule rule;
  rule.kind = kind.value();

  if (j.contains("required")) {
    if (!j.at("required").is_boolean()) {
      return RuleResult::err("'required' must be a boolean");
    }
    rule.required = j.at("required").get<bool>();
  }

  if (auto error = read_bound(j, "min", rule.min)) {
    return RuleResult::err(std::move(error.value()));
  }
  if (auto error = read_bound(j, "max", rule.max)) {
    return RuleResult::err(std::move(error.value()));
  }

  if (j.contains("pattern")) {
    if (!j.at("pattern").is_string()) {
      return RuleResult::err("'pattern' must be a string");
    }
    try {
      rule.pattern = validation::make_pattern(j.at("pattern").get<std::string>());
    } catch (const std::regex_error& e) {
      return RuleResult::err("invalid 'pattern': " + std::string(e.what()));
    }
  }

  if (j.contains("enum")) {
    if (!j.at("enum").is_array()) {
      return RuleResult::err("'enum' must be an array");
    }
    rule.allowed_values = j.at("enum").get<std::vector<json>>();
  }

  if (j.contains("message")) {
    if (!j.at("message").is_string()) {
      return RuleResult::err("'message' must be a string");
    }
    rule.message = j.at("message").get<std::string>();
  }

  if (j.contains("default")) {
    rule.default_value = j.at("default");
  }

  if (j.contains("transform")) {
    if (!j.at("transform").is_string()) {
      return RuleResult::err("'transform' must be a string");
    }
    const auto name = j.at("transform").get<std::string>();
    auto transform = transform_from_name(name);
    if (!transform.has_value()) {
      return RuleResult::err("unknown transform '" + name + "'");
    }
    rule.transform = std::move(transform.value());
  }

  return RuleResult::ok(std::move(rule));
}

SchemaResult schema_from_json(const std::string& name, const json& j) {
  if (!j.is_object()) {
    return SchemaResult::err("schema must be a JSON object of field rules");
  }

  Schema schema;
  schema.name = name;
  for (const auto& item : j.items()) {
    FieldSpec spec;
    spec.field = item.key();

    const json& value = item.value();
    const json rules = value.is_array() ? value : json::array({value});
    if (rules.empty()) {
      return SchemaResult::err("field '" + spec.field + "': rule list is empty");
    }
    for (const auto& rule_json : rules) {
      auto rule = rule_from_json(rule_json);
      if (!rule.has_value()) {
        return SchemaResult::err("field '" + spec.field + "': " + rule.error());
      }
      spec.rules.push_back(std::move(rule.value()));
    }
    schema.fields.push_back(std::move(spec));
  }
  return SchemaResult::ok(std::move(schema));
}

core::Result<std::vector<Schema>, std::string> schemas_from_json(const json& document) {
  using FileResult = core::Result<std::vector<Schema>, std::string>;
  if (!document.is_object()) {
    return FileResult::err("schema file must map schema names to field rules");
  }

  std::vector<Schema> schemas;
  for (const auto& item : document.items()) {
    auto schema = schema_from_json(item.key(), item.value());
    if (!schema.has_value()) {
      return FileResult::err("schema '" + item.key() + "': " + schema.error());
    }
    schemas.push_back(std::move(schema.value()));
  }
  return FileResult::ok(std::move(schemas));
}

json schema_to_json(const Schema& schema) {
  json fields = json::array();
  for (const auto& spec : schema.fields) {
    json rules = json::array();
    for (const auto& rule : spec.rules) {
      rules.push_back(rule_to_json(rule));
    }
    json field_json;
    field_json["field"] = spec.field;
    field_json["rules"] = rules;
    fields.push_back(field_json);
  }

  json j;
  j["fields"] = fields;
  j["name"] = schema.name;
  j["record_checks"] = schema.record_checks.size();
  return j;
}

}  // namespace fguard::schema
