// fieldcalc/project/entity_config.cpp - Entity definition loading
//
#include "fieldcalc/project/entity_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <system_error>

#include "fieldcalc/eval/coercion.hpp"

namespace fieldcalc
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (
      std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

/// [+-]digits[.digits][(e|E)[+-]digits], or [+-].digits[...]
bool looks_like_decimal(std::string_view s)
{
  size_t i = 0;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;

  size_t digits = 0;
  while (i < s.size() && is_digit(s[i])) {
    ++i;
    ++digits;
  }
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && is_digit(s[i])) {
      ++i;
      ++digits;
    }
  }
  if (digits == 0) return false;

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    size_t exp_digits = 0;
    while (i < s.size() && is_digit(s[i])) {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0) return false;
  }
  return i == s.size();
}

/// Plain (unquoted) scalar text to value
Value plain_scalar_value(const std::string & s)
{
  if (s.empty() || s == "~" || iequals(s, "null")) return Value::make_null();
  if (iequals(s, "true")) return Value::make_bool(true);
  if (iequals(s, "false")) return Value::make_bool(false);

  const char * first = s.data();
  const char * last = s.data() + s.size();
  if (*first == '+') ++first;

  int64_t iv = 0;
  const auto [ptr, ec] = std::from_chars(first, last, iv);
  if (ec == std::errc() && ptr == last && first != last) {
    return Value::make_integer(iv);
  }

  if (looks_like_decimal(s)) {
    return Value::make_float(std::strtod(s.c_str(), nullptr));
  }
  return Value::make_text(s);
}

Value scalar_value(const YAML::Node & node)
{
  if (node.IsNull()) return Value::make_null();
  // Quoted scalars carry the non-specific tag "!" and are always text
  if (node.Tag() == "!") return Value::make_text(node.Scalar());
  return plain_scalar_value(node.Scalar());
}

/// Parse one `id: {type, value | formula}` entry
std::optional<FieldConfig> parse_field(
  const std::string & id, const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "field '" + id + "' must be a map";
    return std::nullopt;
  }

  FieldConfig field;
  field.id = id;

  if (node["type"]) {
    const auto type_name = node["type"].as<std::string>();
    auto type = parse_field_type(type_name);
    if (!type) {
      error = "field '" + id + "' has invalid type '" + type_name +
              "' (must be text, number, boolean or calculated)";
      return std::nullopt;
    }
    field.type = *type;
  }

  const bool has_value = static_cast<bool>(node["value"]);
  const bool has_formula = static_cast<bool>(node["formula"]);

  if (has_value && has_formula) {
    error = "field '" + id + "' cannot have both 'value' and 'formula'";
    return std::nullopt;
  }

  if (has_value) {
    if (!node["value"].IsScalar() && !node["value"].IsNull()) {
      error = "field '" + id + "' value must be a scalar";
      return std::nullopt;
    }
    field.value = scalar_value(node["value"]);
  }
  if (has_formula) {
    field.formula = node["formula"].as<std::string>();
  }

  return field;
}

/// Parse the mapping list of one output field
std::optional<std::vector<OutputMapping>> parse_mappings(
  const std::string & id, const YAML::Node & node, std::string & error)
{
  if (!node.IsSequence()) {
    error = "outputs." + id + " must be a list";
    return std::nullopt;
  }

  std::vector<OutputMapping> mappings;
  for (const auto & entry : node) {
    if (!entry.IsMap() || !entry["formula"]) {
      error = "outputs." + id + " entries must be maps with a 'formula'";
      return std::nullopt;
    }

    OutputMapping m;
    m.formula = entry["formula"].as<std::string>();
    if (entry["target"]) {
      const auto target_name = entry["target"].as<std::string>();
      auto target = parse_output_target(target_name);
      if (!target) {
        error = "outputs." + id + " has unknown target '" + target_name +
                "' (must be TEXT, NUMBER or BOOLEAN)";
        return std::nullopt;
      }
      m.target = *target;
    }
    mappings.push_back(std::move(m));
  }
  return mappings;
}

ConfigLoadResult parse_entity_config(const YAML::Node & root)
{
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("entity definition must be a map");
  }

  EntityConfig config;

  try {
    if (root["entity"]) {
      config.entity = root["entity"].as<std::string>();
    }

    if (root["fields"]) {
      if (!root["fields"].IsMap()) {
        return ConfigLoadResult::fail("fields must be a map");
      }
      for (const auto & kv : root["fields"]) {
        std::string field_error;
        auto field = parse_field(kv.first.as<std::string>(), kv.second, field_error);
        if (!field) {
          return ConfigLoadResult::fail("invalid field: " + field_error);
        }
        config.fields.push_back(std::move(*field));
      }
    }

    if (root["outputs"]) {
      if (!root["outputs"].IsMap()) {
        return ConfigLoadResult::fail("outputs must be a map");
      }
      for (const auto & kv : root["outputs"]) {
        const auto id = kv.first.as<std::string>();
        std::string mapping_error;
        auto mappings = parse_mappings(id, kv.second, mapping_error);
        if (!mappings) {
          return ConfigLoadResult::fail("invalid output mapping: " + mapping_error);
        }
        config.outputs.insert_or_assign(id, std::move(*mappings));
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid entity definition: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

// ============================================================================
// FieldType
// ============================================================================

std::string_view to_string(FieldType t) noexcept
{
  switch (t) {
    case FieldType::Text:
      return "text";
    case FieldType::Number:
      return "number";
    case FieldType::Boolean:
      return "boolean";
    case FieldType::Calculated:
      return "calculated";
  }
  return "";
}

std::optional<FieldType> parse_field_type(std::string_view name)
{
  for (const auto t :
       {FieldType::Text, FieldType::Number, FieldType::Boolean, FieldType::Calculated}) {
    if (iequals(name, to_string(t))) return t;
  }
  return std::nullopt;
}

// ============================================================================
// EntityConfig
// ============================================================================

const FieldConfig * EntityConfig::find_field(std::string_view id) const
{
  for (const auto & f : fields) {
    if (f.id == id) return &f;
  }
  return nullptr;
}

FormulaTextMap EntityConfig::formulas() const
{
  FormulaTextMap out;
  for (const auto & f : fields) {
    if (f.formula) out.insert_or_assign(f.id, *f.formula);
  }
  return out;
}

FieldSnapshot EntityConfig::snapshot() const
{
  FieldSnapshot out;
  for (const auto & f : fields) {
    if (!f.is_calculated() && f.value) out.insert_or_assign(f.id, *f.value);
  }
  return out;
}

FieldSchema EntityConfig::schema() const
{
  FieldSchema out;
  for (const auto & f : fields) {
    ResultType t = ResultType::Unknown;
    switch (f.type) {
      case FieldType::Text:
        t = ResultType::Text;
        break;
      case FieldType::Number:
        t = ResultType::Number;
        break;
      case FieldType::Boolean:
        t = ResultType::Boolean;
        break;
      case FieldType::Calculated:
        break;
    }
    out.insert_or_assign(f.id, t);
  }
  return out;
}

// ============================================================================
// Loading
// ============================================================================

ConfigLoadResult load_entity_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  auto result = parse_entity_config(root);
  if (result.success) {
    result.config.root = fs::absolute(config_path).parent_path();
  }
  return result;
}

ConfigLoadResult load_entity_config_from_string(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_entity_config(root);
}

std::optional<std::filesystem::path> find_entity_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_entity_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

Value value_from_text(std::string_view text)
{
  try {
    const YAML::Node node = YAML::Load(std::string(text));
    if (node.IsNull()) return Value::make_null();
    if (node.IsScalar()) return scalar_value(node);
  } catch (const YAML::Exception &) {
    // Not valid YAML on its own (e.g. "a: b: c"); treat as plain text
    return Value::make_text(std::string(text));
  }
  return Value::make_text(std::string(text));
}

}  // namespace fieldcalc
