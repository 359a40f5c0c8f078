// fieldcalc/project/entity_config.hpp - Entity definition file (fcalc.yaml)
//
// Describes one entity: its fields (typed values or formulas) and the output
// mappings used to render calculated fields.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fieldcalc/driver/batch_evaluator.hpp"
#include "fieldcalc/driver/output_mappings.hpp"
#include "fieldcalc/eval/evaluator.hpp"
#include "fieldcalc/eval/value.hpp"
#include "fieldcalc/sema/analysis/formula_checker.hpp"

namespace fieldcalc
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class FieldType : uint8_t {
  Text,
  Number,
  Boolean,
  Calculated,  ///< Value comes from a formula; type not declared
};

[[nodiscard]] std::string_view to_string(FieldType t) noexcept;
[[nodiscard]] std::optional<FieldType> parse_field_type(std::string_view name);

struct FieldConfig
{
  std::string id;
  FieldType type = FieldType::Calculated;

  /// Current value of an input field (absent = not provided)
  std::optional<Value> value;

  /// Formula text of a calculated field
  std::optional<std::string> formula;

  [[nodiscard]] bool is_calculated() const noexcept { return formula.has_value(); }
};

struct EntityConfig
{
  std::string entity;

  /// Fields in declaration order
  std::vector<FieldConfig> fields;

  /// Output mappings per field id
  std::map<std::string, std::vector<OutputMapping>, std::less<>> outputs;

  /// Directory containing the file (empty when loaded from a string)
  std::filesystem::path root;

  [[nodiscard]] const FieldConfig * find_field(std::string_view id) const;

  /// Formulas of all calculated fields
  [[nodiscard]] FormulaTextMap formulas() const;

  /// Values of all input fields that have one
  [[nodiscard]] FieldSnapshot snapshot() const;

  /// Declared type of every field (calculated fields without a type: Unknown)
  [[nodiscard]] FieldSchema schema() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  EntityConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(EntityConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load an entity definition from a YAML file.
 *
 * @param config_path Path to the file (usually fcalc.yaml)
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_entity_config(const std::filesystem::path & config_path);

/// Load an entity definition from YAML text.
[[nodiscard]] ConfigLoadResult load_entity_config_from_string(std::string_view yaml_text);

/**
 * Find an entity definition file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to fcalc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_entity_config(
  const std::filesystem::path & start_dir);

/**
 * Convert scalar text to a value with the YAML scalar rules used by the
 * configuration file: null/~ -> null, true/false -> boolean, integer text
 * -> integer, decimal text -> float, quoted or anything else -> text.
 */
[[nodiscard]] Value value_from_text(std::string_view text);

inline constexpr const char * k_entity_config_file_name = "fcalc.yaml";

}  // namespace fieldcalc
