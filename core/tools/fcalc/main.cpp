// fcalc - Field formula calculator command line interface
//
// Usage:
//   fcalc eval <formula> [--set name=value]... [--json]
//   fcalc parse <formula> [--json]
//   fcalc order <file.yaml>
//   fcalc run [file.yaml] [--json]
//   fcalc check [file.yaml]
//
#include <fmt/core.h>

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "fieldcalc/ast/ast_dumper.hpp"
#include "fieldcalc/ast/json_visitor.hpp"
#include "fieldcalc/basic/diagnostic_printer.hpp"
#include "fieldcalc/driver/batch_evaluator.hpp"
#include "fieldcalc/driver/output_mappings.hpp"
#include "fieldcalc/eval/evaluator.hpp"
#include "fieldcalc/project/entity_config.hpp"
#include "fieldcalc/sema/analysis/formula_checker.hpp"
#include "fieldcalc/sema/analysis/reference_collector.hpp"
#include "fieldcalc/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_error = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "fcalc - field formula calculator v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  eval <formula>           Evaluate one formula\n"
            << "  parse <formula>          Print the syntax tree and referenced fields\n"
            << "  order <file.yaml>        Print the evaluation order of calculated fields\n"
            << "  run [file.yaml]          Evaluate all calculated fields and outputs\n"
            << "  check [file.yaml]        Check every formula without evaluating\n\n"
            << "Options:\n"
            << "  --set <name>=<value>     Field value for eval (repeatable)\n"
            << "  --json                   JSON output\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n\n"
            << "Without a file, run and check use " << fieldcalc::k_entity_config_file_name
            << " from the current directory or its parents.\n";
}

nlohmann::json value_to_json(const fieldcalc::Value & v)
{
  switch (v.kind()) {
    case fieldcalc::ValueKind::Null:
      return nullptr;
    case fieldcalc::ValueKind::Integer:
      return v.as_integer();
    case fieldcalc::ValueKind::Float:
      return v.as_float();
    case fieldcalc::ValueKind::Bool:
      return v.as_bool();
    case fieldcalc::ValueKind::Text:
      return v.as_text();
  }
  return nullptr;
}

nlohmann::json error_to_json(const fieldcalc::FormulaError & err)
{
  nlohmann::json j{
    {"kind", std::string(fieldcalc::to_string(err.kind))},
    {"code", std::string(fieldcalc::error_code(err.kind))},
    {"message", err.message}};
  if (!err.names.empty()) {
    j["names"] = err.names;
  }
  if (!err.causes.empty()) {
    nlohmann::json causes = nlohmann::json::array();
    for (const auto & c : err.causes) {
      causes.push_back(error_to_json(c));
    }
    j["causes"] = causes;
  }
  return j;
}

/// "null" for null, the text representation otherwise
std::string display_value(const fieldcalc::Value & v)
{
  if (v.is_null()) return "null";
  if (v.is_text()) return fmt::format("\"{}\"", v.as_text());
  return fieldcalc::format_value(v);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::string>> sets;
  bool json = false;
  bool verbose = false;
  bool no_color = false;
  bool show_help = false;
  std::string usage_error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--set") {
      if (i + 1 >= argc) {
        args.usage_error = "--set requires <name>=<value>";
        break;
      }
      const std::string assignment = argv[++i];
      const auto eq = assignment.find('=');
      if (eq == std::string::npos || eq == 0) {
        args.usage_error = "invalid --set '" + assignment + "' (expected <name>=<value>)";
        break;
      }
      args.sets.emplace_back(assignment.substr(0, eq), assignment.substr(eq + 1));
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg.rfind("--", 0) == 0) {
      args.usage_error = "unknown option '" + arg + "'";
      break;
    } else {
      // Formulas may start with '-', so anything else is positional
      args.positional.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Diagnostics
// ============================================================================

class Reporter
{
public:
  explicit Reporter(bool no_color)
  : printer_(std::cerr, !no_color && isatty(fileno(stderr)) != 0)
  {
  }

  /// Print an error against the formula it came from
  void error(const fieldcalc::FormulaError & err, const std::string & origin, std::string formula)
  {
    const auto diag = fieldcalc::to_diagnostic(err);
    if (err.range.is_valid() && !formula.empty()) {
      const fieldcalc::SourceManager source(origin, std::move(formula));
      printer_.print(diag, source);
    } else {
      printer_.print_detached(diag, origin);
    }
  }

  void all(const fieldcalc::DiagnosticBag & bag, const std::string & origin, std::string formula)
  {
    const fieldcalc::SourceManager source(origin, std::move(formula));
    printer_.print_all(bag, source);
  }

private:
  fieldcalc::DiagnosticPrinter printer_;
};

std::optional<fieldcalc::EntityConfig> load_entity(const CommandArgs & args)
{
  fs::path path;
  if (!args.positional.empty()) {
    path = args.positional.front();
  } else {
    auto found = fieldcalc::find_entity_config(fs::current_path());
    if (!found) {
      std::cerr << "error: no " << fieldcalc::k_entity_config_file_name
                << " found in current directory or parents\n";
      return std::nullopt;
    }
    path = *found;
  }

  auto result = fieldcalc::load_entity_config(path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Loaded entity '" << result.config.entity << "' from " << path.string() << " ("
              << result.config.fields.size() << " fields)\n";
  }
  return std::move(result.config);
}

/// Formula text a batch-level error points into, if it names a calculated field
std::pair<std::string, std::string> error_origin(
  const fieldcalc::FormulaError & err, const fieldcalc::EntityConfig & entity)
{
  if (!err.names.empty()) {
    if (const auto * field = entity.find_field(err.names.front())) {
      return {field->id, field->formula.value_or("")};
    }
  }
  return {entity.entity.empty() ? "entity" : entity.entity, ""};
}

// ============================================================================
// Commands
// ============================================================================

int cmd_eval(const CommandArgs & args)
{
  if (args.positional.size() != 1) {
    std::cerr << "error: expected exactly one formula\n"
              << "usage: fcalc eval <formula> [--set name=value]... [--json]\n";
    return k_exit_usage;
  }

  const std::string & text = args.positional.front();
  Reporter reporter(args.no_color);

  auto formula = fieldcalc::parse_formula(text);
  if (!formula) {
    reporter.error(formula.error(), "<formula>", text);
    return k_exit_error;
  }

  fieldcalc::FieldSnapshot snapshot;
  for (const auto & [name, raw] : args.sets) {
    snapshot.insert_or_assign(name, fieldcalc::value_from_text(raw));
  }

  const auto registry = fieldcalc::FunctionRegistry::with_builtins();
  auto value = fieldcalc::evaluate(formula->root(), snapshot, registry);

  if (args.json) {
    nlohmann::json out;
    if (value) {
      out["value"] = value_to_json(value.value());
      out["type"] = std::string(value->type_name());
    } else {
      out["error"] = error_to_json(value.error());
    }
    std::cout << out.dump(2) << "\n";
  }

  if (!value) {
    if (!args.json) reporter.error(value.error(), "<formula>", text);
    return k_exit_error;
  }

  if (!args.json) {
    std::cout << display_value(value.value()) << "\n";
  }
  return k_exit_ok;
}

int cmd_parse(const CommandArgs & args)
{
  if (args.positional.size() != 1) {
    std::cerr << "error: expected exactly one formula\n"
              << "usage: fcalc parse <formula> [--json]\n";
    return k_exit_usage;
  }

  const std::string & text = args.positional.front();
  auto formula = fieldcalc::parse_formula(text);
  if (!formula) {
    Reporter(args.no_color).error(formula.error(), "<formula>", text);
    return k_exit_error;
  }

  const auto refs = fieldcalc::extract_field_references(formula->root());

  if (args.json) {
    const nlohmann::json out{
      {"ast", fieldcalc::to_json(formula->root())}, {"references", refs}};
    std::cout << out.dump(2) << "\n";
    return k_exit_ok;
  }

  std::cout << fieldcalc::dump_sexpr(formula->root()) << "\n";
  std::string joined;
  for (const auto & r : refs) {
    if (!joined.empty()) joined += ", ";
    joined += r;
  }
  std::cout << "references: " << (joined.empty() ? "(none)" : joined) << "\n";
  return k_exit_ok;
}

int cmd_order(const CommandArgs & args)
{
  if (args.positional.size() != 1) {
    std::cerr << "error: entity file required\n"
              << "usage: fcalc order <file.yaml>\n";
    return k_exit_usage;
  }

  auto entity = load_entity(args);
  if (!entity) return k_exit_error;

  auto order = fieldcalc::compute_evaluation_order(entity->formulas());
  if (!order) {
    const auto [origin, formula] = error_origin(order.error(), *entity);
    Reporter(args.no_color).error(order.error(), origin, formula);
    return k_exit_error;
  }

  for (const auto & id : order.value()) {
    std::cout << id << "\n";
  }
  return k_exit_ok;
}

int cmd_run(const CommandArgs & args)
{
  auto entity = load_entity(args);
  if (!entity) return k_exit_error;

  const auto registry = fieldcalc::FunctionRegistry::with_builtins();
  fieldcalc::BatchEvaluator batch(registry);
  Reporter reporter(args.no_color);

  auto result = batch.evaluate(entity->formulas(), entity->snapshot());
  if (!result) {
    const auto [origin, formula] = error_origin(result.error(), *entity);
    reporter.error(result.error(), origin, formula);
    return k_exit_error;
  }

  if (args.verbose) {
    std::string joined;
    for (const auto & id : result->order) {
      if (!joined.empty()) joined += ", ";
      joined += id;
    }
    std::cerr << "Evaluation order: " << joined << "\n";
  }

  bool failed = result->failure_count() > 0;

  // Outputs see the merged snapshot of this run
  std::vector<std::pair<std::string, fieldcalc::Result<fieldcalc::Value>>> outputs;
  for (const auto & [id, mappings] : entity->outputs) {
    outputs.emplace_back(
      id, fieldcalc::evaluate_output_mappings(
            id, mappings, result->snapshot, registry, &batch.cache()));
    failed = failed || outputs.back().second.has_error();
  }

  if (args.json) {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto & [id, r] : result->results) {
      fields[id] = r ? nlohmann::json{{"value", value_to_json(r.value())}}
                     : nlohmann::json{{"error", error_to_json(r.error())}};
    }
    nlohmann::json outs = nlohmann::json::object();
    for (const auto & [id, r] : outputs) {
      outs[id] = r ? nlohmann::json{{"value", value_to_json(r.value())}}
                   : nlohmann::json{{"error", error_to_json(r.error())}};
    }
    const nlohmann::json out{
      {"entity", entity->entity}, {"order", result->order}, {"fields", fields}, {"outputs", outs}};
    std::cout << out.dump(2) << "\n";
    return failed ? k_exit_error : k_exit_ok;
  }

  for (const auto & id : result->order) {
    const auto & r = result->results.at(id);
    if (r) {
      std::cout << id << " = " << display_value(r.value()) << "\n";
    } else {
      std::cout << id << " = <error>\n";
      reporter.error(r.error(), id, entity->find_field(id)->formula.value_or(""));
    }
  }
  for (const auto & [id, r] : outputs) {
    if (r) {
      std::cout << id << " -> " << display_value(r.value()) << "\n";
    } else {
      std::cout << id << " -> <error>\n";
      reporter.error(r.error(), id, "");
    }
  }

  return failed ? k_exit_error : k_exit_ok;
}

int cmd_check(const CommandArgs & args)
{
  auto entity = load_entity(args);
  if (!entity) return k_exit_error;

  const auto registry = fieldcalc::FunctionRegistry::with_builtins();
  const auto schema = entity->schema();
  const fieldcalc::FormulaChecker checker(registry, schema);
  Reporter reporter(args.no_color);

  bool ok = true;
  size_t warnings = 0;

  auto check_one = [&](const std::string & origin, const std::string & text) {
    auto formula = fieldcalc::parse_formula(text);
    if (!formula) {
      reporter.error(formula.error(), origin, text);
      ok = false;
      return;
    }
    fieldcalc::DiagnosticBag diags;
    ok = checker.check(formula.value(), diags) && ok;
    warnings += diags.warnings().size();
    if (!diags.empty()) {
      reporter.all(diags, origin, text);
    }
  };

  for (const auto & field : entity->fields) {
    if (field.formula) check_one(field.id, *field.formula);
  }
  for (const auto & [id, mappings] : entity->outputs) {
    for (size_t i = 0; i < mappings.size(); ++i) {
      check_one(fmt::format("{}[{}]", id, i), mappings[i].formula);
    }
  }

  // Cycles are only visible across formulas
  auto order = fieldcalc::compute_evaluation_order(entity->formulas());
  if (!order && order.error().is(fieldcalc::ErrorKind::CircularDependency)) {
    const auto [origin, formula] = error_origin(order.error(), *entity);
    reporter.error(order.error(), origin, formula);
    ok = false;
  }

  const std::string name = entity->entity.empty() ? "entity" : entity->entity;
  if (!ok) {
    return k_exit_error;
  }
  std::cout << name << ": OK";
  if (warnings > 0) {
    std::cout << " (" << warnings << " warning" << (warnings == 1 ? "" : "s") << ")";
  }
  std::cout << "\n";
  return k_exit_ok;
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return (argc < 2) ? k_exit_usage : k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    return k_exit_usage;
  }

  if (args.command == "eval") return cmd_eval(args);
  if (args.command == "parse") return cmd_parse(args);
  if (args.command == "order") return cmd_order(args);
  if (args.command == "run") return cmd_run(args);
  if (args.command == "check") return cmd_check(args);

  std::cerr << "error: unknown command '" << args.command << "'\n\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
