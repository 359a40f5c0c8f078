#include "fieldcalc/eval/function_registry.hpp"

#include <fmt/core.h>

#include <utility>

namespace fieldcalc
{

namespace
{

std::string plural_arguments(size_t n)
{
  return fmt::format("{} argument{}", n, n == 1 ? "" : "s");
}

}  // namespace

std::string FunctionSpec::arity_text() const
{
  if (!max_arity) {
    return "at least " + plural_arguments(min_arity);
  }
  if (*max_arity == min_arity) {
    return plural_arguments(min_arity);
  }
  return fmt::format("{} to {} arguments", min_arity, *max_arity);
}

FunctionRegistry FunctionRegistry::with_builtins(Clock clock)
{
  FunctionRegistry registry;
  register_builtins(registry, std::move(clock));
  return registry;
}

void FunctionRegistry::register_function(FunctionSpec spec)
{
  std::string key = spec.name;
  functions_.insert_or_assign(std::move(key), std::move(spec));
}

const FunctionSpec * FunctionRegistry::find(std::string_view name) const
{
  auto it = functions_.find(name);
  return (it == functions_.end()) ? nullptr : &it->second;
}

std::vector<std::string> FunctionRegistry::names() const
{
  std::vector<std::string> out;
  out.reserve(functions_.size());
  for (const auto & [name, _] : functions_) {
    out.push_back(name);
  }
  return out;
}

Result<Value> FunctionRegistry::call(
  std::string_view name, gsl::span<const Value> args, SourceRange range) const
{
  const FunctionSpec * spec = find(name);
  if (spec == nullptr) {
    auto err = FormulaError::unknown_function(name, range);
    std::string available;
    for (const auto & [fn_name, _] : functions_) {
      if (!available.empty()) available += ", ";
      available += fn_name;
    }
    if (!available.empty()) {
      err.help = "available functions: " + available;
    }
    return err;
  }

  if (!spec->accepts(args.size())) {
    auto err = FormulaError::make(
      ErrorKind::FunctionArgument,
      fmt::format("{}() expects {}, got {}", spec->name, spec->arity_text(), args.size()), range);
    err.names.push_back(spec->name);
    return err;
  }

  auto result = spec->fn(args);
  if (!result && result.error().range.is_invalid()) {
    result.error().range = range;
  }
  return result;
}

}  // namespace fieldcalc
