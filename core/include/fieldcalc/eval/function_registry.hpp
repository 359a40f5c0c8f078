// fieldcalc/eval/function_registry.hpp - Callable table for formula function calls
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <gsl/span>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fieldcalc/basic/error.hpp"
#include "fieldcalc/eval/value.hpp"

namespace fieldcalc
{

/// Already-evaluated arguments in call order
using NativeFunction = std::function<Result<Value>(gsl::span<const Value>)>;

/// Time source for now(); injected so results are reproducible in tests
using Clock = std::function<std::chrono::system_clock::time_point()>;

struct FunctionSpec
{
  std::string name;
  size_t min_arity = 0;
  std::optional<size_t> max_arity;  ///< nullopt = variadic
  ResultType result = ResultType::Unknown;
  NativeFunction fn;

  [[nodiscard]] bool accepts(size_t argc) const noexcept
  {
    return argc >= min_arity && (!max_arity || argc <= *max_arity);
  }

  /// "1 argument", "at least 1 argument", "1 to 2 arguments"
  [[nodiscard]] std::string arity_text() const;
};

/**
 * Name -> function table consulted by the evaluator for every call.
 *
 * The registry checks arity before invoking a function; each function then
 * validates its own argument kinds. Registering an existing name replaces it.
 */
class FunctionRegistry
{
public:
  FunctionRegistry() = default;

  /// Registry pre-filled with the built-in function set
  [[nodiscard]] static FunctionRegistry with_builtins(Clock clock = {});

  void register_function(FunctionSpec spec);

  [[nodiscard]] const FunctionSpec * find(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }
  [[nodiscard]] size_t size() const noexcept { return functions_.size(); }

  /// Registered names in ascending order
  [[nodiscard]] std::vector<std::string> names() const;

  /**
   * Call `name` with evaluated arguments.
   *
   * @param range Call-site range attached to registry-level errors
   * @return UnknownFunction / FunctionArgument (arity) errors, or whatever
   *         the function itself returns
   */
  [[nodiscard]] Result<Value> call(
    std::string_view name, gsl::span<const Value> args, SourceRange range = {}) const;

private:
  std::map<std::string, FunctionSpec, std::less<>> functions_;
};

/// Register abs, min, max, round, sum, pow, upper, lower, strip, concat,
/// if_else, is_empty, coalesce and now. An empty clock means the system clock.
void register_builtins(FunctionRegistry & registry, Clock clock = {});

}  // namespace fieldcalc
