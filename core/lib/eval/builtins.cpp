// fieldcalc/eval/builtins.cpp - Built-in formula functions

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <limits>
#include <string>
#include <utility>

#include "fieldcalc/eval/evaluator.hpp"
#include "fieldcalc/eval/function_registry.hpp"

namespace fieldcalc
{

namespace
{

using Args = gsl::span<const Value>;

FormulaError argument_error(std::string_view fn, std::string message)
{
  auto err = FormulaError::make(ErrorKind::FunctionArgument, fmt::format("{}() {}", fn, message));
  err.names.emplace_back(fn);
  return err;
}

FormulaError expected_kind(std::string_view fn, std::string_view what, const Value & got)
{
  return argument_error(fn, fmt::format("expects {}, got {}", what, got.type_name()));
}

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// ============================================================================
// Numeric functions
// ============================================================================

Result<Value> fn_abs(Args args)
{
  const Value & x = args[0];
  if (x.is_null()) return Value::make_null();
  if (x.is_integer()) {
    if (x.as_integer() == std::numeric_limits<int64_t>::min()) {
      return Value::make_float(std::fabs(static_cast<double>(x.as_integer())));
    }
    return Value::make_integer(x.as_integer() < 0 ? -x.as_integer() : x.as_integer());
  }
  if (x.is_float()) return Value::make_float(std::fabs(x.as_float()));
  return expected_kind("abs", "a number", x);
}

/// Shared by min() and max(): `want` is -1 for min, 1 for max
Result<Value> extreme(std::string_view fn, Args args, int want)
{
  const Value * best = nullptr;
  for (const auto & v : args) {
    if (v.is_null()) continue;
    if (!v.is_numeric() && !v.is_text()) {
      return expected_kind(fn, "numbers or text", v);
    }
    if (best == nullptr) {
      best = &v;
      continue;
    }
    const auto c = compare_values(v, *best);
    if (!c) {
      if (v.is_numeric() != best->is_numeric()) {
        return argument_error(fn, "arguments must be all numbers or all text");
      }
      continue;  // NaN never replaces the current pick
    }
    if (*c == want) {
      best = &v;
    }
  }
  return best ? *best : Value::make_null();
}

Result<Value> fn_min(Args args) { return extreme("min", args, -1); }
Result<Value> fn_max(Args args) { return extreme("max", args, 1); }

Result<Value> fn_sum(Args args)
{
  Value total = Value::make_integer(0);
  for (const auto & v : args) {
    if (v.is_null()) continue;
    if (!v.is_numeric()) {
      return expected_kind("sum", "numbers", v);
    }
    auto next = eval_arithmetic(BinaryOp::Add, total, v);
    if (!next) return next;
    total = std::move(next).value();
  }
  return total;
}

Result<Value> fn_pow(Args args)
{
  if (args[0].is_null() || args[1].is_null()) return Value::make_null();
  for (const auto & v : args) {
    if (!v.is_numeric()) return expected_kind("pow", "numbers", v);
  }
  return eval_arithmetic(BinaryOp::Pow, args[0], args[1]);
}

/// Round half away from zero to `digits` decimal places (may be negative)
Result<Value> fn_round(Args args)
{
  const Value & x = args[0];
  if (x.is_null()) return Value::make_null();
  if (!x.is_numeric()) return expected_kind("round", "a number", x);

  int64_t digits = 0;
  if (args.size() > 1) {
    const Value & d = args[1];
    if (d.is_integer()) {
      digits = d.as_integer();
    } else if (d.is_float() && std::trunc(d.as_float()) == d.as_float() &&
               std::fabs(d.as_float()) < 1e6) {
      digits = static_cast<int64_t>(d.as_float());
    } else {
      return argument_error(
        "round", fmt::format("expects an integer digit count, got {}", format_value(d)));
    }
  }

  if (x.is_integer()) {
    if (digits >= 0) return x;
    if (digits < -18) return Value::make_integer(0);

    int64_t step = 1;
    for (int64_t i = 0; i < -digits; ++i) step *= 10;

    const int64_t v = x.as_integer();
    int64_t q = v / step;
    const int64_t rem = v % step;
    // |rem| * 2 >= step without overflowing
    if ((rem < 0 ? -rem : rem) >= step - (rem < 0 ? -rem : rem)) {
      q += (v < 0) ? -1 : 1;
    }
    if (q > std::numeric_limits<int64_t>::max() / step ||
        q < std::numeric_limits<int64_t>::min() / step) {
      return Value::make_float(static_cast<double>(q) * static_cast<double>(step));
    }
    return Value::make_integer(q * step);
  }

  const double v = x.as_float();
  if (!std::isfinite(v)) return x;
  const double factor = std::pow(10.0, static_cast<double>(digits));
  const double scaled = v * factor;
  if (!std::isfinite(scaled) || factor == 0.0) {
    return (factor == 0.0) ? Value::make_float(0.0) : x;
  }
  return Value::make_float(std::round(scaled) / factor);
}

// ============================================================================
// Text functions
// ============================================================================

// Non-text arguments are rendered to text first
template <typename F>
Result<Value> map_text(const Value & x, F && transform)
{
  if (x.is_null()) return Value::make_null();
  return Value::make_text(transform(x.is_text() ? x.as_text() : format_value(x)));
}

Result<Value> fn_upper(Args args)
{
  return map_text(args[0], [](std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    return s;
  });
}

Result<Value> fn_lower(Args args)
{
  return map_text(args[0], [](std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return s;
  });
}

Result<Value> fn_strip(Args args)
{
  return map_text(args[0], [](const std::string & s) {
    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return (first < last) ? std::string(first, last) : std::string();
  });
}

Result<Value> fn_concat(Args args)
{
  std::string out;
  for (const auto & v : args) {
    out += format_value(v);
  }
  return Value::make_text(std::move(out));
}

// ============================================================================
// Logic and null handling
// ============================================================================

Result<Value> fn_if_else(Args args) { return is_truthy(args[0]) ? args[1] : args[2]; }

Result<Value> fn_is_empty(Args args)
{
  const Value & x = args[0];
  if (x.is_null()) return Value::make_bool(true);
  if (x.is_text()) {
    return Value::make_bool(std::all_of(x.as_text().begin(), x.as_text().end(), is_space));
  }
  return Value::make_bool(false);
}

Result<Value> fn_coalesce(Args args)
{
  for (const auto & v : args) {
    if (!v.is_null()) return v;
  }
  return Value::make_null();
}

FunctionSpec spec(
  std::string name, size_t min_arity, std::optional<size_t> max_arity, ResultType result,
  NativeFunction fn)
{
  FunctionSpec s;
  s.name = std::move(name);
  s.min_arity = min_arity;
  s.max_arity = max_arity;
  s.result = result;
  s.fn = std::move(fn);
  return s;
}

}  // namespace

void register_builtins(FunctionRegistry & registry, Clock clock)
{
  if (!clock) {
    clock = [] { return std::chrono::system_clock::now(); };
  }

  constexpr std::optional<size_t> variadic = std::nullopt;

  registry.register_function(spec("abs", 1, 1, ResultType::Number, fn_abs));
  registry.register_function(spec("min", 1, variadic, ResultType::Unknown, fn_min));
  registry.register_function(spec("max", 1, variadic, ResultType::Unknown, fn_max));
  registry.register_function(spec("round", 1, 2, ResultType::Number, fn_round));
  registry.register_function(spec("sum", 0, variadic, ResultType::Number, fn_sum));
  registry.register_function(spec("pow", 2, 2, ResultType::Number, fn_pow));

  registry.register_function(spec("upper", 1, 1, ResultType::Text, fn_upper));
  registry.register_function(spec("lower", 1, 1, ResultType::Text, fn_lower));
  registry.register_function(spec("strip", 1, 1, ResultType::Text, fn_strip));
  registry.register_function(spec("concat", 0, variadic, ResultType::Text, fn_concat));

  registry.register_function(spec("if_else", 3, 3, ResultType::Unknown, fn_if_else));
  registry.register_function(spec("is_empty", 1, 1, ResultType::Boolean, fn_is_empty));
  registry.register_function(spec("coalesce", 0, variadic, ResultType::Unknown, fn_coalesce));

  registry.register_function(spec(
    "now", 0, 0, ResultType::Text, [clock = std::move(clock)](Args) -> Result<Value> {
      const std::time_t t = std::chrono::system_clock::to_time_t(clock());
      return Value::make_text(fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::gmtime(t)));
    }));
}

}  // namespace fieldcalc
