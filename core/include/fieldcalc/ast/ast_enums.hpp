// fieldcalc/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds and operators of the formula language.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace fieldcalc
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * The set is closed; literal kinds are kept contiguous for range checks.
 */
enum class NodeKind : uint8_t {
  // === Literals ===
  IntLiteral,
  FloatLiteral,
  StringLiteral,
  BoolLiteral,
  NullLiteral,

  // === Other expressions ===
  FieldRef,
  UnaryExpr,
  BinaryExpr,
  CallExpr,
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators, lowest precedence first.
 */
enum class BinaryOp : uint8_t {
  // Logical (short-circuit)
  Or,   ///< or
  And,  ///< and
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Pow,  ///< ** (right-associative)
};

/**
 * Unary operators.
 */
enum class UnaryOp : uint8_t {
  Plus,  ///< +
  Neg,   ///< -
  Not,   ///< not
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
    case NodeKind::IntLiteral:
      return "IntLiteral";
    case NodeKind::FloatLiteral:
      return "FloatLiteral";
    case NodeKind::StringLiteral:
      return "StringLiteral";
    case NodeKind::BoolLiteral:
      return "BoolLiteral";
    case NodeKind::NullLiteral:
      return "NullLiteral";
    case NodeKind::FieldRef:
      return "FieldRef";
    case NodeKind::UnaryExpr:
      return "UnaryExpr";
    case NodeKind::BinaryExpr:
      return "BinaryExpr";
    case NodeKind::CallExpr:
      return "CallExpr";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Or:
      return "or";
    case BinaryOp::And:
      return "and";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Pow:
      return "**";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "not";
  }
  return "";
}

// ============================================================================
// Operator / NodeKind classification
// ============================================================================

[[nodiscard]] constexpr bool is_logical(BinaryOp op) noexcept
{
  return op == BinaryOp::Or || op == BinaryOp::And;
}

[[nodiscard]] constexpr bool is_comparison(BinaryOp op) noexcept
{
  return op >= BinaryOp::Eq && op <= BinaryOp::Ge;
}

[[nodiscard]] constexpr bool is_arithmetic(BinaryOp op) noexcept
{
  return op >= BinaryOp::Add && op <= BinaryOp::Pow;
}

}  // namespace fieldcalc
