// fieldcalc/ast/ast.hpp - AST node class definitions for formulas
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "fieldcalc/ast/ast_enums.hpp"
#include "fieldcalc/basic/casting.hpp"
#include "fieldcalc/basic/source_manager.hpp"

namespace fieldcalc
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in the formula text
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets into the formula text

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/**
 * Base class for expressions. Every formula node is an expression.
 */
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * /*node*/) { return true; }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Literals
// ============================================================================

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  explicit FloatLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// String literal; value is the unescaped, arena-interned text.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// References, operators and calls
// ============================================================================

/// Reference to another field of the same entity.
class FieldRefExpr : public NodeBase<FieldRefExpr, Expr, NodeKind::FieldRef>
{
public:
  std::string_view name;

  explicit FieldRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  /// Range of the operator token, used to point diagnostics at the operator
  SourceRange op_range;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {}, SourceRange op_r = {})
  : NodeBase(range), lhs(l), op(o), rhs(r), op_range(op_r)
  {
  }
};

/// Function call: name(arg, ...).
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  std::string_view callee;
  SourceRange callee_range;
  gsl::span<Expr *> args;

  CallExpr(std::string_view c, SourceRange c_range, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), callee(c), callee_range(c_range), args(a)
  {
  }
};

}  // namespace fieldcalc
