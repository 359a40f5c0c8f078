// fieldcalc/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
#pragma once

#include <type_traits>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/ast/ast_enums.hpp"
#include "fieldcalc/basic/casting.hpp"

namespace fieldcalc
{

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements visit_<snake_name> for the node types it
 * cares about; everything else falls back to visit_expr and visit_node.
 *
 * @code
 *   class Printer : public ConstAstVisitor<Printer> {
 *   public:
 *     void visit_field_ref_expr(const FieldRefExpr* node) { std::cout << node->name; }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT The node pointer type (AstNode* or const AstNode*)
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->get_kind()) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "fieldcalc/ast/ast_nodes.def"
    }

    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#include "fieldcalc/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that automatically traverses child nodes in source order.
 *
 * Override specific visit methods to customize behavior. Call the base
 * implementation to continue traversal, or skip it to prune the subtree.
 * Returning false stops the whole walk.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->lhs)) return false;
    if (!get_derived().visit(node->rhs)) return false;
    return true;
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  // Leaves
  bool visit_expr(NodePtr<Expr> /*node*/) { return true; }
};

/// Alias for const recursive AST traversal
template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace fieldcalc
