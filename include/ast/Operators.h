/**
 * @file
 * @brief Operator enumerations and the operator expression nodes.
 */
#pragma once

#include <memory>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

enum class BinaryOperator {
    Add, Sub, Mul, MatMul, Div, FloorDiv, Mod, Pow,
    LShift, RShift, BitOr, BitXor, BitAnd
};
enum class CompareOperator { Eq, NotEq, Lt, LtE, Gt, GtE, Is, IsNot, In, NotIn };
enum class UnaryOperator { Not, Neg, Pos, Invert };
enum class BoolOperator { And, Or };

struct BinaryExpr final : Expr, Acceptable<BinaryExpr, NodeKind::BinaryExpr> {
    BinaryOperator op;
    std::unique_ptr<Expr> lhs;
    std::unique_ptr<Expr> rhs;
    BinaryExpr(const BinaryOperator o, std::unique_ptr<Expr> a, std::unique_ptr<Expr> b)
        : Expr(NodeKind::BinaryExpr), op(o), lhs(std::move(a)), rhs(std::move(b)) {}
};

struct UnaryExpr final : Expr, Acceptable<UnaryExpr, NodeKind::UnaryExpr> {
    UnaryOperator op;
    std::unique_ptr<Expr> operand;
    UnaryExpr(const UnaryOperator o, std::unique_ptr<Expr> e)
        : Expr(NodeKind::UnaryExpr), op(o), operand(std::move(e)) {}
};

// a or b or c is one node with three values.
struct BoolOp final : Expr, Acceptable<BoolOp, NodeKind::BoolOp> {
    BoolOperator op;
    std::vector<std::unique_ptr<Expr>> values;
    explicit BoolOp(const BoolOperator o) : Expr(NodeKind::BoolOp), op(o) {}
};

// a < b <= c: ops and comparators run in parallel.
struct Compare final : Expr, Acceptable<Compare, NodeKind::Compare> {
    std::unique_ptr<Expr> left;
    std::vector<CompareOperator> ops;
    std::vector<std::unique_ptr<Expr>> comparators;
    Compare() : Expr(NodeKind::Compare) {}
};

} // namespace agentrun::ast
