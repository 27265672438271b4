/**
 * @file
 * @brief Expressions that can appear as assignment or del targets.
 *
 * Each carries an ExprContext. The parser builds them in Load context and
 * rewrites the context when the expression turns out to be a target.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

enum class ExprContext { Load, Store, Del };

struct Name final : Expr, Acceptable<Name, NodeKind::Name> {
    std::string id;
    ExprContext ctx{ExprContext::Load};
    explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}
};

// value.attr; the attribute name is kept exactly as written.
struct Attribute final : Expr, Acceptable<Attribute, NodeKind::Attribute> {
    std::unique_ptr<Expr> value;
    std::string attr;
    ExprContext ctx{ExprContext::Load};
    Attribute(std::unique_ptr<Expr> v, std::string a)
        : Expr(NodeKind::Attribute), value(std::move(v)), attr(std::move(a)) {}
};

struct Subscript final : Expr, Acceptable<Subscript, NodeKind::Subscript> {
    std::unique_ptr<Expr> value;
    std::unique_ptr<Expr> slice; // Slice, TupleLiteral of slices, or any expression
    ExprContext ctx{ExprContext::Load};
    Subscript(std::unique_ptr<Expr> v, std::unique_ptr<Expr> s)
        : Expr(NodeKind::Subscript), value(std::move(v)), slice(std::move(s)) {}
};

// *value in a call, display or unpacking target.
struct Starred final : Expr, Acceptable<Starred, NodeKind::Starred> {
    std::unique_ptr<Expr> value;
    ExprContext ctx{ExprContext::Load};
    explicit Starred(std::unique_ptr<Expr> v) : Expr(NodeKind::Starred), value(std::move(v)) {}
};

struct ListLiteral final : Expr, Acceptable<ListLiteral, NodeKind::ListLiteral> {
    std::vector<std::unique_ptr<Expr>> elements;
    ExprContext ctx{ExprContext::Load};
    ListLiteral() : Expr(NodeKind::ListLiteral) {}
};

struct TupleLiteral final : Expr, Acceptable<TupleLiteral, NodeKind::TupleLiteral> {
    std::vector<std::unique_ptr<Expr>> elements;
    ExprContext ctx{ExprContext::Load};
    TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
};

} // namespace agentrun::ast
