/**
 * @file
 * @brief Statements that fit on one logical line and own no block.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

struct ExprStmt final : Stmt, Acceptable<ExprStmt, NodeKind::ExprStmt> {
    std::unique_ptr<Expr> value;
    explicit ExprStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ExprStmt), value(std::move(v)) {}
};

struct PassStmt final : Stmt, Acceptable<PassStmt, NodeKind::PassStmt> {
    PassStmt() : Stmt(NodeKind::PassStmt) {}
};

struct BreakStmt final : Stmt, Acceptable<BreakStmt, NodeKind::BreakStmt> {
    BreakStmt() : Stmt(NodeKind::BreakStmt) {}
};

struct ContinueStmt final : Stmt, Acceptable<ContinueStmt, NodeKind::ContinueStmt> {
    ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
};

// del a, b[0]: every target is in Del context.
struct DelStmt final : Stmt, Acceptable<DelStmt, NodeKind::DelStmt> {
    std::vector<std::unique_ptr<Expr>> targets;
    DelStmt() : Stmt(NodeKind::DelStmt) {}
};

struct ReturnStmt final : Stmt, Acceptable<ReturnStmt, NodeKind::ReturnStmt> {
    std::unique_ptr<Expr> value; // null for a bare 'return'
    explicit ReturnStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ReturnStmt), value(std::move(v)) {}
};

struct RaiseStmt final : Stmt, Acceptable<RaiseStmt, NodeKind::RaiseStmt> {
    std::unique_ptr<Expr> exc;   // null for a bare re-raise
    std::unique_ptr<Expr> cause; // 'from' clause
    RaiseStmt() : Stmt(NodeKind::RaiseStmt) {}
};

struct AssertStmt final : Stmt, Acceptable<AssertStmt, NodeKind::AssertStmt> {
    std::unique_ptr<Expr> test;
    std::unique_ptr<Expr> msg; // optional
    AssertStmt() : Stmt(NodeKind::AssertStmt) {}
};

struct GlobalStmt final : Stmt, Acceptable<GlobalStmt, NodeKind::GlobalStmt> {
    std::vector<std::string> names;
    GlobalStmt() : Stmt(NodeKind::GlobalStmt) {}
};

struct NonlocalStmt final : Stmt, Acceptable<NonlocalStmt, NodeKind::NonlocalStmt> {
    std::vector<std::string> names;
    NonlocalStmt() : Stmt(NodeKind::NonlocalStmt) {}
};

} // namespace agentrun::ast
