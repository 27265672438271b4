#pragma once

#include "ast/NodeKind.h"

namespace agentrun::ast {

// Forward declarations to break include cycles
struct Module;
struct FunctionDef; struct ClassDef; struct ReturnStmt; struct DelStmt; struct AssignStmt; struct AugAssignStmt;
struct AnnAssignStmt; struct ForStmt; struct WhileStmt; struct IfStmt; struct WithStmt; struct MatchStmt;
struct RaiseStmt; struct TryStmt; struct AssertStmt; struct Import; struct ImportFrom; struct GlobalStmt;
struct NonlocalStmt; struct ExprStmt; struct PassStmt; struct BreakStmt; struct ContinueStmt; struct TypeAlias;
struct BoolOp; struct NamedExpr; struct BinaryExpr; struct UnaryExpr; struct LambdaExpr; struct IfExpr;
struct DictLiteral; struct SetLiteral; struct ListComp; struct SetComp; struct DictComp; struct GeneratorExpr;
struct AwaitExpr; struct YieldExpr; struct Compare; struct Call; struct FStringLiteral; struct Constant;
struct Attribute; struct Subscript; struct Starred; struct Name; struct ListLiteral; struct TupleLiteral; struct Slice;
struct Param; struct Alias; struct ExceptHandler; struct MatchCase; struct TypeParam;
struct PatternValue; struct PatternCapture; struct PatternSequence; struct PatternMapping; struct PatternClass;
struct PatternStar; struct PatternAs; struct PatternOr;

// Virtual visitor interface for AST traversal using polymorphism.
// Every overload defaults to a no-op so visitors override only what they inspect.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  virtual void visit(const Module&) {}
  virtual void visit(const FunctionDef&) {}
  virtual void visit(const ClassDef&) {}
  virtual void visit(const ReturnStmt&) {}
  virtual void visit(const DelStmt&) {}
  virtual void visit(const AssignStmt&) {}
  virtual void visit(const AugAssignStmt&) {}
  virtual void visit(const AnnAssignStmt&) {}
  virtual void visit(const ForStmt&) {}
  virtual void visit(const WhileStmt&) {}
  virtual void visit(const IfStmt&) {}
  virtual void visit(const WithStmt&) {}
  virtual void visit(const MatchStmt&) {}
  virtual void visit(const RaiseStmt&) {}
  virtual void visit(const TryStmt&) {}
  virtual void visit(const AssertStmt&) {}
  virtual void visit(const Import&) {}
  virtual void visit(const ImportFrom&) {}
  virtual void visit(const GlobalStmt&) {}
  virtual void visit(const NonlocalStmt&) {}
  virtual void visit(const ExprStmt&) {}
  virtual void visit(const PassStmt&) {}
  virtual void visit(const BreakStmt&) {}
  virtual void visit(const ContinueStmt&) {}
  virtual void visit(const TypeAlias&) {}
  virtual void visit(const BoolOp&) {}
  virtual void visit(const NamedExpr&) {}
  virtual void visit(const BinaryExpr&) {}
  virtual void visit(const UnaryExpr&) {}
  virtual void visit(const LambdaExpr&) {}
  virtual void visit(const IfExpr&) {}
  virtual void visit(const DictLiteral&) {}
  virtual void visit(const SetLiteral&) {}
  virtual void visit(const ListComp&) {}
  virtual void visit(const SetComp&) {}
  virtual void visit(const DictComp&) {}
  virtual void visit(const GeneratorExpr&) {}
  virtual void visit(const AwaitExpr&) {}
  virtual void visit(const YieldExpr&) {}
  virtual void visit(const Compare&) {}
  virtual void visit(const Call&) {}
  virtual void visit(const FStringLiteral&) {}
  virtual void visit(const Constant&) {}
  virtual void visit(const Attribute&) {}
  virtual void visit(const Subscript&) {}
  virtual void visit(const Starred&) {}
  virtual void visit(const Name&) {}
  virtual void visit(const ListLiteral&) {}
  virtual void visit(const TupleLiteral&) {}
  virtual void visit(const Slice&) {}
  virtual void visit(const Param&) {}
  virtual void visit(const Alias&) {}
  virtual void visit(const ExceptHandler&) {}
  virtual void visit(const MatchCase&) {}
  virtual void visit(const TypeParam&) {}
  virtual void visit(const PatternValue&) {}
  virtual void visit(const PatternCapture&) {}
  virtual void visit(const PatternSequence&) {}
  virtual void visit(const PatternMapping&) {}
  virtual void visit(const PatternClass&) {}
  virtual void visit(const PatternStar&) {}
  virtual void visit(const PatternAs&) {}
  virtual void visit(const PatternOr&) {}
};

} // namespace agentrun::ast
