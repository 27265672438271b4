/**
 * @file
 * @brief AST structural pattern declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

struct Pattern : Node { using Node::Node; };

// Literal or dotted value pattern: case 1, case "x", case Color.RED
struct PatternValue final : Pattern, Acceptable<PatternValue, NodeKind::PatternValue> {
  std::unique_ptr<Expr> value;
  explicit PatternValue(std::unique_ptr<Expr> v)
      : Pattern(NodeKind::PatternValue), value(std::move(v)) {}
};

// Capture pattern; the wildcard is a capture named "_".
struct PatternCapture final : Pattern, Acceptable<PatternCapture, NodeKind::PatternCapture> {
  std::string name;
  explicit PatternCapture(std::string n) : Pattern(NodeKind::PatternCapture), name(std::move(n)) {}
};

struct PatternSequence final : Pattern, Acceptable<PatternSequence, NodeKind::PatternSequence> {
  bool isList{true}; // true: [], false: ()
  std::vector<std::unique_ptr<Pattern>> elements;
  PatternSequence() : Pattern(NodeKind::PatternSequence) {}
};

struct PatternMapping final : Pattern, Acceptable<PatternMapping, NodeKind::PatternMapping> {
  std::vector<std::pair<std::unique_ptr<Expr>, std::unique_ptr<Pattern>>> items;
  std::string restName; // '**rest', empty if absent
  PatternMapping() : Pattern(NodeKind::PatternMapping) {}
};

struct PatternClass final : Pattern, Acceptable<PatternClass, NodeKind::PatternClass> {
  std::unique_ptr<Expr> cls; // Name or dotted Attribute
  std::vector<std::unique_ptr<Pattern>> args;
  std::vector<std::pair<std::string, std::unique_ptr<Pattern>>> kwargs;
  explicit PatternClass(std::unique_ptr<Expr> c)
      : Pattern(NodeKind::PatternClass), cls(std::move(c)) {}
};

struct PatternStar final : Pattern, Acceptable<PatternStar, NodeKind::PatternStar> {
  std::string name; // may be "_" to discard
  explicit PatternStar(std::string n) : Pattern(NodeKind::PatternStar), name(std::move(n)) {}
};

struct PatternAs final : Pattern, Acceptable<PatternAs, NodeKind::PatternAs> {
  std::unique_ptr<Pattern> pattern;
  std::string name;
  PatternAs(std::unique_ptr<Pattern> p, std::string n)
      : Pattern(NodeKind::PatternAs), pattern(std::move(p)), name(std::move(n)) {}
};

struct PatternOr final : Pattern, Acceptable<PatternOr, NodeKind::PatternOr> {
  std::vector<std::unique_ptr<Pattern>> patterns;
  PatternOr() : Pattern(NodeKind::PatternOr) {}
};

} // namespace agentrun::ast
