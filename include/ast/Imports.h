/**
 * @file
 * @brief Import statements, the input of dependency resolution and the import deny-list.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

// One 'name [as asname]' entry of an import list.
struct Alias final : Node, Acceptable<Alias, NodeKind::Alias> {
    std::string name;   // dotted for 'import a.b'; "*" for star imports
    std::string asname; // empty if none
    Alias() : Node(NodeKind::Alias) {}
    Alias(std::string n, std::string a) : Node(NodeKind::Alias), name(std::move(n)), asname(std::move(a)) {}
};

// import a.b, c as d
struct Import final : Stmt, Acceptable<Import, NodeKind::Import> {
    std::vector<Alias> names;
    Import() : Stmt(NodeKind::Import) {}
};

// from [dots]module import names; level counts the leading dots, so level > 0 is relative.
struct ImportFrom final : Stmt, Acceptable<ImportFrom, NodeKind::ImportFrom> {
    std::string module; // empty for 'from . import x'
    int level{0};
    std::vector<Alias> names;
    ImportFrom() : Stmt(NodeKind::ImportFrom) {}
};

} // namespace agentrun::ast
