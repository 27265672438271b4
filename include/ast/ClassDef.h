#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Call.h"
#include "ast/Node.h"
#include "ast/HasBody.h"
#include "ast/TypeParam.h"

namespace agentrun::ast {
    struct ClassDef final : Stmt, Acceptable<ClassDef, NodeKind::ClassDef>, HasBody<Stmt> {
        std::string name;
        std::vector<std::unique_ptr<Expr>> bases;       // positional bases
        std::vector<KeywordArg> keywords;               // metaclass=..., **kw
        std::vector<std::unique_ptr<Expr>> decorators;  // decorator expressions
        std::vector<std::unique_ptr<TypeParam>> typeParams;
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), name(std::move(n)) {}
    };
}
