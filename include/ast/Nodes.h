/**
 * @file
 * @brief Umbrella include for every concrete AST node.
 */
#pragma once

#include "ast/Module.h"

#include "ast/AnnAssignStmt.h"
#include "ast/SimpleStmts.h"
#include "ast/AssignStmt.h"
#include "ast/AugAssignStmt.h"
#include "ast/ClassDef.h"
#include "ast/ForStmt.h"
#include "ast/FunctionDef.h"
#include "ast/IfStmt.h"
#include "ast/Imports.h"
#include "ast/MatchStmt.h"
#include "ast/TryStmt.h"
#include "ast/TypeAlias.h"
#include "ast/WhileStmt.h"
#include "ast/WithStmt.h"

#include "ast/Targets.h"
#include "ast/Operators.h"
#include "ast/AwaitExpr.h"
#include "ast/Call.h"
#include "ast/Comprehension.h"
#include "ast/Constant.h"
#include "ast/DictLiteral.h"
#include "ast/FStringLiteral.h"
#include "ast/IfExpr.h"
#include "ast/LambdaExpr.h"
#include "ast/NamedExpr.h"
#include "ast/SetLiteral.h"
#include "ast/Slice.h"
#include "ast/TypeParam.h"
#include "ast/YieldExpr.h"

#include "ast/Pattern.h"
