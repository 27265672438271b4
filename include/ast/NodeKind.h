#pragma once

namespace agentrun::ast {
    enum class NodeKind {
        Module,
        // statements
        FunctionDef,
        ClassDef,
        ReturnStmt,
        DelStmt,
        AssignStmt,
        AugAssignStmt,
        AnnAssignStmt,
        ForStmt,
        WhileStmt,
        IfStmt,
        WithStmt,
        MatchStmt,
        RaiseStmt,
        TryStmt,
        AssertStmt,
        Import,
        ImportFrom,
        GlobalStmt,
        NonlocalStmt,
        ExprStmt,
        PassStmt,
        BreakStmt,
        ContinueStmt,
        TypeAlias,
        // expressions
        BoolOp,
        NamedExpr,
        BinaryExpr,
        UnaryExpr,
        LambdaExpr,
        IfExpr,
        DictLiteral,
        SetLiteral,
        ListComp,
        SetComp,
        DictComp,
        GeneratorExpr,
        AwaitExpr,
        YieldExpr,
        Compare,
        Call,
        FStringLiteral,
        Constant,
        Attribute,
        Subscript,
        Starred,
        Name,
        ListLiteral,
        TupleLiteral,
        Slice,
        // helpers
        Param,
        Alias,
        ExceptHandler,
        MatchCase,
        TypeParam,
        // patterns
        PatternValue,
        PatternCapture,
        PatternSequence,
        PatternMapping,
        PatternClass,
        PatternStar,
        PatternAs,
        PatternOr
    };
} // namespace agentrun::ast
