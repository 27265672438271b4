#pragma once

#include "ast/VisitorBase.h"

namespace agentrun::ast {

// CRTP mixin that equips concrete nodes with convenient template apply()
// for ad-hoc visitors. Polymorphic accept(VisitorBase&) is provided by Node.
template <typename Derived, NodeKind K>
struct Acceptable {
    static constexpr NodeKind kKind = K;
    template <typename Visitor>
    void apply(Visitor& v) const { v.visit(static_cast<const Derived&>(*this)); }
};

} // namespace agentrun::ast
