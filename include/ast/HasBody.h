/**
 * @file
 * @brief Mixins for nodes that own statement blocks or parameter lists.
 */
#pragma once

#include <memory>
#include <vector>

namespace agentrun::ast {

struct Stmt; // fwd

template <typename StmtT = Stmt>
struct HasBody {
    std::vector<std::unique_ptr<StmtT>> body;
};

// for/while/if: the else block runs when the loop ends without break, or the test is false.
template <typename StmtT = Stmt>
struct HasBodyPair : HasBody<StmtT> {
    std::vector<std::unique_ptr<StmtT>> orelse;
};

template <typename ParamT>
struct HasParams {
    std::vector<std::unique_ptr<ParamT>> params;
};

} // namespace agentrun::ast
