/**
 * @file CognitiveStack.hpp
 * @brief Cognitive Stack — ordered operator/kernel stages over a manifold
 *
 * Each stage contributes one node. run() works on successive manifold
 * versions: for stage i it derives version v+1 from stage i-1's result,
 * extends it with the stage node, and runs the Scheduler once. The input
 * manifold is never mutated. The first failing stage halts the stack and
 * its partial manifold is handed back with the cause. When every stage
 * completes and a MemoryCortex is supplied, the final manifold's
 * quaternion embeddings are linked into it.
 *
 * Input bindings name nodes in the manifold; "$prev" names the previous
 * stage's node. A stage after the first with no bindings reads "$prev".
 */

#ifndef UOR_COGNITIVE_STACK_HPP
#define UOR_COGNITIVE_STACK_HPP

#include "uor/Diagnostic.hpp"
#include "uor/Manifold.hpp"
#include "uor/MemoryCortex.hpp"
#include "uor/Operator.hpp"
#include "uor/Scheduler.hpp"

#include <string>
#include <vector>

namespace uor {

struct StageSpec {
    std::string              node_id;
    std::string              op;       /**< registered operator or kernel */
    ParamBag                 params;
    std::vector<std::string> inputs;
};

struct StackError {
    int32_t        stage_index = -1;   /**< -1: not stage-specific */
    uor_status     code        = UOR_OK;
    BuildError     build;              /**< set when extend rejected the stage */
    ExecutionError exec;               /**< set when the stage's run failed    */

    void clear() {
        stage_index = -1;
        code = UOR_OK;
        build.clear();
        exec.clear();
    }

    std::string to_string() const;
};

class CognitiveStack {
public:
    /** Twelve model slots plus the kernel. */
    static constexpr size_t kMaxStages = 13;

    CognitiveStack() = default;

    /** UOR_ERROR_INVALID_ARG when full or the stage is unnamed. */
    uor_status add_stage(StageSpec stage);

    size_t                        size() const   { return stages_.size(); }
    const std::vector<StageSpec>& stages() const { return stages_; }
    void                          clear()        { stages_.clear(); }

    uor_status run(const Manifold& input, const OperatorRegistry& registry,
                   Scheduler& scheduler, const RunOptions& opts,
                   Manifold* out, StackError* err = nullptr,
                   MemoryCortex* cortex = nullptr) const;

private:
    std::vector<StageSpec> stages_;
};

} // namespace uor

#endif // UOR_COGNITIVE_STACK_HPP
