/**
 * @file cognitive_stack.cpp
 * @brief Stage sequencing over successive manifold versions
 */

#include "uor/CognitiveStack.hpp"
#include "uor/metrics.h"

namespace uor {

static const char* kPrevBinding = "$prev";

std::string StackError::to_string() const {
    std::string s = "stage " + std::to_string(stage_index) + ": ";
    if (!build.ok()) return s + build.to_string();
    return s + exec.to_string();
}

uor_status CognitiveStack::add_stage(StageSpec stage) {
    if (stages_.size() >= kMaxStages) {
        uor_log(UOR_LOG_WARN, "stack", "stage '%s' rejected: stack holds %zu stages",
                stage.node_id.c_str(), kMaxStages);
        return UOR_ERROR_INVALID_ARG;
    }
    if (stage.node_id.empty() || stage.op.empty()) return UOR_ERROR_INVALID_ARG;
    stages_.push_back(std::move(stage));
    return UOR_OK;
}

uor_status CognitiveStack::run(const Manifold& input, const OperatorRegistry& registry,
                               Scheduler& scheduler, const RunOptions& opts,
                               Manifold* out, StackError* err_out,
                               MemoryCortex* cortex) const {
    if (!out) return UOR_ERROR_INVALID_ARG;
    StackError local_err;
    StackError& err = err_out ? *err_out : local_err;
    err.clear();

    Manifold current = input;
    std::string prev;

    for (size_t i = 0; i < stages_.size(); ++i) {
        const StageSpec& stage = stages_[i];

        NodeSpec spec;
        spec.id     = stage.node_id;
        spec.type   = stage.op;
        spec.params = stage.params;
        std::vector<std::string> bindings = stage.inputs;
        if (bindings.empty() && i > 0) bindings.push_back(kPrevBinding);
        for (auto& b : bindings) {
            if (b != kPrevBinding) {
                spec.deps.push_back(b);
                continue;
            }
            if (prev.empty()) {
                err.stage_index = static_cast<int32_t>(i);
                err.code = report(&err.build, ErrorDomain::Build, UOR_ERROR_INVALID_ARG,
                                  stage.node_id, "first stage cannot bind \"$prev\"");
                *out = std::move(current);
                return err.code;
            }
            spec.deps.push_back(prev);
        }

        Manifold next = current.derive();
        uor_status st = next.extend({spec}, &registry, &err.build);
        if (st != UOR_OK) {
            err.stage_index = static_cast<int32_t>(i);
            err.code = st;
            uor_log(UOR_LOG_WARN, "stack", "stage %zu ('%s') rejected: %s",
                    i, stage.node_id.c_str(), err.build.message.c_str());
            *out = std::move(current);
            return st;
        }

        st = scheduler.run(next, registry, opts, &err.exec);
        if (st != UOR_OK) {
            err.stage_index = static_cast<int32_t>(i);
            err.code = st;
            uor_log(UOR_LOG_WARN, "stack", "stage %zu ('%s') halted the stack: %s",
                    i, stage.node_id.c_str(), uor_status_str(st));
            *out = std::move(next);
            return st;
        }

        uor_log(UOR_LOG_DEBUG, "stack", "stage %zu/%zu ('%s' via %s) done at v%u",
                i + 1, stages_.size(), stage.node_id.c_str(), stage.op.c_str(),
                next.version());
        current = std::move(next);
        prev = stage.node_id;
    }

    uor_status st = UOR_OK;
    if (cortex) {
        st = cortex->link_manifold(current);
        if (st != UOR_OK) {
            err.code = st;
            uor_log(UOR_LOG_WARN, "stack", "cortex link failed: %s", uor_status_str(st));
        }
    }
    *out = std::move(current);
    return st;
}

} // namespace uor
