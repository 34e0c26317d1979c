/**
 * @file Operator.hpp
 * @brief Operator contract, invocation record and the Operator Registry
 *
 * INTERNAL TO CORE — never crosses the C API boundary.
 *
 * An Operator is a named transformation with a declared contract:
 *   - arity window [min_arity, max_arity] (max = UOR_VARIADIC: unbounded)
 *   - per-position input kinds; the last entry repeats for extra inputs
 *   - output kind, required parameters, flags (PURE / STATEFUL / TERMINAL)
 *
 * apply() may run on many worker threads concurrently and must not touch
 * the manifold. It receives the node's parameters, its inputs as shared
 * read-only payloads, and a stop flag raised on timeout or cancellation.
 */

#ifndef UOR_OPERATOR_HPP
#define UOR_OPERATOR_HPP

#include "uor/Chart.hpp"
#include "uor/Diagnostic.hpp"
#include "uor/Payload.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace uor {

/* ================================================================== */
/*  OperatorContract                                                   */
/* ================================================================== */

struct OperatorContract {
    uint32_t                      min_arity = 0;
    uint32_t                      max_arity = UOR_VARIADIC;
    std::vector<uor_payload_kind> input_kinds;   /**< empty: ANY everywhere */
    uor_payload_kind              output_kind = UOR_PAYLOAD_ANY;
    std::vector<std::string>      required_params;
    uint32_t                      flags = UOR_OP_PURE;

    bool accepts_arity(size_t n) const {
        return n >= min_arity && (max_arity == UOR_VARIADIC || n <= max_arity);
    }

    uor_payload_kind input_kind(size_t pos) const {
        if (input_kinds.empty()) return UOR_PAYLOAD_ANY;
        return pos < input_kinds.size() ? input_kinds[pos] : input_kinds.back();
    }
};

/* ================================================================== */
/*  OpCall — one invocation                                            */
/* ================================================================== */

struct OpCall {
    std::string                        node_id;
    ParamBag                           params;
    std::vector<PayloadRef>            inputs;
    Payload                            output;
    std::string                        message;   /**< failure detail */
    std::shared_ptr<std::atomic<bool>> stop;

    bool should_stop() const {
        return stop && stop->load(std::memory_order_relaxed);
    }

    const Payload& input(size_t i) const { return *inputs[i]; }

    /** Record a failure message and return `code`. */
    uor_status fail(uor_status code, std::string msg) {
        message = std::move(msg);
        return code;
    }
};

/* ================================================================== */
/*  Operator — abstract base                                           */
/* ================================================================== */

class Operator {
public:
    Operator(std::string name, OperatorContract contract)
        : name_(std::move(name)), contract_(std::move(contract)) {}
    virtual ~Operator() = default;

    Operator(const Operator&) = delete;
    Operator& operator=(const Operator&) = delete;

    const std::string&      name() const     { return name_; }
    const OperatorContract& contract() const { return contract_; }

    /** Results may be replayed from cache only for pure, stateless ops. */
    bool cacheable() const {
        return (contract_.flags & UOR_OP_PURE) && !(contract_.flags & UOR_OP_STATEFUL);
    }

    /**
     * Compute `call.output` from `call.inputs`. Returns UOR_OK, or a
     * failure code with `call.message` set. Inputs already satisfy the
     * contract when this is called by the Scheduler. An operator that
     * gives up because the stop flag was raised returns
     * UOR_ERROR_CANCELLED; only that code leaves a cancelled node runnable.
     */
    virtual uor_status apply(OpCall& call) const = 0;

private:
    std::string      name_;
    OperatorContract contract_;
};

using OperatorPtr = std::shared_ptr<const Operator>;

/**
 * Verify arity and per-position kinds. Returns UOR_ERROR_SHAPE_MISMATCH
 * with a message naming the first offending position.
 */
uor_status check_inputs(const OperatorContract& contract,
                        const std::vector<PayloadRef>& inputs,
                        std::string* message);

/* ================================================================== */
/*  FunctionOperator — wraps a callable                                */
/* ================================================================== */

class FunctionOperator : public Operator {
public:
    using Fn = std::function<uor_status(OpCall&)>;

    FunctionOperator(std::string name, OperatorContract contract, Fn fn)
        : Operator(std::move(name), std::move(contract)), fn_(std::move(fn)) {}

    uor_status apply(OpCall& call) const override { return fn_(call); }

private:
    Fn fn_;
};

inline OperatorPtr make_operator(std::string name, OperatorContract contract,
                                 FunctionOperator::Fn fn) {
    return std::make_shared<FunctionOperator>(std::move(name), std::move(contract),
                                              std::move(fn));
}

/* ================================================================== */
/*  OperatorRegistry — name → Operator                                 */
/*                                                                     */
/*  Explicit object, passed to the builder and scheduler. Lookups take */
/*  a shared lock and are safe from any number of worker threads.      */
/* ================================================================== */

class OperatorRegistry {
public:
    OperatorRegistry() = default;
    OperatorRegistry(const OperatorRegistry&) = delete;
    OperatorRegistry& operator=(const OperatorRegistry&) = delete;

    /** Register `op` under its name; UOR_ERROR_CONFLICT if taken. */
    uor_status add(OperatorPtr op, RegistryError* err = nullptr);

    /** nullptr when unknown. */
    OperatorPtr find(const std::string& name) const;

    bool   contains(const std::string& name) const;
    size_t size() const;

    /** Registered names in lexical order. */
    std::vector<std::string> names() const;

    /** Type → required-parameter table for chart validation. */
    ChartSchema schema() const;

private:
    mutable std::shared_mutex          mu_;
    std::map<std::string, OperatorPtr> ops_;
};

} // namespace uor

#endif // UOR_OPERATOR_HPP
