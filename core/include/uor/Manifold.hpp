/**
 * @file Manifold.hpp
 * @brief Manifold — executable DAG instantiated from a Chart
 *
 * Each node carries its identity, type, parameters, ordered dependencies,
 * lifecycle status and (once computed) a shared read-only payload.
 *
 * Invariants:
 *   - acyclic at all times; extend() validates the merged graph and
 *     leaves the manifold untouched on rejection
 *   - a node becomes COMPUTED at most once
 *   - derive() yields a copy at version + 1; versions never share
 *     mutable state (payloads are shared but immutable)
 *
 * During Scheduler::run the scheduler holds exclusive mutation rights
 * over node status and payload.
 */

#ifndef UOR_MANIFOLD_HPP
#define UOR_MANIFOLD_HPP

#include "uor/Chart.hpp"
#include "uor/Diagnostic.hpp"
#include "uor/Payload.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace uor {

class OperatorRegistry;

/* ================================================================== */
/*  ManifoldNode                                                       */
/* ================================================================== */

struct ManifoldNode {
    std::string              id;
    std::string              type;
    ParamBag                 params;
    std::vector<std::string> deps;

    /* Adjacency by index, one entry per dependency occurrence. */
    std::vector<uint32_t>    dep_index;
    std::vector<uint32_t>    successors;

    uor_node_status          status   = UOR_NODE_PENDING;
    PayloadRef               payload;
    uor_status               cause    = UOR_OK;   /**< set when FAILED */
    std::string              message;
    uint32_t                 added_in = 0;        /**< manifold version */
};

/* ================================================================== */
/*  Manifold                                                           */
/* ================================================================== */

class Manifold {
public:
    Manifold() = default;

    uint32_t                         version() const { return version_; }
    size_t                           size() const    { return nodes_.size(); }
    bool                             empty() const   { return nodes_.empty(); }
    const std::vector<ManifoldNode>& nodes() const   { return nodes_; }

    /** Lookup by id; nullptr when absent. */
    const ManifoldNode* find(const std::string& id) const;

    /** Payload of a computed node; null for unknown or uncomputed ids. */
    PayloadRef payload(const std::string& id) const;

    /**
     * Append nodes. The merged graph is validated (ids, references,
     * cycles, and with a registry also operator/arity/terminal rules)
     * before anything is committed.
     */
    uor_status extend(const std::vector<NodeSpec>& specs,
                      const OperatorRegistry* registry, BuildError* err);

    /** Bind an external value to a dependency-free, uncomputed node. */
    uor_status seed(const std::string& id, Payload value);

    /** Copy at version + 1. */
    Manifold derive() const;

    /** Kahn order, ties broken by insertion order. */
    std::vector<std::string> topological_order() const;

    size_t count(uor_node_status status) const;

    /** Ids of nodes that list `id` as a dependency. */
    std::vector<std::string> dependents(const std::string& id) const;

private:
    friend class Scheduler;
    /* Defined only by tests that must corrupt adjacency on purpose. */
    friend struct ManifoldTestAccess;

    std::vector<ManifoldNode>                 nodes_;
    std::unordered_map<std::string, uint32_t> index_;
    uint32_t                                  version_ = 0;
};

/** Build a fresh manifold (version 0) from a validated chart. */
uor_status chart_to_manifold(const Chart& chart, const OperatorRegistry* registry,
                             Manifold* out, BuildError* err);

} // namespace uor

#endif // UOR_MANIFOLD_HPP
