/**
 * @file manifold.cpp
 * @brief Manifold construction, incremental extension and queries
 */

#include "uor/Manifold.hpp"
#include "uor/Operator.hpp"
#include "uor/metrics.h"

#include <deque>

namespace uor {

const ManifoldNode* Manifold::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

PayloadRef Manifold::payload(const std::string& id) const {
    const ManifoldNode* n = find(id);
    if (!n || n->status != UOR_NODE_COMPUTED) return nullptr;
    return n->payload;
}

/* -- Registry rules ----------------------------------------------- */

static uor_status check_against_registry(const std::vector<NodeSpec>& merged,
                                         size_t first_new,
                                         const OperatorRegistry& registry,
                                         BuildError* err) {
    for (size_t i = first_new; i < merged.size(); ++i) {
        auto& spec = merged[i];
        OperatorPtr op = registry.find(spec.type);
        if (!op)
            return report(err, ErrorDomain::Build, UOR_ERROR_UNKNOWN_OP, spec.id,
                          "no operator registered as '" + spec.type + "'");
        const OperatorContract& c = op->contract();
        if (!c.accepts_arity(spec.deps.size()))
            return report(err, ErrorDomain::Build, UOR_ERROR_ARITY, spec.id,
                          "operator '" + spec.type + "' does not accept " +
                          std::to_string(spec.deps.size()) + " inputs");
    }

    /* A terminal operator must never feed another node. */
    std::unordered_map<std::string, const NodeSpec*> by_id;
    for (auto& s : merged) by_id[s.id] = &s;
    for (auto& spec : merged) {
        for (auto& d : spec.deps) {
            OperatorPtr op = registry.find(by_id[d]->type);
            if (op && (op->contract().flags & UOR_OP_TERMINAL))
                return report(err, ErrorDomain::Build, UOR_ERROR_TERMINAL, d,
                              "terminal node '" + d + "' cannot feed '" + spec.id + "'");
        }
    }
    return UOR_OK;
}

/* -- extend ------------------------------------------------------- */

uor_status Manifold::extend(const std::vector<NodeSpec>& specs,
                            const OperatorRegistry* registry, BuildError* err) {
    if (err) err->clear();
    if (specs.empty()) return UOR_OK;

    /* Validate the tentative merged graph; nothing is committed yet. */
    std::vector<NodeSpec> merged;
    merged.reserve(nodes_.size() + specs.size());
    for (auto& n : nodes_) merged.push_back(NodeSpec{n.id, n.type, n.params, n.deps});
    merged.insert(merged.end(), specs.begin(), specs.end());

    ChartSchema schema;
    if (registry) schema = registry->schema();
    uor_status st = validate_node_specs(merged, registry ? &schema : nullptr,
                                        ErrorDomain::Build, err);
    if (st == UOR_OK && registry)
        st = check_against_registry(merged, nodes_.size(), *registry, err);
    if (st != UOR_OK) {
        uor_log(UOR_LOG_WARN, "manifold", "extend of v%u rejected: %s",
                version_, uor_status_str(st));
        return st;
    }

    /* Commit. */
    const uint32_t first = static_cast<uint32_t>(nodes_.size());
    for (auto& spec : specs) {
        ManifoldNode node;
        node.id       = spec.id;
        node.type     = spec.type;
        node.params   = spec.params;
        node.deps     = spec.deps;
        node.added_in = version_;
        index_[node.id] = static_cast<uint32_t>(nodes_.size());
        nodes_.push_back(std::move(node));
    }
    for (uint32_t i = first; i < nodes_.size(); ++i) {
        for (auto& d : nodes_[i].deps) {
            uint32_t di = index_.at(d);
            nodes_[i].dep_index.push_back(di);
            nodes_[di].successors.push_back(i);
        }
    }

    uor_log(UOR_LOG_DEBUG, "manifold", "v%u: +%zu nodes (%zu total)",
            version_, specs.size(), nodes_.size());
    return UOR_OK;
}

/* -- seed / derive ------------------------------------------------ */

uor_status Manifold::seed(const std::string& id, Payload value) {
    auto it = index_.find(id);
    if (it == index_.end()) return UOR_ERROR_NOT_FOUND;
    ManifoldNode& n = nodes_[it->second];
    if (!n.deps.empty()) return UOR_ERROR_INVALID_ARG;
    if (n.status != UOR_NODE_PENDING && n.status != UOR_NODE_READY)
        return UOR_ERROR_INVALID_ARG;

    n.payload = make_payload(std::move(value));
    n.status  = UOR_NODE_COMPUTED;
    return UOR_OK;
}

Manifold Manifold::derive() const {
    Manifold next = *this;
    next.version_ = version_ + 1;
    return next;
}

/* -- Queries ------------------------------------------------------ */

std::vector<std::string> Manifold::topological_order() const {
    const size_t n = nodes_.size();
    std::vector<uint32_t> in_degree(n, 0);
    for (size_t i = 0; i < n; ++i)
        in_degree[i] = static_cast<uint32_t>(nodes_[i].dep_index.size());

    std::deque<uint32_t> ready;
    for (uint32_t i = 0; i < n; ++i)
        if (in_degree[i] == 0) ready.push_back(i);

    std::vector<std::string> order;
    order.reserve(n);
    while (!ready.empty()) {
        uint32_t u = ready.front();
        ready.pop_front();
        order.push_back(nodes_[u].id);
        for (uint32_t s : nodes_[u].successors) {
            if (--in_degree[s] == 0) ready.push_back(s);
        }
    }
    return order;
}

size_t Manifold::count(uor_node_status status) const {
    size_t c = 0;
    for (auto& n : nodes_)
        if (n.status == status) ++c;
    return c;
}

std::vector<std::string> Manifold::dependents(const std::string& id) const {
    std::vector<std::string> out;
    auto it = index_.find(id);
    if (it == index_.end()) return out;
    for (uint32_t s : nodes_[it->second].successors) {
        bool seen = false;
        for (auto& o : out) {
            if (o == nodes_[s].id) { seen = true; break; }
        }
        if (!seen) out.push_back(nodes_[s].id);
    }
    return out;
}

/* -- Builder ------------------------------------------------------ */

uor_status chart_to_manifold(const Chart& chart, const OperatorRegistry* registry,
                             Manifold* out, BuildError* err) {
    if (!out) return UOR_ERROR_INVALID_ARG;
    Manifold m;
    uor_status st = m.extend(chart.nodes(), registry, err);
    if (st != UOR_OK) return st;

    uor_log(UOR_LOG_INFO, "manifold", "built '%s': %zu nodes",
            chart.name().c_str(), m.size());
    *out = std::move(m);
    return UOR_OK;
}

} // namespace uor
