/**
 * @file Chart.hpp
 * @brief Chart Loader & Validator — declarative node list → validated Chart
 *
 * Chart text is JSON:
 *
 *   {
 *     "name": "sum", "version": "1.0",
 *     "nodes": [
 *       {"id": "a", "type": "const", "params": {"value": 5}},
 *       {"id": "b", "type": "const", "params": {"value": 7}},
 *       {"id": "c", "type": "add",   "deps": ["a", "b"]}
 *     ],
 *     "edges": [{"from": "a", "to": "c"}]
 *   }
 *
 * Parsing is pure: the same text always yields the same Chart or the same
 * error, and on error the output Chart is left untouched.
 */

#ifndef UOR_CHART_HPP
#define UOR_CHART_HPP

#include "uor/Diagnostic.hpp"
#include "uor/Payload.hpp"

#include <map>
#include <string>
#include <vector>

namespace uor {

/* ================================================================== */
/*  NodeSpec — one declared vertex                                     */
/* ================================================================== */

struct NodeSpec {
    std::string              id;
    std::string              type;
    ParamBag                 params;
    std::vector<std::string> deps;   /**< ordered: operator input order */
};

/* ================================================================== */
/*  ChartSchema — known types and their required parameters            */
/* ================================================================== */

struct ChartSchema {
    std::map<std::string, std::vector<std::string>> required;

    bool knows(const std::string& type) const {
        return required.find(type) != required.end();
    }
};

/* ================================================================== */
/*  Chart — validated, immutable                                       */
/* ================================================================== */

class Chart {
public:
    Chart() = default;

    const std::string&           name() const    { return name_; }
    const std::string&           version() const { return version_; }
    const std::vector<NodeSpec>& nodes() const   { return nodes_; }
    size_t                       size() const    { return nodes_.size(); }

    /** Lookup by id; nullptr when absent. */
    const NodeSpec* find(const std::string& id) const;

private:
    friend uor_status parse_chart(const std::string&, const ChartSchema*,
                                  Chart*, SchemaError*);

    std::string           name_;
    std::string           version_;
    std::vector<NodeSpec> nodes_;
};

/**
 * Parse and validate chart text.
 *
 * Rejects: empty text, malformed JSON, missing/ill-typed fields,
 * unsupported parameter values (UOR_ERROR_SCHEMA), duplicate ids,
 * references to undeclared ids, self-dependencies, cycles, and, when
 * `schema` is non-null, unknown types and missing required parameters.
 */
uor_status parse_chart(const std::string& raw, const ChartSchema* schema,
                       Chart* out, SchemaError* err);

/**
 * Structural validation shared by the chart loader and the manifold
 * builder. Errors are reported under `domain`.
 */
uor_status validate_node_specs(const std::vector<NodeSpec>& specs,
                               const ChartSchema* schema,
                               ErrorDomain domain, Diagnostic* err);

} // namespace uor

#endif // UOR_CHART_HPP
