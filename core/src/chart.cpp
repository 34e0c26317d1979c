/**
 * @file chart.cpp
 * @brief Chart JSON parsing (jsoncpp) and structural validation
 */

#include "uor/Chart.hpp"
#include "uor/metrics.h"

#include <json/json.h>

#include <deque>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace uor {

const NodeSpec* Chart::find(const std::string& id) const {
    for (auto& n : nodes_) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

/* ================================================================== */
/*  Validation                                                         */
/* ================================================================== */

/*
 * Kahn over the NodeSpec list. Any node left with unresolved dependencies
 * is on a cycle or downstream of one; walking leftover dependencies from
 * such a node must revisit a vertex, and that vertex lies on the cycle.
 */
static bool find_cycle(const std::vector<NodeSpec>& specs,
                       const std::unordered_map<std::string, size_t>& index,
                       std::string* on_cycle) {
    const size_t n = specs.size();
    std::vector<uint32_t> in_degree(n, 0);
    std::vector<std::vector<size_t>> successors(n);
    for (size_t i = 0; i < n; ++i) {
        for (auto& d : specs[i].deps) {
            size_t di = index.at(d);
            successors[di].push_back(i);
            ++in_degree[i];
        }
    }

    std::deque<size_t> ready;
    for (size_t i = 0; i < n; ++i)
        if (in_degree[i] == 0) ready.push_back(i);

    size_t visited = 0;
    while (!ready.empty()) {
        size_t u = ready.front();
        ready.pop_front();
        ++visited;
        for (size_t s : successors[u]) {
            if (--in_degree[s] == 0) ready.push_back(s);
        }
    }
    if (visited == n) return false;

    size_t cur = 0;
    while (in_degree[cur] == 0) ++cur;
    std::vector<bool> seen(n, false);
    while (!seen[cur]) {
        seen[cur] = true;
        for (auto& d : specs[cur].deps) {
            size_t di = index.at(d);
            if (in_degree[di] != 0) { cur = di; break; }
        }
    }
    *on_cycle = specs[cur].id;
    return true;
}

uor_status validate_node_specs(const std::vector<NodeSpec>& specs,
                               const ChartSchema* schema,
                               ErrorDomain domain, Diagnostic* err) {
    std::unordered_map<std::string, size_t> index;
    index.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        if (specs[i].id.empty())
            return report(err, domain, UOR_ERROR_SCHEMA, "",
                          "node #" + std::to_string(i) + " has an empty id");
        if (!index.emplace(specs[i].id, i).second)
            return report(err, domain, UOR_ERROR_DUPLICATE_ID, specs[i].id,
                          "node id '" + specs[i].id + "' is declared twice");
    }

    for (auto& spec : specs) {
        for (auto& d : spec.deps) {
            if (d == spec.id)
                return report(err, domain, UOR_ERROR_CYCLE, spec.id,
                              "node '" + spec.id + "' depends on itself");
            if (index.find(d) == index.end())
                return report(err, domain, UOR_ERROR_UNKNOWN_DEP, d,
                              "node '" + spec.id + "' depends on undeclared node '" + d + "'");
        }
        if (!schema) continue;

        auto it = schema->required.find(spec.type);
        if (it == schema->required.end())
            return report(err, domain, UOR_ERROR_UNKNOWN_OP, spec.id,
                          "unknown type '" + spec.type + "'");
        for (auto& p : it->second) {
            if (spec.params.find(p) == spec.params.end())
                return report(err, domain, UOR_ERROR_MISSING_PARAM, spec.id,
                              "type '" + spec.type + "' requires parameter '" + p + "'");
        }
    }

    std::string on_cycle;
    if (find_cycle(specs, index, &on_cycle))
        return report(err, domain, UOR_ERROR_CYCLE, on_cycle,
                      "dependency cycle through '" + on_cycle + "'");
    return UOR_OK;
}

/* ================================================================== */
/*  JSON → NodeSpec                                                    */
/* ================================================================== */

static bool convert_param(const Json::Value& v, Payload* out) {
    switch (v.type()) {
        case Json::booleanValue: *out = Payload::boolean(v.asBool()); return true;
        case Json::intValue:     *out = Payload::integer(v.asInt64()); return true;
        case Json::uintValue:
            if (v.isInt64()) *out = Payload::integer(v.asInt64());
            else             *out = Payload::real(v.asDouble());
            return true;
        case Json::realValue:    *out = Payload::real(v.asDouble()); return true;
        case Json::stringValue:  *out = Payload::text(v.asString()); return true;
        case Json::arrayValue: {
            std::vector<double> vec;
            vec.reserve(v.size());
            for (auto& e : v) {
                if (!e.isNumeric() || e.isBool()) return false;
                vec.push_back(e.asDouble());
            }
            *out = Payload::vector(std::move(vec));
            return true;
        }
        default:
            return false;
    }
}

static uor_status parse_node(const Json::Value& jn, size_t pos, NodeSpec* spec,
                             SchemaError* err) {
    std::string where = "node #" + std::to_string(pos);
    if (!jn.isObject())
        return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                      where + " is not an object");
    if (!jn.isMember("id") || !jn["id"].isString())
        return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                      where + " requires a string 'id'");
    spec->id = jn["id"].asString();
    if (!jn.isMember("type") || !jn["type"].isString())
        return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, spec->id,
                      "node '" + spec->id + "' requires a string 'type'");
    spec->type = jn["type"].asString();

    if (jn.isMember("params")) {
        const Json::Value& jp = jn["params"];
        if (!jp.isObject())
            return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, spec->id,
                          "'params' of node '" + spec->id + "' must be an object");
        for (auto& key : jp.getMemberNames()) {
            Payload value;
            if (!convert_param(jp[key], &value))
                return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, spec->id,
                              "parameter '" + key + "' of node '" + spec->id +
                              "' has an unsupported value");
            spec->params[key] = std::move(value);
        }
    }

    if (jn.isMember("deps")) {
        const Json::Value& jd = jn["deps"];
        if (!jd.isArray())
            return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, spec->id,
                          "'deps' of node '" + spec->id + "' must be an array");
        for (auto& d : jd) {
            if (!d.isString())
                return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, spec->id,
                              "'deps' of node '" + spec->id + "' must hold strings");
            spec->deps.push_back(d.asString());
        }
    }
    return UOR_OK;
}

static uor_status apply_edges(const Json::Value& je, std::vector<NodeSpec>& nodes,
                              SchemaError* err) {
    if (!je.isArray())
        return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                      "'edges' must be an array");
    for (Json::ArrayIndex i = 0; i < je.size(); ++i) {
        const Json::Value& e = je[i];
        if (!e.isObject() || !e["from"].isString() || !e["to"].isString())
            return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                          "edge #" + std::to_string(i) + " requires string 'from' and 'to'");
        std::string from = e["from"].asString();
        std::string to   = e["to"].asString();

        NodeSpec* target = nullptr;
        for (auto& n : nodes) {
            if (n.id == to) { target = &n; break; }
        }
        if (!target)
            return report(err, ErrorDomain::Schema, UOR_ERROR_UNKNOWN_DEP, to,
                          "edge #" + std::to_string(i) + " targets undeclared node '" + to + "'");
        bool present = false;
        for (auto& d : target->deps) {
            if (d == from) { present = true; break; }
        }
        if (!present) target->deps.push_back(from);
    }
    return UOR_OK;
}

/* ================================================================== */
/*  parse_chart                                                        */
/* ================================================================== */

uor_status parse_chart(const std::string& raw, const ChartSchema* schema,
                       Chart* out, SchemaError* err) {
    if (!out) return UOR_ERROR_INVALID_ARG;
    if (err) err->clear();

    uor_status st = UOR_OK;
    if (raw.find_first_not_of(" \t\r\n") == std::string::npos) {
        st = report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "", "chart text is empty");
        uor_log(UOR_LOG_WARN, "chart", "rejected: chart text is empty");
        return st;
    }

    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(raw.data(), raw.data() + raw.size(), &root, &errs)) {
        uor_log(UOR_LOG_WARN, "chart", "rejected: malformed JSON");
        return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                      "malformed chart JSON: " + errs);
    }
    if (!root.isObject())
        return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                      "chart root must be an object");

    Chart chart;
    if (root.isMember("name")) {
        if (!root["name"].isString())
            return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                          "'name' must be a string");
        chart.name_ = root["name"].asString();
    }
    if (root.isMember("version")) {
        if (!root["version"].isString())
            return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                          "'version' must be a string");
        chart.version_ = root["version"].asString();
    }

    if (!root.isMember("nodes") || !root["nodes"].isArray())
        return report(err, ErrorDomain::Schema, UOR_ERROR_SCHEMA, "",
                      "chart requires a 'nodes' array");

    const Json::Value& jnodes = root["nodes"];
    chart.nodes_.reserve(jnodes.size());
    for (Json::ArrayIndex i = 0; i < jnodes.size(); ++i) {
        NodeSpec spec;
        st = parse_node(jnodes[i], i, &spec, err);
        if (st != UOR_OK) return st;
        chart.nodes_.push_back(std::move(spec));
    }

    if (root.isMember("edges")) {
        st = apply_edges(root["edges"], chart.nodes_, err);
        if (st != UOR_OK) return st;
    }

    st = validate_node_specs(chart.nodes_, schema, ErrorDomain::Schema, err);
    if (st != UOR_OK) {
        uor_log(UOR_LOG_WARN, "chart", "rejected '%s': %s",
                chart.name_.c_str(), uor_status_str(st));
        return st;
    }

    uor_log(UOR_LOG_DEBUG, "chart", "loaded '%s' v%s: %zu nodes",
            chart.name_.c_str(), chart.version_.c_str(), chart.nodes_.size());
    *out = std::move(chart);
    return UOR_OK;
}

} // namespace uor
