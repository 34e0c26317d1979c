/**
 * @file uor_c_api.cpp
 * @brief C API implementation — opaque handles over Engine / Manifold
 */

#include "uor/uor_c_api.h"
#include "uor/engine.hpp"

#include <cstring>
#include <exception>
#include <new>
#include <string>

struct uor_engine_s {
    explicit uor_engine_s(const uor::EngineConfig& cfg) : engine(cfg) {}
    uor::Engine engine;
};

struct uor_manifold_s {
    uor::Manifold manifold;
};

namespace {

thread_local std::string t_last_error;

uor_status set_error(uor_status st, const std::string& msg) {
    t_last_error = msg;
    return st;
}

const uor::ManifoldNode* lookup(uor_manifold_t m, const char* node_id, uor_status* st) {
    if (!m || !node_id) {
        *st = set_error(UOR_ERROR_INVALID_ARG, "null manifold or node id");
        return nullptr;
    }
    const uor::ManifoldNode* n = m->manifold.find(node_id);
    if (!n) {
        *st = set_error(UOR_ERROR_NOT_FOUND,
                        std::string("no node '") + node_id + "'");
        return nullptr;
    }
    *st = UOR_OK;
    return n;
}

} // namespace

/* ================================================================== */
/*  Engine Lifecycle                                                   */
/* ================================================================== */

uor_engine_t uor_create_engine(uint32_t n_threads, uint32_t timeout_ms,
                               int enable_cache) {
    uor::EngineConfig cfg = uor::EngineConfig::from_env();
    cfg.threads    = n_threads;
    cfg.timeout_ms = timeout_ms;
    cfg.cache      = enable_cache != 0;
    auto* e = new (std::nothrow) uor_engine_s(cfg);
    if (!e) set_error(UOR_ERROR_INTERNAL, "out of memory");
    return e;
}

void uor_destroy_engine(uor_engine_t engine) {
    delete engine;
}

/* ================================================================== */
/*  Manifold Lifecycle                                                 */
/* ================================================================== */

uor_manifold_t uor_build_manifold_json(uor_engine_t engine, const char* chart_json) {
    if (!engine || !chart_json) {
        set_error(UOR_ERROR_INVALID_ARG, "null engine or chart text");
        return nullptr;
    }
    auto* m = new (std::nothrow) uor_manifold_s;
    if (!m) {
        set_error(UOR_ERROR_INTERNAL, "out of memory");
        return nullptr;
    }
    uor::Diagnostic diag;
    if (engine->engine.load(chart_json, &m->manifold, &diag) != UOR_OK) {
        set_error(diag.code, diag.to_string());
        delete m;
        return nullptr;
    }
    t_last_error.clear();
    return m;
}

void uor_destroy_manifold(uor_manifold_t manifold) {
    delete manifold;
}

/* ================================================================== */
/*  Execution                                                          */
/* ================================================================== */

uor_status uor_run(uor_engine_t engine, uor_manifold_t manifold) {
    if (!engine || !manifold)
        return set_error(UOR_ERROR_INVALID_ARG, "null engine or manifold");

    uor::ExecutionError err;
    uor_status st = engine->engine.run(manifold->manifold, &manifold->manifold, &err);
    if (st != UOR_OK) return set_error(st, err.to_string());
    t_last_error.clear();
    return UOR_OK;
}

/* ================================================================== */
/*  Queries                                                            */
/* ================================================================== */

uor_status uor_get_node_status(uor_manifold_t manifold, const char* node_id,
                               uor_node_status* out) {
    uor_status st;
    const uor::ManifoldNode* n = lookup(manifold, node_id, &st);
    if (!n) return st;
    if (!out) return set_error(UOR_ERROR_INVALID_ARG, "null output");
    *out = n->status;
    return UOR_OK;
}

uor_status uor_read_real(uor_manifold_t manifold, const char* node_id, double* out) {
    uor_status st;
    const uor::ManifoldNode* n = lookup(manifold, node_id, &st);
    if (!n) return st;
    if (!out) return set_error(UOR_ERROR_INVALID_ARG, "null output");
    if (n->status != UOR_NODE_COMPUTED)
        return set_error(UOR_ERROR_INVALID_ARG,
                         std::string("node '") + node_id + "' is " +
                         uor_node_status_str(n->status));
    if (!n->payload->is_numeric())
        return set_error(UOR_ERROR_SHAPE_MISMATCH,
                         std::string("node '") + node_id + "' holds " +
                         uor_payload_kind_str(n->payload->kind()));
    *out = n->payload->as_real();
    return UOR_OK;
}

uor_status uor_read_text(uor_manifold_t manifold, const char* node_id,
                         char* buf, size_t buf_size, size_t* needed) {
    uor_status st;
    const uor::ManifoldNode* n = lookup(manifold, node_id, &st);
    if (!n) return st;
    if (n->status != UOR_NODE_COMPUTED)
        return set_error(UOR_ERROR_INVALID_ARG,
                         std::string("node '") + node_id + "' is " +
                         uor_node_status_str(n->status));

    std::string text = n->payload->kind() == UOR_PAYLOAD_TEXT
                           ? n->payload->as_text()
                           : n->payload->to_string();
    if (needed) *needed = text.size();
    if (buf && buf_size > 0) {
        size_t len = text.size() < buf_size - 1 ? text.size() : buf_size - 1;
        std::memcpy(buf, text.data(), len);
        buf[len] = '\0';
    }
    return UOR_OK;
}

const char* uor_last_error(void) {
    return t_last_error.c_str();
}
