/**
 * @file engine.cpp
 * @brief Facade operations, environment configuration, Engine bundle
 */

#include "uor/engine.hpp"
#include "uor/builtin_ops.hpp"

#include <cerrno>
#include <cstdlib>

namespace uor {

/* -- Environment -------------------------------------------------- */

static bool env_u32(const char* name, uint32_t* out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    errno = 0;
    char* end = nullptr;
    unsigned long n = std::strtoul(v, &end, 10);
    if (errno != 0 || *end != '\0' || n > UINT32_MAX) {
        uor_log(UOR_LOG_WARN, "config", "ignoring %s='%s': not a count", name, v);
        return false;
    }
    *out = static_cast<uint32_t>(n);
    return true;
}

EngineConfig EngineConfig::from_env() {
    EngineConfig cfg;
    env_u32("UOR_THREADS", &cfg.threads);
    env_u32("UOR_TIMEOUT_MS", &cfg.timeout_ms);
    env_u32("UOR_CACHE_ENTRIES", &cfg.cache_entries);

    uint32_t cache_on = 1;
    if (env_u32("UOR_CACHE", &cache_on)) cfg.cache = cache_on != 0;

    if (const char* lv = std::getenv("UOR_LOG_LEVEL")) {
        if (!uor_log_level_parse(lv, &cfg.log_level))
            uor_log(UOR_LOG_WARN, "config", "ignoring UOR_LOG_LEVEL='%s'", lv);
    }
    return cfg;
}

/* -- Facade ------------------------------------------------------- */

uor_status load_chart(const std::string& source, const ChartSchema* schema,
                      Chart* out, SchemaError* err) {
    return parse_chart(source, schema, out, err);
}

uor_status build_manifold(const Chart& chart, const OperatorRegistry* registry,
                          Manifold* out, BuildError* err) {
    return chart_to_manifold(chart, registry, out, err);
}

uor_status run(const Manifold& input, const OperatorRegistry& registry,
               Scheduler& scheduler, const RunOptions& opts,
               Manifold* out, ExecutionError* err) {
    if (!out) return UOR_ERROR_INVALID_ARG;
    Manifold work = input;
    uor_status st = scheduler.run(work, registry, opts, err);
    *out = std::move(work);
    return st;
}

uor_status read_payload(const Manifold& manifold, const std::string& node_id,
                        PayloadRef* out) {
    if (!out) return UOR_ERROR_INVALID_ARG;
    const ManifoldNode* n = manifold.find(node_id);
    if (!n) return UOR_ERROR_NOT_FOUND;
    if (n->status != UOR_NODE_COMPUTED) return UOR_ERROR_INVALID_ARG;
    *out = n->payload;
    return UOR_OK;
}

/* -- Engine ------------------------------------------------------- */

Engine::Engine(EngineConfig cfg)
    : cfg_(cfg),
      scheduler_(std::make_unique<Scheduler>(cfg.scheduler_config())) {
    uor_log_set_level(cfg_.log_level);
    if (cfg_.cache) cache_ = std::make_unique<ResultCache>(cfg_.cache_entries);

    RegistryError rerr;
    if (register_builtin_operators(registry_, &rerr) != UOR_OK)
        uor_log(UOR_LOG_ERROR, "engine", "built-ins: %s", rerr.to_string().c_str());

    uor_log(UOR_LOG_DEBUG, "engine", "%u workers, timeout %u ms, cache %s",
            scheduler_->concurrency(), cfg_.timeout_ms,
            cache_ ? "on" : "off");
}

uor_status Engine::load(const std::string& source, Manifold* out, Diagnostic* err) {
    ChartSchema schema = registry_.schema();
    Chart chart;
    uor_status st = load_chart(source, &schema, &chart, err);
    if (st != UOR_OK) return st;
    return build_manifold(chart, &registry_, out, err);
}

uor_status Engine::run(const Manifold& input, Manifold* out, ExecutionError* err,
                       const CancelToken* cancel) {
    RunOptions opts;
    opts.cache  = cache_.get();
    opts.cancel = cancel;
    return uor::run(input, registry_, *scheduler_, opts, out, err);
}

uor_status Engine::run_stack(const CognitiveStack& stack, const Manifold& input,
                             Manifold* out, StackError* err, const CancelToken* cancel) {
    RunOptions opts;
    opts.cache  = cache_.get();
    opts.cancel = cancel;
    return stack.run(input, registry_, *scheduler_, opts, out, err, &cortex_);
}

} // namespace uor
