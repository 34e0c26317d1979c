/**
 * @file engine.hpp
 * @brief Public facade — load_chart, build_manifold, run, read_payload
 *
 * The four free functions are the whole surface consumed by surrounding
 * tooling; no scheduler internals are reachable through them. Engine
 * bundles a registry (with built-ins), a scheduler, a replay cache
 * configured from EngineConfig and the MemoryCortex its stacks link into.
 */

#ifndef UOR_ENGINE_HPP
#define UOR_ENGINE_HPP

#include "uor/Chart.hpp"
#include "uor/CognitiveStack.hpp"
#include "uor/Manifold.hpp"
#include "uor/MemoryCortex.hpp"
#include "uor/Operator.hpp"
#include "uor/ResultCache.hpp"
#include "uor/Scheduler.hpp"
#include "uor/metrics.h"

#include <memory>
#include <string>

namespace uor {

/* ================================================================== */
/*  EngineConfig                                                       */
/* ================================================================== */

struct EngineConfig {
    uint32_t      threads        = 0;      /**< 0 = hardware concurrency */
    uint32_t      timeout_ms     = 0;      /**< 0 = none                 */
    bool          cache          = true;
    uint32_t      cache_entries  = 1024;
    uor_log_level log_level      = UOR_LOG_INFO;

    /**
     * Defaults overridden by UOR_THREADS, UOR_TIMEOUT_MS, UOR_CACHE (0
     * disables), UOR_CACHE_ENTRIES and UOR_LOG_LEVEL (name or number).
     * Unparseable values are ignored with a warning.
     */
    static EngineConfig from_env();

    SchedulerConfig scheduler_config() const {
        SchedulerConfig sc;
        sc.n_threads     = threads;
        sc.op_timeout_ms = timeout_ms;
        return sc;
    }
};

/* ================================================================== */
/*  Facade operations                                                  */
/* ================================================================== */

uor_status load_chart(const std::string& source, const ChartSchema* schema,
                      Chart* out, SchemaError* err);

uor_status build_manifold(const Chart& chart, const OperatorRegistry* registry,
                          Manifold* out, BuildError* err);

/** Run a copy of `input`; the completed (or partial) copy lands in `out`. */
uor_status run(const Manifold& input, const OperatorRegistry& registry,
               Scheduler& scheduler, const RunOptions& opts,
               Manifold* out, ExecutionError* err);

/** UOR_ERROR_NOT_FOUND for unknown ids, INVALID_ARG if not computed. */
uor_status read_payload(const Manifold& manifold, const std::string& node_id,
                        PayloadRef* out);

/* ================================================================== */
/*  Engine — registry + scheduler + cache                              */
/* ================================================================== */

class Engine {
public:
    explicit Engine(EngineConfig cfg = EngineConfig{});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    const EngineConfig& config() const { return cfg_; }
    OperatorRegistry&   registry()     { return registry_; }
    Scheduler&          scheduler()    { return *scheduler_; }
    ResultCache*        cache()        { return cache_.get(); }
    MemoryCortex&       cortex()       { return cortex_; }

    /** load_chart (validated against the registry) + build_manifold. */
    uor_status load(const std::string& source, Manifold* out, Diagnostic* err);

    uor_status run(const Manifold& input, Manifold* out, ExecutionError* err,
                   const CancelToken* cancel = nullptr);

    uor_status run_stack(const CognitiveStack& stack, const Manifold& input,
                         Manifold* out, StackError* err,
                         const CancelToken* cancel = nullptr);

private:
    EngineConfig                 cfg_;
    OperatorRegistry             registry_;
    std::unique_ptr<Scheduler>   scheduler_;
    std::unique_ptr<ResultCache> cache_;
    MemoryCortex                 cortex_;
};

} // namespace uor

#endif // UOR_ENGINE_HPP
