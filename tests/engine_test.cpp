/**
 * @file engine_test.cpp
 * @brief Facade operations, environment configuration, Engine end-to-end
 */

#include "uor/engine.hpp"
#include "uor/builtin_ops.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#define CHECK(expr) do { \
    if (!(expr)) { \
        std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
        std::abort(); \
    } \
} while(0)

static const char* kChart = R"({
  "name": "pipeline",
  "nodes": [
    {"id": "a", "type": "const", "params": {"value": 5}},
    {"id": "b", "type": "const", "params": {"value": 7}},
    {"id": "c", "type": "add", "deps": ["a", "b"]},
    {"id": "d", "type": "fail", "deps": ["c"], "params": {"message": "nope"}},
    {"id": "e", "type": "neg", "deps": ["d"]},
    {"id": "f", "type": "mul", "deps": ["c", "c"]}
  ]
})";

static void clear_env() {
    unsetenv("UOR_THREADS");
    unsetenv("UOR_TIMEOUT_MS");
    unsetenv("UOR_CACHE");
    unsetenv("UOR_CACHE_ENTRIES");
    unsetenv("UOR_LOG_LEVEL");
}

static void test_config_from_env() {
    clear_env();
    uor::EngineConfig d = uor::EngineConfig::from_env();
    CHECK(d.threads == 0 && d.timeout_ms == 0);
    CHECK(d.cache && d.cache_entries == 1024);
    CHECK(d.log_level == UOR_LOG_INFO);

    setenv("UOR_THREADS", "3", 1);
    setenv("UOR_TIMEOUT_MS", "250", 1);
    setenv("UOR_CACHE", "0", 1);
    setenv("UOR_CACHE_ENTRIES", "64", 1);
    setenv("UOR_LOG_LEVEL", "error", 1);
    uor::EngineConfig c = uor::EngineConfig::from_env();
    CHECK(c.threads == 3 && c.timeout_ms == 250);
    CHECK(!c.cache && c.cache_entries == 64);
    CHECK(c.log_level == UOR_LOG_ERROR);

    uor::SchedulerConfig sc = c.scheduler_config();
    CHECK(sc.n_threads == 3 && sc.op_timeout_ms == 250);

    /* Garbage is ignored, defaults stand. */
    setenv("UOR_THREADS", "many", 1);
    setenv("UOR_TIMEOUT_MS", "-5", 1);
    setenv("UOR_LOG_LEVEL", "shouty", 1);
    uor::EngineConfig g = uor::EngineConfig::from_env();
    CHECK(g.threads == 0);
    CHECK(g.log_level == UOR_LOG_INFO);

    clear_env();
    std::printf("  PASS: config from env\n");
}

static void test_facade_ops() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::ChartSchema schema = reg.schema();

    uor::Chart chart;
    uor::SchemaError serr;
    CHECK(uor::load_chart(kChart, &schema, &chart, &serr) == UOR_OK);
    CHECK(chart.name() == "pipeline" && chart.size() == 6);

    uor::Manifold m;
    uor::BuildError berr;
    CHECK(uor::build_manifold(chart, &reg, &m, &berr) == UOR_OK);

    uor::Scheduler sched(uor::SchedulerConfig{2, 0, 5});
    uor::Manifold out;
    uor::ExecutionError xerr;
    CHECK(uor::run(m, reg, sched, {}, &out, &xerr) == UOR_ERROR_EXECUTION);
    CHECK(m.count(UOR_NODE_PENDING) == 6);        // input untouched

    uor::PayloadRef p;
    CHECK(uor::read_payload(out, "c", &p) == UOR_OK);
    CHECK(*p == uor::Payload::integer(12));
    CHECK(uor::read_payload(out, "f", &p) == UOR_OK);
    CHECK(*p == uor::Payload::integer(144));

    CHECK(uor::read_payload(out, "ghost", &p) == UOR_ERROR_NOT_FOUND);
    CHECK(uor::read_payload(out, "d", &p) == UOR_ERROR_INVALID_ARG);
    CHECK(uor::read_payload(out, "e", &p) == UOR_ERROR_INVALID_ARG);
    CHECK(uor::read_payload(m, "c", &p) == UOR_ERROR_INVALID_ARG);
    CHECK(uor::read_payload(out, "c", nullptr) == UOR_ERROR_INVALID_ARG);

    CHECK(xerr.find("d") && xerr.find("d")->message == "nope");
    CHECK(xerr.skipped.size() == 1 && xerr.skipped[0] == "e");
    CHECK(uor::run(m, reg, sched, {}, nullptr, &xerr) == UOR_ERROR_INVALID_ARG);
    std::printf("  PASS: facade ops\n");
}

static void test_engine_load_and_run() {
    uor::EngineConfig cfg;
    cfg.threads = 2;
    cfg.cache_entries = 32;
    cfg.log_level = UOR_LOG_WARN;
    uor::Engine engine(cfg);
    CHECK(engine.registry().contains("add"));
    CHECK(engine.scheduler().concurrency() == 2);
    CHECK(engine.cache() != nullptr);

    uor::Manifold m;
    uor::Diagnostic diag;
    CHECK(engine.load(kChart, &m, &diag) == UOR_OK);

    /* Unknown operators are rejected at load time. */
    uor::Manifold bad;
    CHECK(engine.load(R"({"nodes": [{"id": "x", "type": "warp"}]})", &bad, &diag)
          == UOR_ERROR_UNKNOWN_OP);
    CHECK(diag.node_id == "x");
    CHECK(engine.load(R"({"nodes": [{"id": "x", "type": "sub", "deps": []}]})", &bad, &diag)
          == UOR_ERROR_ARITY);
    CHECK(diag.domain == uor::ErrorDomain::Build);

    uor::Manifold out;
    uor::ExecutionError xerr;
    CHECK(engine.run(m, &out, &xerr) == UOR_ERROR_EXECUTION);
    CHECK(*out.payload("f") == uor::Payload::integer(144));

    /* Second run replays the pure nodes from the cache. */
    uor::Manifold again;
    CHECK(engine.run(m, &again, &xerr) == UOR_ERROR_EXECUTION);
    CHECK(engine.scheduler().last_profile().cache_hits() == 4);
    CHECK(engine.cache()->stats().hits >= 4);

    uor::CancelToken token;
    token.cancel();
    CHECK(engine.run(m, &again, &xerr, &token) == UOR_ERROR_CANCELLED);

    uor::EngineConfig nocache = cfg;
    nocache.cache = false;
    uor::Engine plain(nocache);
    CHECK(plain.cache() == nullptr);
    CHECK(plain.run(m, &out, &xerr) == UOR_ERROR_EXECUTION);
    std::printf("  PASS: engine load and run\n");
}

static void test_engine_stack() {
    uor::EngineConfig cfg;
    cfg.threads = 2;
    cfg.log_level = UOR_LOG_WARN;
    uor::Engine engine(cfg);

    uor::Manifold m;
    uor::Diagnostic diag;
    CHECK(engine.load(R"({"nodes": [{"id": "v", "type": "const",
                                     "params": {"value": [0, 3, 0, 4]}}]})",
                      &m, &diag) == UOR_OK);

    uor::CognitiveStack stack;
    CHECK(stack.add_stage(uor::StageSpec{"q", "embed_quaternion", {}, {"v"}}) == UOR_OK);
    CHECK(stack.add_stage(uor::StageSpec{"n", "sum", {}, {}}) == UOR_OK);

    uor::Manifold out;
    uor::StackError err;
    CHECK(engine.run_stack(stack, m, &out, &err) == UOR_OK);
    CHECK(*out.payload("v") == uor::Payload::vector({0, 3, 0, 4}));
    CHECK(*out.payload("q") == uor::Payload::vector({0, 0.6, 0, 0.8}));
    CHECK(*out.payload("n") == uor::Payload::real(0.6 + 0.8));

    /* The engine's cortex holds the stack's embedding. */
    CHECK(engine.cortex().occupied() == 1);
    CHECK(engine.cortex().recall("q") == out.payload("q"));
    std::printf("  PASS: engine stack\n");
}

int main() {
    std::printf("engine_test: facade\n");
    test_config_from_env();
    test_facade_ops();
    test_engine_load_and_run();
    test_engine_stack();
    std::printf("OK: all engine tests passed\n");
    return 0;
}
