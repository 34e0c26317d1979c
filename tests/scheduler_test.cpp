/**
 * @file scheduler_test.cpp
 * @brief Scheduler: results, failure propagation, causality, concurrency bound
 */

#include "uor/Scheduler.hpp"
#include "uor/builtin_ops.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

#define CHECK(expr) do { \
    if (!(expr)) { \
        std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
        std::abort(); \
    } \
} while(0)

static uor::NodeSpec spec(const char* id, const char* type,
                          std::vector<std::string> deps = {},
                          uor::ParamBag params = {}) {
    uor::NodeSpec s;
    s.id = id;
    s.type = type;
    s.deps = std::move(deps);
    s.params = std::move(params);
    return s;
}

static uor::ParamBag value(double v) {
    uor::ParamBag p;
    p["value"] = uor::Payload::real(v);
    return p;
}

static uor::ParamBag ivalue(int64_t v) {
    uor::ParamBag p;
    p["value"] = uor::Payload::integer(v);
    return p;
}

static void build(uor::Manifold& m, const uor::OperatorRegistry& reg,
                  std::vector<uor::NodeSpec> specs) {
    uor::BuildError err;
    uor_status st = m.extend(specs, &reg, &err);
    if (st != UOR_OK) std::fprintf(stderr, "build: %s\n", err.to_string().c_str());
    CHECK(st == UOR_OK);
}

static void test_sum() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::Scheduler sched(uor::SchedulerConfig{2, 0, 5});

    uor::Manifold m;
    build(m, reg, {spec("a", "const", {}, ivalue(5)),
                   spec("b", "const", {}, ivalue(7)),
                   spec("c", "add", {"a", "b"})});

    uor::ExecutionError err;
    CHECK(sched.run(m, reg, {}, &err) == UOR_OK);
    CHECK(err.failures.empty() && err.skipped.empty());
    CHECK(m.find("c")->status == UOR_NODE_COMPUTED);
    CHECK(*m.payload("c") == uor::Payload::integer(12));
    CHECK(m.count(UOR_NODE_COMPUTED) == 3);
    std::printf("  PASS: sum\n");
}

static void test_failure_skips_downstream() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::Scheduler sched(uor::SchedulerConfig{4, 0, 5});

    uor::ParamBag why;
    why["message"] = uor::Payload::text("boom");

    uor::Manifold m;
    build(m, reg, {spec("a", "const", {}, value(1)),
                   spec("b", "fail", {"a"}, why),
                   spec("c", "neg", {"b"}),
                   spec("d", "neg", {"c"}),
                   /* independent sibling subtree keeps going */
                   spec("s1", "const", {}, value(3)),
                   spec("s2", "neg", {"s1"})});

    uor::ExecutionError err;
    CHECK(sched.run(m, reg, {}, &err) == UOR_ERROR_EXECUTION);
    CHECK(err.code == UOR_ERROR_EXECUTION);

    CHECK(m.find("a")->status == UOR_NODE_COMPUTED);
    CHECK(m.find("b")->status == UOR_NODE_FAILED);
    CHECK(m.find("b")->cause == UOR_ERROR_COMPUTE);
    CHECK(m.find("b")->message == "boom");
    CHECK(m.find("c")->status == UOR_NODE_SKIPPED);
    CHECK(m.find("d")->status == UOR_NODE_SKIPPED);
    CHECK(m.payload("c") == nullptr);

    CHECK(*m.payload("s2") == uor::Payload::real(-3));

    CHECK(err.failures.size() == 1);
    const uor::NodeFailure* f = err.find("b");
    CHECK(f != nullptr && f->cause == UOR_ERROR_COMPUTE);
    CHECK(err.skipped.size() == 2);
    CHECK(err.to_string().find("boom") != std::string::npos);

    /* The recorded profile never dispatched the skipped nodes. */
    CHECK(sched.last_profile().find_task("c") == nullptr);
    std::printf("  PASS: failure skips downstream\n");
}

static void test_causality() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::Scheduler sched(uor::SchedulerConfig{4, 0, 5});

    uor::ParamBag slow;
    slow["ms"] = uor::Payload::integer(5);

    uor::Manifold m;
    build(m, reg, {spec("a", "const", {}, value(1)),
                   spec("b", "sleep", {"a"}, slow),
                   spec("c", "const", {}, value(2)),
                   spec("d", "add", {"b", "c"}),
                   spec("e", "neg", {"d"})});
    CHECK(sched.run(m, reg) == UOR_OK);
    CHECK(*m.payload("e") == uor::Payload::real(-3));

    const uor::GraphProfile& prof = sched.last_profile();
    CHECK(prof.tasks.size() == 5);
    for (auto& id : {"b", "c"}) {
        const uor::TaskProfile* dep = prof.find_task(id);
        const uor::TaskProfile* d   = prof.find_task("d");
        CHECK(dep && d);
        CHECK(dep->t_end <= d->t_start);
    }
    CHECK(prof.find_task("d")->t_end <= prof.find_task("e")->t_start);
    std::printf("  PASS: causality\n");
}

static void test_concurrency_bound() {
    auto live = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);

    uor::OperatorContract c;
    c.min_arity = 0;
    c.max_arity = 0;
    c.flags = UOR_OP_NONE;

    uor::OperatorRegistry reg;
    CHECK(reg.add(uor::make_operator("gauge", c, [live, peak](uor::OpCall& call) {
        int now = live->fetch_add(1) + 1;
        int seen = peak->load();
        while (now > seen && !peak->compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
        live->fetch_sub(1);
        call.output = uor::Payload::integer(1);
        return UOR_OK;
    })) == UOR_OK);

    uor::Manifold m;
    std::vector<uor::NodeSpec> specs;
    std::vector<std::string> ids;
    for (int i = 0; i < 24; ++i) ids.push_back("p" + std::to_string(i));
    for (auto& id : ids) specs.push_back(spec(id.c_str(), "gauge"));
    build(m, reg, specs);

    const uint32_t N = 3;
    uor::Scheduler sched(uor::SchedulerConfig{N, 0, 5});
    CHECK(sched.concurrency() == N);
    CHECK(sched.run(m, reg) == UOR_OK);
    CHECK(m.count(UOR_NODE_COMPUTED) == 24);
    CHECK(peak->load() <= static_cast<int>(N));
    CHECK(sched.peak_in_flight() <= N);
    CHECK(sched.peak_in_flight() >= 1);

    for (auto& tp : sched.last_profile().tasks) CHECK(tp.lane < N);
    std::printf("  PASS: concurrency bound (peak %d)\n", peak->load());
}

static void test_idempotent_across_copies() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::Scheduler sched(uor::SchedulerConfig{4, 0, 5});

    uor::ParamBag f;
    f["factor"] = uor::Payload::real(0.5);
    uor::Manifold base;
    build(base, reg, {spec("a", "const", {}, value(3)),
                      spec("b", "const", {}, value(4)),
                      spec("v", "concat", {"a", "b"}),
                      spec("s", "scale", {"v"}, f),
                      spec("q", "embed_quaternion", {"s"}),
                      spec("n", "sum", {"q"})});

    uor::Manifold first = base;
    uor::Manifold second = base;
    CHECK(sched.run(first, reg) == UOR_OK);
    CHECK(sched.run(second, reg) == UOR_OK);
    for (auto& n : first.nodes())
        CHECK(*first.payload(n.id) == *second.payload(n.id));
    CHECK(base.count(UOR_NODE_PENDING) == base.size());
    std::printf("  PASS: idempotent across copies\n");
}

static void test_exception_becomes_compute_error() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::OperatorContract c;
    c.min_arity = 0;
    c.max_arity = 0;
    CHECK(reg.add(uor::make_operator("throws", c, [](uor::OpCall&) -> uor_status {
        throw std::runtime_error("kaboom");
    })) == UOR_OK);

    uor::Manifold m;
    build(m, reg, {spec("t", "throws"), spec("after", "neg", {"t"})});
    uor::Scheduler sched(uor::SchedulerConfig{2, 0, 5});
    uor::ExecutionError err;
    CHECK(sched.run(m, reg, {}, &err) == UOR_ERROR_EXECUTION);
    CHECK(m.find("t")->cause == UOR_ERROR_COMPUTE);
    CHECK(m.find("t")->message.find("kaboom") != std::string::npos);
    CHECK(m.find("after")->status == UOR_NODE_SKIPPED);
    std::printf("  PASS: exception becomes compute error\n");
}

static void test_shape_mismatch_at_run_time() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::ParamBag t;
    t["value"] = uor::Payload::text("not a number");

    uor::Manifold m;
    build(m, reg, {spec("a", "const", {}, t),
                   spec("b", "neg", {"a"}),
                   spec("x", "const", {}, uor::ParamBag{{"value", uor::Payload::vector({1, 2})}}),
                   spec("y", "const", {}, uor::ParamBag{{"value", uor::Payload::vector({1})}}),
                   spec("d", "dot", {"x", "y"})});
    uor::Scheduler sched(uor::SchedulerConfig{2, 0, 5});
    uor::ExecutionError err;
    CHECK(sched.run(m, reg, {}, &err) == UOR_ERROR_EXECUTION);
    CHECK(m.find("b")->cause == UOR_ERROR_SHAPE_MISMATCH);
    CHECK(m.find("d")->cause == UOR_ERROR_SHAPE_MISMATCH);
    CHECK(m.find("d")->message.find("length") != std::string::npos);
    CHECK(err.failures.size() == 2);
    std::printf("  PASS: shape mismatch at run time\n");
}

static void test_computed_nodes_not_rerun() {
    auto calls = std::make_shared<std::atomic<int>>(0);
    uor::OperatorContract c;
    c.min_arity = 0;
    c.max_arity = UOR_VARIADIC;
    c.flags = UOR_OP_NONE;

    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    CHECK(reg.add(uor::make_operator("count", c, [calls](uor::OpCall& call) {
        call.output = uor::Payload::integer(calls->fetch_add(1) + 1);
        return UOR_OK;
    })) == UOR_OK);

    uor::Manifold m;
    build(m, reg, {spec("k", "count")});
    uor::Scheduler sched(uor::SchedulerConfig{2, 0, 5});
    CHECK(sched.run(m, reg) == UOR_OK);
    CHECK(calls->load() == 1);

    /* Extend a later version; only the new node runs. */
    uor::Manifold next = m.derive();
    build(next, reg, {spec("k2", "count", {"k"})});
    CHECK(sched.run(next, reg) == UOR_OK);
    CHECK(calls->load() == 2);
    CHECK(*next.payload("k") == uor::Payload::integer(1));
    CHECK(*next.payload("k2") == uor::Payload::integer(2));

    /* Nothing left to do: a rerun is a no-op. */
    CHECK(sched.run(next, reg) == UOR_OK);
    CHECK(calls->load() == 2);
    CHECK(sched.last_profile().tasks.empty());
    std::printf("  PASS: computed nodes not rerun\n");
}

static void test_rerun_reports_earlier_failures() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::Scheduler sched(uor::SchedulerConfig{2, 0, 5});

    uor::ParamBag msg;
    msg["message"] = uor::Payload::text("disk full");
    uor::Manifold m;
    build(m, reg, {spec("a", "const", {}, ivalue(1)),
                   spec("f", "fail", {"a"}, msg),
                   spec("g", "neg", {"f"}),
                   spec("h", "neg", {"a"})});

    uor::ExecutionError err;
    CHECK(sched.run(m, reg, {}, &err) == UOR_ERROR_EXECUTION);
    CHECK(err.failures.size() == 1 && err.skipped.size() == 1);

    /* Nothing is dispatched again, but the outcome still carries the failure. */
    CHECK(sched.run(m, reg, {}, &err) == UOR_ERROR_EXECUTION);
    CHECK(sched.last_profile().tasks.empty());
    CHECK(err.code == UOR_ERROR_EXECUTION);
    CHECK(err.failures.size() == 1);
    const uor::NodeFailure* f = err.find("f");
    CHECK(f != nullptr && f->cause == UOR_ERROR_COMPUTE && f->message == "disk full");
    CHECK(err.skipped.size() == 1 && err.skipped[0] == "g");
    CHECK(*m.payload("h") == uor::Payload::integer(-1));

    /* Later versions inherit the failure too. */
    uor::Manifold next = m.derive();
    build(next, reg, {spec("k", "neg", {"h"})});
    CHECK(sched.run(next, reg, {}, &err) == UOR_ERROR_EXECUTION);
    CHECK(*next.payload("k") == uor::Payload::integer(1));
    CHECK(err.find("f") != nullptr);
    std::printf("  PASS: rerun reports earlier failures\n");
}

static void test_timeout_param_validation() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::Scheduler sched(uor::SchedulerConfig{2, 0, 5});

    auto with_timeout = [](double t) {
        uor::ParamBag p;
        p["ms"] = uor::Payload::integer(20);
        p["timeout_ms"] = uor::Payload::real(t);
        return p;
    };

    uor::Manifold m;
    build(m, reg, {spec("huge", "sleep", {}, with_timeout(1e13)),
                   spec("max", "sleep", {}, with_timeout(1.7e308)),
                   spec("inf", "sleep", {}, with_timeout(INFINITY)),
                   spec("neg", "sleep", {}, with_timeout(-5))});

    uor::ExecutionError err;
    CHECK(sched.run(m, reg, {}, &err) == UOR_ERROR_EXECUTION);
    /* Beyond the clock range means no deadline at all. */
    CHECK(m.find("huge")->status == UOR_NODE_COMPUTED);
    CHECK(m.find("max")->status == UOR_NODE_COMPUTED);
    CHECK(m.find("inf")->status == UOR_NODE_FAILED);
    CHECK(m.find("inf")->cause == UOR_ERROR_INVALID_ARG);
    CHECK(m.find("neg")->cause == UOR_ERROR_INVALID_ARG);
    CHECK(err.failures.size() == 2);
    std::printf("  PASS: timeout param validation\n");
}

namespace uor {
/* Wires a dependency edge past extend()'s cycle check. */
struct ManifoldTestAccess {
    static void add_edge(Manifold& m, const std::string& from, const std::string& to) {
        uint32_t f = m.index_.at(from);
        uint32_t t = m.index_.at(to);
        m.nodes_[t].deps.push_back(from);
        m.nodes_[t].dep_index.push_back(f);
        m.nodes_[f].successors.push_back(t);
    }
};
} // namespace uor

static void test_runtime_cycle_is_invariant() {
    uor::OperatorRegistry reg;
    CHECK(uor::register_builtin_operators(reg) == UOR_OK);
    uor::Scheduler sched(uor::SchedulerConfig{2, 0, 5});

    uor::Manifold m;
    build(m, reg, {spec("a", "const", {}, ivalue(3)),
                   spec("b", "identity", {"a"}),
                   spec("c", "neg", {"b"})});
    uor::ManifoldTestAccess::add_edge(m, "c", "b");   // b <-> c

    uor::ExecutionError err;
    CHECK(sched.run(m, reg, {}, &err) == UOR_ERROR_INVARIANT);
    CHECK(err.code == UOR_ERROR_INVARIANT);
    CHECK(m.find("a")->status == UOR_NODE_COMPUTED);
    CHECK(m.find("b")->status == UOR_NODE_PENDING);
    CHECK(m.find("c")->status == UOR_NODE_PENDING);
    CHECK(err.failures.empty());
    std::printf("  PASS: runtime cycle is invariant\n");
}

static void test_empty_manifold() {
    uor::OperatorRegistry reg;
    uor::Manifold m;
    uor::Scheduler sched;
    CHECK(sched.concurrency() >= 1);
    CHECK(sched.run(m, reg) == UOR_OK);
    std::printf("  PASS: empty manifold\n");
}

int main() {
    std::printf("scheduler_test: dispatch & propagation\n");
    test_sum();
    test_failure_skips_downstream();
    test_causality();
    test_concurrency_bound();
    test_idempotent_across_copies();
    test_exception_becomes_compute_error();
    test_shape_mismatch_at_run_time();
    test_computed_nodes_not_rerun();
    test_rerun_reports_earlier_failures();
    test_timeout_param_validation();
    test_runtime_cycle_is_invariant();
    test_empty_manifold();
    std::printf("OK: all scheduler tests passed\n");
    return 0;
}
