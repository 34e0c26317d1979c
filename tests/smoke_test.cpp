/**
 * @file smoke_test.cpp
 * @brief Minimal compile + link smoke test for uor_core: ABI, logging, metrics.
 */

#include "uor/uor_abi.h"
#include "uor/metrics.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#define CHECK(expr) do { \
    if (!(expr)) { \
        std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
        std::abort(); \
    } \
} while(0)

struct Captured {
    std::vector<std::string> lines;
};

static void capture(uor_log_level level, const char* component,
                    const char* message, void* ud) {
    auto* c = static_cast<Captured*>(ud);
    c->lines.push_back(std::to_string(level) + "|" + component + "|" + message);
}

static void test_abi() {
    static_assert(UOR_ABI_VERSION == 0x000200, "ABI version packing broken");
    CHECK(std::strcmp(uor_status_str(UOR_OK), "ok") == 0);
    CHECK(std::strcmp(uor_status_str(UOR_ERROR_CYCLE), "cycle") == 0);
    CHECK(std::strcmp(uor_status_str(UOR_ERROR_CONFLICT), "conflict") == 0);
    CHECK(std::strcmp(uor_status_str(static_cast<uor_status>(999)), "unknown") == 0);
    CHECK(std::strcmp(uor_node_status_str(UOR_NODE_SKIPPED), "skipped") == 0);
    CHECK(std::strcmp(uor_payload_kind_str(UOR_PAYLOAD_VECTOR), "vector") == 0);
    std::printf("  PASS: abi strings\n");
}

static void test_logging() {
    Captured cap;
    uor_log_set_callback(capture, &cap);
    uor_log_set_level(UOR_LOG_WARN);

    uor_log(UOR_LOG_INFO, "smoke", "filtered %d", 1);
    uor_log(UOR_LOG_ERROR, "smoke", "kept %d", 2);
    CHECK(cap.lines.size() == 1);
    CHECK(cap.lines[0] == "4|smoke|kept 2");

    uor_log_set_level(UOR_LOG_OFF);
    uor_log(UOR_LOG_FATAL, "smoke", "silenced");
    CHECK(cap.lines.size() == 1);

    uor_log_set_callback(nullptr, nullptr);
    uor_log_set_level(UOR_LOG_INFO);

    uor_log_level lv = UOR_LOG_INFO;
    CHECK(uor_log_level_parse("debug", &lv) && lv == UOR_LOG_DEBUG);
    CHECK(uor_log_level_parse("WARN", &lv) && lv == UOR_LOG_WARN);
    CHECK(uor_log_level_parse("0", &lv) && lv == UOR_LOG_TRACE);
    CHECK(!uor_log_level_parse("loud", &lv));
    CHECK(!uor_log_level_parse("9", &lv));
    std::printf("  PASS: logging\n");
}

static void test_metrics() {
    uor_metrics_reset();
    uor_metrics_record_run(UOR_OK, 100, 3, 0, 0, 1);
    uor_metrics_record_run(UOR_ERROR_EXECUTION, 300, 1, 1, 2, 0);
    uor_metrics_record_run(UOR_ERROR_CANCELLED, 200, 0, 0, 0, 0);
    uor_metrics_record_timeout();

    uor_metrics_snapshot s;
    uor_metrics_snapshot_get(&s);
    CHECK(s.runs_completed == 1);
    CHECK(s.runs_failed == 1);
    CHECK(s.runs_cancelled == 1);
    CHECK(s.nodes_computed == 4);
    CHECK(s.nodes_failed == 1);
    CHECK(s.nodes_skipped == 2);
    CHECK(s.cache_hits == 1);
    CHECK(s.timeouts == 1);
    CHECK(s.total_run_us == 600);
    CHECK(s.avg_run_us == 200.0);

    char buf[2048];
    size_t n = uor_metrics_to_json(buf, sizeof(buf));
    CHECK(n > 0);
    CHECK(std::strstr(buf, "\"runs_failed\":1") != nullptr);

    n = uor_metrics_to_prometheus(buf, sizeof(buf));
    CHECK(n > 0);
    CHECK(std::strstr(buf, "# TYPE uor_timeouts counter") != nullptr);
    CHECK(std::strstr(buf, "uor_nodes_skipped 2") != nullptr);

    uor_metrics_reset();
    uor_metrics_snapshot_get(&s);
    CHECK(s.runs_completed == 0 && s.avg_run_us == 0.0);
    std::printf("  PASS: metrics\n");
}

int main() {
    std::printf("smoke_test: uor_core\n");
    test_abi();
    test_logging();
    test_metrics();
    std::printf("OK: uor_core smoke test passed\n");
    return 0;
}
