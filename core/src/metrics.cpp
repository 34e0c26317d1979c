/**
 * @file metrics.cpp
 * @brief Metrics collector + structured logging implementation
 */

#include "uor/metrics.h"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

/* ---- Logging ---- */

static uor_log_fn                  s_log_fn    = nullptr;
static void*                       s_log_ud    = nullptr;
static std::atomic<uor_log_level>  s_log_level{UOR_LOG_INFO};
static std::mutex                  s_log_mu;

void uor_log_set_callback(uor_log_fn fn, void* userdata) {
    std::lock_guard<std::mutex> lk(s_log_mu);
    s_log_fn = fn;
    s_log_ud = userdata;
}

void uor_log_set_level(uor_log_level level) {
    s_log_level.store(level, std::memory_order_relaxed);
}

uor_log_level uor_log_get_level(void) {
    return s_log_level.load(std::memory_order_relaxed);
}

static const char* level_str(uor_log_level l) {
    switch (l) {
        case UOR_LOG_TRACE: return "TRACE";
        case UOR_LOG_DEBUG: return "DEBUG";
        case UOR_LOG_INFO:  return "INFO";
        case UOR_LOG_WARN:  return "WARN";
        case UOR_LOG_ERROR: return "ERROR";
        case UOR_LOG_FATAL: return "FATAL";
        default:            return "?";
    }
}

int uor_log_level_parse(const char* text, uor_log_level* out) {
    if (!text || !*text || !out) return 0;
    if (std::isdigit(static_cast<unsigned char>(text[0]))) {
        int v = std::atoi(text);
        if (v < UOR_LOG_TRACE || v > UOR_LOG_OFF) return 0;
        *out = static_cast<uor_log_level>(v);
        return 1;
    }
    char lower[16] = {};
    for (size_t i = 0; i < sizeof(lower) - 1 && text[i]; ++i)
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));

    static const struct { const char* name; uor_log_level level; } table[] = {
        {"trace", UOR_LOG_TRACE}, {"debug", UOR_LOG_DEBUG},
        {"info",  UOR_LOG_INFO},  {"warn",  UOR_LOG_WARN},
        {"error", UOR_LOG_ERROR}, {"fatal", UOR_LOG_FATAL},
        {"off",   UOR_LOG_OFF},
    };
    for (auto& e : table) {
        if (std::strcmp(lower, e.name) == 0) { *out = e.level; return 1; }
    }
    return 0;
}

void uor_log(uor_log_level level, const char* component, const char* fmt, ...) {
    if (level < uor_log_get_level() || level >= UOR_LOG_OFF) return;

    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    std::lock_guard<std::mutex> lk(s_log_mu);
    if (s_log_fn) {
        s_log_fn(level, component, buf, s_log_ud);
    } else {
        std::fprintf(stderr, "[%s] %s: %s\n", level_str(level), component, buf);
    }
}

/* ---- Metrics ---- */

static struct {
    std::atomic<uint64_t> runs_completed{0};
    std::atomic<uint64_t> runs_failed{0};
    std::atomic<uint64_t> runs_cancelled{0};
    std::atomic<uint64_t> nodes_computed{0};
    std::atomic<uint64_t> nodes_failed{0};
    std::atomic<uint64_t> nodes_skipped{0};
    std::atomic<uint64_t> cache_hits{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> total_run_us{0};
} s_metrics;

void uor_metrics_reset(void) {
    s_metrics.runs_completed.store(0);
    s_metrics.runs_failed.store(0);
    s_metrics.runs_cancelled.store(0);
    s_metrics.nodes_computed.store(0);
    s_metrics.nodes_failed.store(0);
    s_metrics.nodes_skipped.store(0);
    s_metrics.cache_hits.store(0);
    s_metrics.timeouts.store(0);
    s_metrics.total_run_us.store(0);
}

void uor_metrics_record_run(uor_status result, uint64_t us,
                            uint32_t computed, uint32_t failed,
                            uint32_t skipped, uint32_t cache_hits) {
    if (result == UOR_OK)
        s_metrics.runs_completed.fetch_add(1);
    else if (result == UOR_ERROR_CANCELLED)
        s_metrics.runs_cancelled.fetch_add(1);
    else
        s_metrics.runs_failed.fetch_add(1);

    s_metrics.total_run_us.fetch_add(us);
    s_metrics.nodes_computed.fetch_add(computed);
    s_metrics.nodes_failed.fetch_add(failed);
    s_metrics.nodes_skipped.fetch_add(skipped);
    s_metrics.cache_hits.fetch_add(cache_hits);
}

void uor_metrics_record_timeout(void) {
    s_metrics.timeouts.fetch_add(1);
}

void uor_metrics_snapshot_get(uor_metrics_snapshot* out) {
    out->runs_completed = s_metrics.runs_completed.load();
    out->runs_failed    = s_metrics.runs_failed.load();
    out->runs_cancelled = s_metrics.runs_cancelled.load();
    out->nodes_computed = s_metrics.nodes_computed.load();
    out->nodes_failed   = s_metrics.nodes_failed.load();
    out->nodes_skipped  = s_metrics.nodes_skipped.load();
    out->cache_hits     = s_metrics.cache_hits.load();
    out->timeouts       = s_metrics.timeouts.load();
    out->total_run_us   = s_metrics.total_run_us.load();
    uint64_t runs = out->runs_completed + out->runs_failed + out->runs_cancelled;
    out->avg_run_us = runs ? (double)out->total_run_us / (double)runs : 0.0;
}

size_t uor_metrics_to_json(char* buf, size_t buf_size) {
    uor_metrics_snapshot snap;
    uor_metrics_snapshot_get(&snap);
    int n = snprintf(buf, buf_size,
        "{\"runs_completed\":%llu,\"runs_failed\":%llu,\"runs_cancelled\":%llu,"
        "\"nodes_computed\":%llu,\"nodes_failed\":%llu,\"nodes_skipped\":%llu,"
        "\"cache_hits\":%llu,\"timeouts\":%llu,"
        "\"total_run_us\":%llu,\"avg_run_us\":%.2f}",
        (unsigned long long)snap.runs_completed, (unsigned long long)snap.runs_failed,
        (unsigned long long)snap.runs_cancelled,
        (unsigned long long)snap.nodes_computed, (unsigned long long)snap.nodes_failed,
        (unsigned long long)snap.nodes_skipped,
        (unsigned long long)snap.cache_hits, (unsigned long long)snap.timeouts,
        (unsigned long long)snap.total_run_us, snap.avg_run_us);
    return (n > 0) ? (size_t)n : 0;
}

size_t uor_metrics_to_prometheus(char* buf, size_t buf_size) {
    uor_metrics_snapshot snap;
    uor_metrics_snapshot_get(&snap);
    int n = snprintf(buf, buf_size,
        "# HELP uor_runs_completed Runs that finished without node failures\n"
        "# TYPE uor_runs_completed counter\n"
        "uor_runs_completed %llu\n"
        "# HELP uor_runs_failed Runs that ended with an execution error\n"
        "# TYPE uor_runs_failed counter\n"
        "uor_runs_failed %llu\n"
        "# HELP uor_runs_cancelled Runs stopped by a cancellation signal\n"
        "# TYPE uor_runs_cancelled counter\n"
        "uor_runs_cancelled %llu\n"
        "# HELP uor_nodes_computed Nodes computed across all runs\n"
        "# TYPE uor_nodes_computed counter\n"
        "uor_nodes_computed %llu\n"
        "# HELP uor_nodes_failed Nodes whose operator failed\n"
        "# TYPE uor_nodes_failed counter\n"
        "uor_nodes_failed %llu\n"
        "# HELP uor_nodes_skipped Nodes skipped due to upstream failure\n"
        "# TYPE uor_nodes_skipped counter\n"
        "uor_nodes_skipped %llu\n"
        "# HELP uor_cache_hits Pure invocations replayed from cache\n"
        "# TYPE uor_cache_hits counter\n"
        "uor_cache_hits %llu\n"
        "# HELP uor_timeouts Invocations that exceeded their timeout\n"
        "# TYPE uor_timeouts counter\n"
        "uor_timeouts %llu\n",
        (unsigned long long)snap.runs_completed, (unsigned long long)snap.runs_failed,
        (unsigned long long)snap.runs_cancelled,
        (unsigned long long)snap.nodes_computed, (unsigned long long)snap.nodes_failed,
        (unsigned long long)snap.nodes_skipped,
        (unsigned long long)snap.cache_hits, (unsigned long long)snap.timeouts);
    return (n > 0) ? (size_t)n : 0;
}
