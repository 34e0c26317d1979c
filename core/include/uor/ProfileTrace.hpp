/**
 * @file ProfileTrace.hpp
 * @brief Per-run profiling — per-node queue / dispatch / total latency
 *
 * The Scheduler records steady_clock timestamps at:
 *   - enqueue (node entered the ready set)
 *   - start   (operator invocation begins on a worker)
 *   - end     (invocation returns, or the node times out)
 *
 * A GraphProfile can be dumped as plain JSON or as Chrome trace_event
 * JSON (loadable in chrome://tracing or Perfetto), one lane per worker
 * slot.
 */

#ifndef UOR_PROFILE_TRACE_HPP
#define UOR_PROFILE_TRACE_HPP

#include "uor/uor_abi.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace uor {

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;
using Duration    = std::chrono::duration<double, std::micro>;  // microseconds

/** Free helper: microseconds between two time points. */
inline double duration_us(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Duration>(to - from).count();
}

/* ================================================================== */
/*  TaskProfile — per-node timing record                               */
/* ================================================================== */

struct TaskProfile {
    std::string node_id;
    std::string op_name;
    uint32_t    lane      = 0;       // worker slot the invocation occupied
    uor_status  result    = UOR_OK;
    bool        cache_hit = false;

    TimePoint   t_enqueue = {};
    TimePoint   t_start   = {};
    TimePoint   t_end     = {};

    /** Queue wait time (microseconds). */
    double queue_us() const    { return duration_us(t_enqueue, t_start); }
    /** Dispatch latency (microseconds). */
    double dispatch_us() const { return duration_us(t_start, t_end); }
    /** Total latency from enqueue to completion (microseconds). */
    double total_us() const    { return duration_us(t_enqueue, t_end); }
};

/* ================================================================== */
/*  GraphProfile — per-run aggregation                                 */
/* ================================================================== */

struct GraphProfile {
    TimePoint                t_submit = {};
    TimePoint                t_finish = {};
    uint32_t                 manifold_version = 0;
    std::vector<TaskProfile> tasks;

    void clear() {
        tasks.clear();
        t_submit = t_finish = TimePoint{};
        manifold_version = 0;
    }

    /** Wall time of the whole run (microseconds). */
    double total_us() const { return duration_us(t_submit, t_finish); }

    /** Time from submit to the first completed task (microseconds). */
    double first_task_latency_us() const {
        if (tasks.empty()) return 0.0;
        TimePoint earliest_end = tasks[0].t_end;
        for (auto& tp : tasks) {
            if (tp.t_end < earliest_end) earliest_end = tp.t_end;
        }
        return duration_us(t_submit, earliest_end);
    }

    uint32_t cache_hits() const {
        uint32_t n = 0;
        for (auto& tp : tasks) n += tp.cache_hit ? 1 : 0;
        return n;
    }

    /** Profile for a node; nullptr if it was never dispatched. */
    const TaskProfile* find_task(const std::string& node_id) const {
        for (auto& tp : tasks) {
            if (tp.node_id == node_id) return &tp;
        }
        return nullptr;
    }

    /**
     * Dump profile as JSON string.
     * Timestamps are relative to t_submit (microseconds).
     */
    std::string dump_json() const {
        std::string s;
        s.reserve(512);
        char buf[384];
        std::snprintf(buf, sizeof(buf),
            "{\n  \"version\": %u,\n  \"total_us\": %.1f,\n  \"tasks\": [\n",
            manifold_version, total_us());
        s += buf;
        for (size_t i = 0; i < tasks.size(); ++i) {
            auto& tp = tasks[i];
            std::snprintf(buf, sizeof(buf),
                "    {\"node\": \"%s\", \"op\": \"%s\", \"lane\": %u, "
                "\"status\": \"%s\", \"cache_hit\": %s, "
                "\"enqueue_us\": %.1f, \"start_us\": %.1f, "
                "\"end_us\": %.1f, \"dispatch_us\": %.1f}",
                tp.node_id.c_str(), tp.op_name.c_str(), tp.lane,
                uor_status_str(tp.result), tp.cache_hit ? "true" : "false",
                duration_us(t_submit, tp.t_enqueue),
                duration_us(t_submit, tp.t_start),
                duration_us(t_submit, tp.t_end), tp.dispatch_us());
            s += buf;
            if (i + 1 < tasks.size()) s += ",";
            s += "\n";
        }
        s += "  ]\n}";
        return s;
    }

    /** Chrome trace_event JSON: one complete ("X") event per task. */
    std::string dump_chrome_trace() const {
        std::string s = "{\"traceEvents\":[\n";
        char buf[384];
        for (size_t i = 0; i < tasks.size(); ++i) {
            auto& tp = tasks[i];
            double dur = tp.dispatch_us();
            if (dur < 0.0) dur = 0.0;
            std::snprintf(buf, sizeof(buf),
                "  {\"name\":\"%s\",\"cat\":\"%s\",\"ph\":\"X\","
                "\"ts\":%.3f,\"dur\":%.3f,\"pid\":1,\"tid\":%u,"
                "\"args\":{\"op\":\"%s\",\"status\":\"%s\",\"queue_us\":%.1f}}%s\n",
                tp.node_id.c_str(), tp.cache_hit ? "cache" : "op",
                duration_us(t_submit, tp.t_start), dur, tp.lane,
                tp.op_name.c_str(), uor_status_str(tp.result), tp.queue_us(),
                (i + 1 < tasks.size()) ? "," : "");
            s += buf;
        }
        s += "]}\n";
        return s;
    }

    bool export_chrome_trace(const char* path) const {
        FILE* f = std::fopen(path, "w");
        if (!f) return false;
        std::string s = dump_chrome_trace();
        size_t n = std::fwrite(s.data(), 1, s.size(), f);
        std::fclose(f);
        return n == s.size();
    }
};

} // namespace uor

#endif // UOR_PROFILE_TRACE_HPP
