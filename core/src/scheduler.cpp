/**
 * @file scheduler.cpp
 * @brief Coordinator loop: readiness, dispatch, completion, timeouts
 */

#include "uor/Scheduler.hpp"
#include "uor/metrics.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>

namespace uor {

std::string ExecutionError::to_string() const {
    std::string s = uor_status_str(code);
    s += ": " + std::to_string(failures.size()) + " failed, " +
         std::to_string(skipped.size()) + " skipped";
    for (auto& f : failures) {
        s += "; " + f.node_id + ": " + uor_status_str(f.cause);
        if (!f.message.empty()) s += " (" + f.message + ")";
    }
    return s;
}

/*
 * Deadline `ms` after `from`. Timeouts beyond kMaxTimeoutMs (about 31
 * years) fit no steady_clock range safely and mean "no deadline".
 */
static constexpr double kMaxTimeoutMs = 1e12;

static bool deadline_after(TimePoint from, double ms, TimePoint* out) {
    if (!(ms > 0.0) || ms > kMaxTimeoutMs) return false;
    *out = from + std::chrono::duration_cast<SteadyClock::duration>(
                      std::chrono::duration<double, std::milli>(ms));
    return true;
}

static uint32_t resolve_threads(uint32_t n) {
    if (n == 0) n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

Scheduler::Scheduler(SchedulerConfig cfg)
    : cfg_(cfg), n_(resolve_threads(cfg.n_threads)), pool_(n_) {}

namespace {

/* ================================================================== */
/*  Worker → coordinator handoff                                       */
/* ================================================================== */

struct Completion {
    uint32_t    node   = 0;
    uor_status  status = UOR_OK;
    Payload     output;
    std::string message;
    TimePoint   t_start = {};
    TimePoint   t_end   = {};
};

struct CompletionQueue {
    std::mutex              mu;
    std::condition_variable cv;
    std::deque<Completion>  done;

    void push(Completion c) {
        {
            std::lock_guard<std::mutex> lk(mu);
            done.push_back(std::move(c));
        }
        cv.notify_one();
    }
};

/* One slot per dispatched invocation, indexed by node. */
struct InFlight {
    bool                               active    = false;
    bool                               abandoned = false;  // timed out
    bool                               has_deadline = false;
    uint32_t                           lane      = 0;
    double                             timeout_ms = 0.0;
    TimePoint                          t_dispatch = {};
    TimePoint                          deadline   = {};
    std::shared_ptr<std::atomic<bool>> stop;
    std::string                        op_name;
    std::string                        cache_key;
    std::vector<PayloadRef>            cache_inputs;
};

/* ================================================================== */
/*  RunContext — node state transitions for one run                    */
/* ================================================================== */

class RunContext {
public:
    RunContext(std::vector<ManifoldNode>& nodes, ExecutionError& err)
        : nodes_(nodes), err_(err),
          remaining_(nodes.size(), 0), enqueued_(nodes.size()) {}

    /*
     * Leftover READY marks (from a cancelled run) are re-derived; nodes
     * below an earlier failure are skipped before anything is dispatched.
     * Failures and skips left by an earlier run are reported again, so a
     * resumed run never reports success over them.
     */
    void seed() {
        std::vector<uint32_t> blocked;
        for (uint32_t i = 0; i < nodes_.size(); ++i) {
            auto& n = nodes_[i];
            if (n.status == UOR_NODE_FAILED)
                err_.failures.push_back(NodeFailure{n.id, n.cause, n.message});
            else if (n.status == UOR_NODE_SKIPPED)
                err_.skipped.push_back(n.id);
            if (n.status == UOR_NODE_READY) n.status = UOR_NODE_PENDING;
            if (n.status != UOR_NODE_PENDING) continue;
            uint32_t count = 0;
            bool dead = false;
            for (uint32_t d : n.dep_index) {
                auto st = nodes_[d].status;
                if (st == UOR_NODE_FAILED || st == UOR_NODE_SKIPPED) dead = true;
                else if (st != UOR_NODE_COMPUTED) ++count;
            }
            remaining_[i] = count;
            if (dead) blocked.push_back(i);
        }
        for (uint32_t i : blocked) {
            if (nodes_[i].status != UOR_NODE_PENDING) continue;
            skip(i);
            skip_downstream(i);
        }
        for (uint32_t i = 0; i < nodes_.size(); ++i) {
            if (nodes_[i].status == UOR_NODE_PENDING && remaining_[i] == 0)
                mark_ready(i);
        }
    }

    bool     has_ready() const { return !ready_.empty(); }
    uint32_t pop_ready() {
        uint32_t i = ready_.front();
        ready_.pop_front();
        return i;
    }
    TimePoint enqueued_at(uint32_t i) const { return enqueued_[i]; }

    void complete(uint32_t i, PayloadRef out) {
        auto& n = nodes_[i];
        n.status  = UOR_NODE_COMPUTED;
        n.payload = std::move(out);
        ++computed;
        for (uint32_t s : n.successors) {
            if (nodes_[s].status == UOR_NODE_PENDING && --remaining_[s] == 0)
                mark_ready(s);
        }
    }

    void fail(uint32_t i, uor_status cause, const std::string& message) {
        auto& n = nodes_[i];
        n.status  = UOR_NODE_FAILED;
        n.cause   = cause;
        n.message = message.empty() ? uor_status_str(cause) : message;
        n.payload.reset();
        err_.failures.push_back(NodeFailure{n.id, cause, n.message});
        ++failed;
        uor_log(UOR_LOG_DEBUG, "scheduler", "node '%s' failed: %s (%s)",
                n.id.c_str(), uor_status_str(cause), n.message.c_str());
        skip_downstream(i);
    }

    /** Interrupted by cancellation: stays runnable for a later run. */
    void requeue(uint32_t i) { nodes_[i].status = UOR_NODE_READY; }

    size_t unresolved() const {
        size_t c = 0;
        for (auto& n : nodes_)
            if (n.status == UOR_NODE_PENDING || n.status == UOR_NODE_READY) ++c;
        return c;
    }

    uint32_t computed   = 0;
    uint32_t failed     = 0;
    uint32_t skipped    = 0;
    uint32_t cache_hits = 0;
    uint32_t timeouts   = 0;

private:
    void mark_ready(uint32_t i) {
        nodes_[i].status = UOR_NODE_READY;
        enqueued_[i] = SteadyClock::now();
        ready_.push_back(i);
    }

    void skip(uint32_t i) {
        nodes_[i].status = UOR_NODE_SKIPPED;
        err_.skipped.push_back(nodes_[i].id);
        ++skipped;
    }

    void skip_downstream(uint32_t root) {
        std::vector<uint32_t> stack(nodes_[root].successors.begin(),
                                    nodes_[root].successors.end());
        while (!stack.empty()) {
            uint32_t s = stack.back();
            stack.pop_back();
            if (nodes_[s].status != UOR_NODE_PENDING) continue;
            skip(s);
            for (uint32_t t : nodes_[s].successors) stack.push_back(t);
        }
    }

    std::vector<ManifoldNode>& nodes_;
    ExecutionError&            err_;
    std::vector<uint32_t>      remaining_;
    std::vector<TimePoint>     enqueued_;
    std::deque<uint32_t>       ready_;
};

} // namespace

/* ================================================================== */
/*  Scheduler::run                                                     */
/* ================================================================== */

uor_status Scheduler::run(Manifold& manifold, const OperatorRegistry& registry,
                          const RunOptions& opts, ExecutionError* err_out) {
    std::lock_guard<std::mutex> run_lk(run_mu_);

    ExecutionError local_err;
    ExecutionError& err = err_out ? *err_out : local_err;
    err.clear();

    std::vector<ManifoldNode>& nodes = manifold.nodes_;
    const TimePoint t_begin = SteadyClock::now();

    profile_.clear();
    profile_.t_submit = t_begin;
    profile_.manifold_version = manifold.version();
    peak_in_flight_ = 0;

    RunContext ctx(nodes, err);
    ctx.seed();

    auto queue = std::make_shared<CompletionQueue>();
    std::vector<InFlight> flight(nodes.size());
    std::vector<uint32_t> active;            // node indices with an invocation out
    std::vector<bool>     lane_busy(n_, false);
    uint32_t in_flight  = 0;
    bool     cancelling = false;

    for (;;) {
        /* -- Cancellation --------------------------------------------- */
        if (!cancelling && opts.cancel && opts.cancel->cancelled()) {
            cancelling = true;
            for (uint32_t i : active) flight[i].stop->store(true);
            uor_log(UOR_LOG_INFO, "scheduler",
                    "v%u: cancellation requested, awaiting %u in-flight",
                    manifold.version(), in_flight);
        }

        /* -- Dispatch ready nodes up to the concurrency bound ----------- */
        while (!cancelling && ctx.has_ready() && in_flight < n_) {
            uint32_t i = ctx.pop_ready();
            ManifoldNode& node = nodes[i];

            OperatorPtr op = registry.find(node.type);
            if (!op) {
                ctx.fail(i, UOR_ERROR_UNKNOWN_OP,
                         "no operator registered as '" + node.type + "'");
                continue;
            }

            std::vector<PayloadRef> inputs;
            inputs.reserve(node.dep_index.size());
            for (uint32_t d : node.dep_index) inputs.push_back(nodes[d].payload);

            std::string msg;
            if (check_inputs(op->contract(), inputs, &msg) != UOR_OK) {
                ctx.fail(i, UOR_ERROR_SHAPE_MISMATCH, msg);
                continue;
            }

            std::string key;
            if (opts.cache && op->cacheable()) {
                key = ResultCache::make_key(op->name(), node.params, inputs);
                if (PayloadRef hit = opts.cache->get(key, node.params, inputs)) {
                    TaskProfile tp;
                    tp.node_id   = node.id;
                    tp.op_name   = op->name();
                    tp.cache_hit = true;
                    tp.t_enqueue = ctx.enqueued_at(i);
                    tp.t_start   = tp.t_end = SteadyClock::now();
                    profile_.tasks.push_back(std::move(tp));
                    ++ctx.cache_hits;
                    ctx.complete(i, std::move(hit));
                    continue;
                }
            }

            const double timeout_ms =
                param_real(node.params, "timeout_ms", cfg_.op_timeout_ms);
            if (!std::isfinite(timeout_ms) || timeout_ms < 0.0) {
                ctx.fail(i, UOR_ERROR_INVALID_ARG,
                         "timeout_ms must be finite and non-negative");
                continue;
            }

            InFlight& f = flight[i];
            f = InFlight{};
            f.active = true;
            while (lane_busy[f.lane]) ++f.lane;
            lane_busy[f.lane] = true;
            f.stop       = std::make_shared<std::atomic<bool>>(false);
            f.op_name    = op->name();
            f.cache_key  = std::move(key);
            if (!f.cache_key.empty()) f.cache_inputs = inputs;
            f.t_dispatch = SteadyClock::now();
            f.timeout_ms = timeout_ms;
            f.has_deadline = deadline_after(f.t_dispatch, f.timeout_ms, &f.deadline);

            OpCall call;
            call.node_id = node.id;
            call.params  = node.params;
            call.inputs  = std::move(inputs);
            call.stop    = f.stop;

            pool_.post([queue, op, i, call = std::move(call)]() mutable {
                Completion c;
                c.node    = i;
                c.t_start = SteadyClock::now();
                try {
                    c.status = op->apply(call);
                } catch (const std::exception& e) {
                    c.status = UOR_ERROR_COMPUTE;
                    call.message = std::string("operator threw: ") + e.what();
                } catch (...) {
                    c.status = UOR_ERROR_COMPUTE;
                    call.message = "operator threw a non-standard exception";
                }
                c.t_end   = SteadyClock::now();
                c.output  = std::move(call.output);
                c.message = std::move(call.message);
                queue->push(std::move(c));
            });

            active.push_back(i);
            ++in_flight;
            peak_in_flight_ = std::max(peak_in_flight_, in_flight);
        }

        if (in_flight == 0 && (cancelling || !ctx.has_ready())) break;

        /* -- Await next completion, deadline or poll tick -------------- */
        std::deque<Completion> batch;
        {
            TimePoint wake = TimePoint::max();
            for (uint32_t i : active) {
                const InFlight& f = flight[i];
                if (!f.abandoned && f.has_deadline && f.deadline < wake)
                    wake = f.deadline;
            }
            if (opts.cancel && !cancelling) {
                TimePoint tick = SteadyClock::now() +
                                 std::chrono::milliseconds(cfg_.poll_interval_ms);
                if (tick < wake) wake = tick;
            }

            std::unique_lock<std::mutex> lk(queue->mu);
            auto has_result = [&] { return !queue->done.empty(); };
            if (wake == TimePoint::max()) queue->cv.wait(lk, has_result);
            else                          queue->cv.wait_until(lk, wake, has_result);
            batch.swap(queue->done);
        }

        /* -- Completions ------------------------------------------------ */
        for (auto& c : batch) {
            InFlight& f = flight[c.node];
            f.active = false;
            lane_busy[f.lane] = false;
            active.erase(std::find(active.begin(), active.end(), c.node));
            --in_flight;

            if (f.abandoned) {
                uor_log(UOR_LOG_DEBUG, "scheduler",
                        "late result of '%s' discarded", nodes[c.node].id.c_str());
                continue;
            }

            TaskProfile tp;
            tp.node_id   = nodes[c.node].id;
            tp.op_name   = f.op_name;
            tp.lane      = f.lane;
            tp.result    = c.status;
            tp.t_enqueue = ctx.enqueued_at(c.node);
            tp.t_start   = c.t_start;
            tp.t_end     = c.t_end;
            profile_.tasks.push_back(std::move(tp));

            if (c.status == UOR_OK) {
                PayloadRef out = make_payload(std::move(c.output));
                if (!f.cache_key.empty())
                    opts.cache->put(f.cache_key, nodes[c.node].params,
                                    std::move(f.cache_inputs), out);
                ctx.complete(c.node, std::move(out));
            } else if (cancelling && c.status == UOR_ERROR_CANCELLED) {
                ctx.requeue(c.node);
            } else {
                ctx.fail(c.node, c.status, c.message);
            }
        }

        /* -- Timeouts --------------------------------------------------- */
        const TimePoint now = SteadyClock::now();
        for (uint32_t i : active) {
            InFlight& f = flight[i];
            if (f.abandoned || !f.has_deadline || now < f.deadline) continue;
            f.abandoned = true;
            f.stop->store(true);
            ++ctx.timeouts;
            uor_metrics_record_timeout();

            TaskProfile tp;
            tp.node_id   = nodes[i].id;
            tp.op_name   = f.op_name;
            tp.lane      = f.lane;
            tp.result    = UOR_ERROR_TIMEOUT;
            tp.t_enqueue = ctx.enqueued_at(i);
            tp.t_start   = f.t_dispatch;
            tp.t_end     = now;
            profile_.tasks.push_back(std::move(tp));

            char buf[64];
            std::snprintf(buf, sizeof(buf), "exceeded %.0f ms", f.timeout_ms);
            uor_log(UOR_LOG_WARN, "scheduler", "node '%s' timed out: %s",
                    nodes[i].id.c_str(), buf);
            ctx.fail(i, UOR_ERROR_TIMEOUT, buf);
        }
    }

    /* -- Outcome ----------------------------------------------------------- */
    profile_.t_finish = SteadyClock::now();
    const double us = duration_us(t_begin, profile_.t_finish);

    size_t unresolved = ctx.unresolved();
    uor_status result = UOR_OK;
    if (cancelling) {
        result = UOR_ERROR_CANCELLED;
    } else if (unresolved > 0) {
        result = UOR_ERROR_INVARIANT;
        uor_log(UOR_LOG_FATAL, "scheduler",
                "v%u: %zu nodes can never become ready (cycle at run time)",
                manifold.version(), unresolved);
    } else if (!err.failures.empty() || !err.skipped.empty()) {
        result = UOR_ERROR_EXECUTION;
    }
    err.code = result;

    uor_metrics_record_run(result, static_cast<uint64_t>(us), ctx.computed,
                           ctx.failed, ctx.skipped, ctx.cache_hits);
    uor_log(result == UOR_OK ? UOR_LOG_INFO : UOR_LOG_WARN, "scheduler",
            "v%u %s: %u computed (%u cached), %u failed, %u skipped, "
            "%u timeouts, peak %u/%u in flight, %.1f ms",
            manifold.version(), uor_status_str(result), ctx.computed,
            ctx.cache_hits, ctx.failed, ctx.skipped, ctx.timeouts,
            peak_in_flight_, n_, us / 1000.0);
    return result;
}

} // namespace uor
