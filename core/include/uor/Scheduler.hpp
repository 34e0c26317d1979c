/**
 * @file Scheduler.hpp
 * @brief Manifold Scheduler — Kahn readiness + bounded worker-pool dispatch
 *
 * INTERNAL TO CORE — never crosses the C API boundary.
 *
 * Architecture:
 *   1. Seeding: every uncomputed node whose dependencies are all COMPUTED
 *      enters the ready queue; nodes downstream of an earlier failure are
 *      SKIPPED up front.
 *   2. Dispatch: the caller's thread is the single coordinator. It pops
 *      ready nodes while fewer than N invocations are in flight, checks
 *      the operator contract, consults the replay cache for pure ops and
 *      posts the invocation to a fixed-size ThreadPool.
 *   3. Completion: workers never touch the manifold; they push results
 *      into a completion queue. The coordinator marks the node COMPUTED
 *      (or FAILED, skipping every transitive dependent) and decrements
 *      successors' remaining-dependency counts.
 *   4. Waiting: the coordinator blocks on the completion queue until the
 *      next result, the earliest invocation deadline, or the cancellation
 *      poll interval.
 *   5. Termination: when nothing is ready or in flight. Uncomputed nodes
 *      left without cancellation mean a cycle slipped past the builder,
 *      reported as UOR_ERROR_INVARIANT.
 *
 * Timeouts: a timed-out node is FAILED (UOR_ERROR_TIMEOUT) immediately
 * and its stop flag is raised; the invocation keeps its worker slot until
 * it actually returns, and its late result is discarded. run() returns
 * only after every invocation it posted has returned.
 */

#ifndef UOR_SCHEDULER_HPP
#define UOR_SCHEDULER_HPP

#include "uor/Manifold.hpp"
#include "uor/Operator.hpp"
#include "uor/ProfileTrace.hpp"
#include "uor/ResultCache.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace uor {

/* ================================================================== */
/*  ThreadPool — fixed-size, lock-based work queue                     */
/* ================================================================== */

class ThreadPool {
public:
    explicit ThreadPool(size_t n_threads)
        : stop_(false) {
        workers_.reserve(n_threads);
        for (size_t i = 0; i < n_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) w.join();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void post(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            queue_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

    size_t size() const { return workers_.size(); }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lk(mu_);
                cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
                if (stop_ && queue_.empty()) return;
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            job();
        }
    }

    std::vector<std::thread>          workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex                        mu_;
    std::condition_variable           cv_;
    bool                              stop_;
};

/* ================================================================== */
/*  CancelToken — run-scoped cancellation signal                       */
/*  Copies share one flag; cancel() may be called from any thread.     */
/* ================================================================== */

class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel()          { flag_->store(true, std::memory_order_release); }
    bool cancelled() const { return flag_->load(std::memory_order_acquire); }
    void reset()           { flag_->store(false, std::memory_order_release); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/* ================================================================== */
/*  Configuration and results                                          */
/* ================================================================== */

struct SchedulerConfig {
    uint32_t n_threads        = 0;   /**< 0 = hardware concurrency       */
    uint32_t op_timeout_ms    = 0;   /**< 0 = no per-invocation timeout  */
    uint32_t poll_interval_ms = 5;   /**< cancellation poll granularity  */
};

struct RunOptions {
    ResultCache*       cache  = nullptr;   /**< optional replay cache */
    const CancelToken* cancel = nullptr;
};

struct NodeFailure {
    std::string node_id;
    uor_status  cause = UOR_OK;
    std::string message;
};

/** Aggregate outcome of a run: one cause per failed node + skipped ids. */
struct ExecutionError {
    uor_status               code = UOR_OK;
    std::vector<NodeFailure> failures;
    std::vector<std::string> skipped;

    void clear() {
        code = UOR_OK;
        failures.clear();
        skipped.clear();
    }

    const NodeFailure* find(const std::string& node_id) const {
        for (auto& f : failures)
            if (f.node_id == node_id) return &f;
        return nullptr;
    }

    std::string to_string() const;
};

/* ================================================================== */
/*  Scheduler                                                          */
/* ================================================================== */

class Scheduler {
public:
    explicit Scheduler(SchedulerConfig cfg = {});
    ~Scheduler() = default;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Execute every runnable node of `manifold` in place.
     *
     * Returns UOR_OK, UOR_ERROR_EXECUTION (some node failed or was
     * skipped), UOR_ERROR_CANCELLED, or UOR_ERROR_INVARIANT. `err`, when
     * non-null, receives failures and skipped ids in every case.
     * Runs on one Scheduler are serialised.
     */
    uor_status run(Manifold& manifold, const OperatorRegistry& registry,
                   const RunOptions& opts = {}, ExecutionError* err = nullptr);

    uint32_t               concurrency() const    { return n_; }
    const SchedulerConfig& config() const         { return cfg_; }

    /* Valid after run() returns; not synchronised with a concurrent run. */
    const GraphProfile&    last_profile() const   { return profile_; }
    uint32_t               peak_in_flight() const { return peak_in_flight_; }

private:
    SchedulerConfig cfg_;
    uint32_t        n_;
    ThreadPool      pool_;
    std::mutex      run_mu_;
    GraphProfile    profile_;
    uint32_t        peak_in_flight_ = 0;
};

} // namespace uor

#endif // UOR_SCHEDULER_HPP
