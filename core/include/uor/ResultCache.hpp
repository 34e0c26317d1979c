/**
 * @file ResultCache.hpp
 * @brief Replay cache for pure operator invocations
 *
 * INTERNAL TO CORE — never crosses the C API boundary.
 *
 * Keyed by (operator name, parameter fingerprint, input fingerprints).
 * Entries stored with their parameters and inputs are compared against
 * them on lookup, so a fingerprint collision reads as a miss rather than
 * a wrong replay.
 * A hit lets the Scheduler complete a node without invoking its operator.
 * Only operators whose contract is PURE and not STATEFUL are ever looked
 * up or stored.
 *
 * Concurrency: std::shared_mutex (shared for contains/stats, exclusive for
 * lookups that refresh recency and for inserts).
 * Eviction: LRU, bounded by entry count.
 */

#ifndef UOR_RESULT_CACHE_HPP
#define UOR_RESULT_CACHE_HPP

#include "uor/Payload.hpp"

#include <atomic>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <list>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace uor {

class ResultCache {
public:
    struct Stats {
        uint64_t hits       = 0;
        uint64_t misses     = 0;
        uint64_t evictions  = 0;
        uint64_t collisions = 0;   /**< key matched, invocation did not */
        uint32_t entries    = 0;
        uint32_t capacity   = 0;
    };

    explicit ResultCache(uint32_t capacity = 1024)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /** Canonical key for one invocation. */
    static std::string make_key(const std::string& op_name, const ParamBag& params,
                                const std::vector<PayloadRef>& inputs) {
        char buf[24];
        std::snprintf(buf, sizeof(buf), "%zu:", op_name.size());
        std::string key = buf + op_name;
        std::snprintf(buf, sizeof(buf), "|%016" PRIx64, fingerprint(params));
        key += buf;
        for (auto& in : inputs) {
            std::snprintf(buf, sizeof(buf), ":%016" PRIx64,
                          in ? in->fingerprint() : uint64_t(0));
            key += buf;
        }
        return key;
    }

    /* -- Lookup: refreshes LRU position on hit ----------------------- */

    PayloadRef get(const std::string& key) {
        std::unique_lock<std::shared_mutex> lk(mu_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        lru_.splice(lru_.begin(), lru_, it->second);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->value;
    }

    /** Lookup that also requires the stored invocation to match exactly. */
    PayloadRef get(const std::string& key, const ParamBag& params,
                   const std::vector<PayloadRef>& inputs) {
        std::unique_lock<std::shared_mutex> lk(mu_);
        auto it = map_.find(key);
        if (it != map_.end() && !it->second->same_call(params, inputs)) {
            collisions_.fetch_add(1, std::memory_order_relaxed);
            it = map_.end();
        }
        if (it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        lru_.splice(lru_.begin(), lru_, it->second);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->value;
    }

    /* -- Insert / update; evicts least-recently-used beyond capacity - */

    void put(const std::string& key, PayloadRef value) {
        insert(Entry{key, std::move(value), false, {}, {}});
    }

    void put(const std::string& key, ParamBag params, std::vector<PayloadRef> inputs,
             PayloadRef value) {
        insert(Entry{key, std::move(value), true, std::move(params), std::move(inputs)});
    }

    bool contains(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lk(mu_);
        return map_.find(key) != map_.end();
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lk(mu_);
        map_.clear();
        lru_.clear();
    }

    Stats stats() const {
        std::shared_lock<std::shared_mutex> lk(mu_);
        Stats s;
        s.hits       = hits_.load(std::memory_order_relaxed);
        s.misses     = misses_.load(std::memory_order_relaxed);
        s.evictions  = evictions_.load(std::memory_order_relaxed);
        s.collisions = collisions_.load(std::memory_order_relaxed);
        s.entries    = static_cast<uint32_t>(map_.size());
        s.capacity   = capacity_;
        return s;
    }

private:
    struct Entry {
        std::string             key;
        PayloadRef              value;
        bool                    checked = false;   /**< params/inputs held */
        ParamBag                params;
        std::vector<PayloadRef> inputs;

        bool same_call(const ParamBag& p, const std::vector<PayloadRef>& in) const {
            if (!checked) return true;
            if (p != params || in.size() != inputs.size()) return false;
            for (size_t i = 0; i < in.size(); ++i) {
                if (!in[i] || !inputs[i]) {
                    if (in[i] != inputs[i]) return false;
                } else if (*in[i] != *inputs[i]) {
                    return false;
                }
            }
            return true;
        }
    };

    void insert(Entry e) {
        std::unique_lock<std::shared_mutex> lk(mu_);
        auto it = map_.find(e.key);
        if (it != map_.end()) {
            *it->second = std::move(e);
            lru_.splice(lru_.begin(), lru_, it->second);
            return;
        }
        std::string key = e.key;
        lru_.push_front(std::move(e));
        map_[key] = lru_.begin();
        while (map_.size() > capacity_) {
            map_.erase(lru_.back().key);
            lru_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    uint32_t                                                  capacity_;
    std::list<Entry>                                          lru_;
    std::unordered_map<std::string, std::list<Entry>::iterator> map_;
    mutable std::shared_mutex                                 mu_;
    std::atomic<uint64_t>                                     hits_{0};
    std::atomic<uint64_t>                                     misses_{0};
    std::atomic<uint64_t>                                     evictions_{0};
    std::atomic<uint64_t>                                     collisions_{0};
};

} // namespace uor

#endif // UOR_RESULT_CACHE_HPP
