/**
 * @file memory_cortex.cpp
 * @brief Prime-indexed embedding slots
 */

#include "uor/MemoryCortex.hpp"
#include "uor/metrics.h"

#include <mutex>

namespace uor {

/* First kSlots primes by trial division against the primes found so far. */
static std::vector<uint32_t> first_primes(size_t n) {
    std::vector<uint32_t> primes;
    primes.reserve(n);
    for (uint32_t c = 2; primes.size() < n; ++c) {
        bool prime = true;
        for (uint32_t p : primes) {
            if (p * p > c) break;
            if (c % p == 0) { prime = false; break; }
        }
        if (prime) primes.push_back(c);
    }
    return primes;
}

MemoryCortex::MemoryCortex() {
    std::vector<uint32_t> primes = first_primes(kSlots);
    for (size_t i = 0; i < kSlots; ++i) {
        slots_[i].prime_index = static_cast<uint32_t>(i);
        slots_[i].prime       = primes[i];
    }
}

uor_status MemoryCortex::link_manifold(const Manifold& manifold, uint32_t* linked) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    uint32_t n = 0;
    for (auto& node : manifold.nodes()) {
        if (node.type != kEmbeddingOp || node.status != UOR_NODE_COMPUTED) continue;

        bool held = false;
        for (auto& s : slots_)
            if (s.data == node.payload && s.node_id == node.id) { held = true; break; }
        if (held) continue;

        PrimeReference& s = slots_[next_];
        s.data             = node.payload;
        s.node_id          = node.id;
        s.manifold_version = manifold.version();
        next_ = (next_ + 1) % kSlots;
        ++n;
    }
    if (n)
        uor_log(UOR_LOG_DEBUG, "cortex", "v%u: linked %u embeddings",
                manifold.version(), n);
    if (linked) *linked = n;
    return UOR_OK;
}

uor_status MemoryCortex::reference(size_t i, PrimeReference* out) const {
    if (!out) return UOR_ERROR_INVALID_ARG;
    if (i >= kSlots) return UOR_ERROR_NOT_FOUND;
    std::shared_lock<std::shared_mutex> lk(mu_);
    *out = slots_[i];
    return UOR_OK;
}

PayloadRef MemoryCortex::recall(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    /* Walk backwards from the newest link. */
    for (size_t k = 1; k <= kSlots; ++k) {
        const PrimeReference& s = slots_[(next_ + kSlots - k) % kSlots];
        if (s.data && s.node_id == node_id) return s.data;
    }
    return nullptr;
}

size_t MemoryCortex::occupied() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    size_t c = 0;
    for (auto& s : slots_)
        if (s.data) ++c;
    return c;
}

void MemoryCortex::clear() {
    std::unique_lock<std::shared_mutex> lk(mu_);
    for (auto& s : slots_) {
        s.data.reset();
        s.node_id.clear();
        s.manifold_version = 0;
    }
    next_ = 0;
}

} // namespace uor
