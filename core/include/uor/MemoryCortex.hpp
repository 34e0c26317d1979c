/**
 * @file MemoryCortex.hpp
 * @brief Memory Cortex — 144 prime-indexed slots holding manifold embeddings
 *
 * INTERNAL TO CORE — never crosses the C API boundary.
 *
 * Slot i carries the i-th prime (2, 3, 5, ..., 827). link_manifold()
 * files every computed quaternion embedding of a manifold into the next
 * slot in round-robin order; once all 144 are taken the oldest link is
 * overwritten. A node already held with the same payload is not linked
 * twice, so linking successive versions of one manifold is idempotent
 * for the embeddings they share.
 *
 * Concurrency: std::shared_mutex (shared for reads, exclusive for links).
 * Memory: slots hold PayloadRef shared refs; payloads are immutable.
 */

#ifndef UOR_MEMORY_CORTEX_HPP
#define UOR_MEMORY_CORTEX_HPP

#include "uor/Manifold.hpp"

#include <array>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

namespace uor {

struct PrimeReference {
    uint32_t    prime_index = 0;
    uint32_t    prime       = 0;
    PayloadRef  data;                  /**< null until linked */
    std::string node_id;
    uint32_t    manifold_version = 0;
};

class MemoryCortex {
public:
    static constexpr size_t kSlots = 144;

    /** Operator whose outputs are treated as embeddings. */
    static constexpr const char* kEmbeddingOp = "embed_quaternion";

    MemoryCortex();

    MemoryCortex(const MemoryCortex&) = delete;
    MemoryCortex& operator=(const MemoryCortex&) = delete;

    /**
     * Link every COMPUTED embedding node of `manifold`. `linked` (optional)
     * receives the number of slots written by this call.
     */
    uor_status link_manifold(const Manifold& manifold, uint32_t* linked = nullptr);

    /** Copy of slot `i`; UOR_ERROR_NOT_FOUND past the last slot. */
    uor_status reference(size_t i, PrimeReference* out) const;

    /** Most recent link of `node_id`; nullptr when never linked. */
    PayloadRef recall(const std::string& node_id) const;

    size_t occupied() const;
    void   clear();

private:
    mutable std::shared_mutex              mu_;
    std::array<PrimeReference, kSlots>     slots_;
    size_t                                 next_ = 0;
};

} // namespace uor

#endif // UOR_MEMORY_CORTEX_HPP
