/**
 * @file builtin_ops.hpp
 * @brief Built-in operator set and the explicit retry wrapper
 *
 *   const      0        emits param "value"
 *   input      0        placeholder bound with Manifold::seed
 *   identity   1        passes its input through
 *   add, mul   1..N     numeric sum / product (INT if all INT)
 *   sub, div   2        numeric difference / quotient
 *   neg        1        numeric negation
 *   scale      1        numeric or vector times param "factor"
 *   concat     1..N     numerics and vectors flattened into one vector
 *   sum        1        sum of a vector's elements
 *   dot        2        inner product of two equal-length vectors
 *   relu       1        element-wise max(0, x)
 *   embed_quaternion 1  folds values into a unit quaternion (w, x, y, z)
 *   fail       0..N     always fails with param "message"
 *   sleep      0..N     waits param "ms", honouring the stop flag
 */

#ifndef UOR_BUILTIN_OPS_HPP
#define UOR_BUILTIN_OPS_HPP

#include "uor/Operator.hpp"

namespace uor {

/** Register every built-in. Fails with CONFLICT if any name is taken. */
uor_status register_builtin_operators(OperatorRegistry& registry,
                                      RegistryError* err = nullptr);

/* ================================================================== */
/*  RetryOperator — bounded attempts with fixed backoff                */
/*                                                                     */
/*  Retries UOR_ERROR_COMPUTE only; every other outcome is returned    */
/*  as-is. Stops early once the stop flag is raised. Registered under  */
/*  its own name so retrying is always an explicit choice. A null      */
/*  inner operator fails every call with UOR_ERROR_INTERNAL.           */
/* ================================================================== */

class RetryOperator : public Operator {
public:
    RetryOperator(std::string name, OperatorPtr inner,
                  uint32_t max_attempts, uint32_t backoff_ms);

    uor_status apply(OpCall& call) const override;

    uint32_t max_attempts() const { return max_attempts_; }

private:
    OperatorPtr inner_;
    uint32_t    max_attempts_;
    uint32_t    backoff_ms_;
};

} // namespace uor

#endif // UOR_BUILTIN_OPS_HPP
