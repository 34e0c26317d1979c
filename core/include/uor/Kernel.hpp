/**
 * @file Kernel.hpp
 * @brief Kernel — parametric terminal component, plus its operator adapter
 *
 * A Kernel maps a view of its inputs to one payload (forward) and may
 * optionally learn from a target (update). Kernel state outlives any one
 * manifold run and changes only through an explicit update() or
 * set_state(); running a manifold never trains a kernel.
 *
 * KernelOperator exposes a kernel to the Scheduler as a STATEFUL |
 * TERMINAL operator: never replayed from cache, never depended upon.
 */

#ifndef UOR_KERNEL_HPP
#define UOR_KERNEL_HPP

#include "uor/Operator.hpp"
#include "uor/Payload.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace uor {

struct KernelState {
    std::vector<double> weights;
    double              bias    = 0.0;
    uint64_t            version = 0;   /**< bumped by every update */
};

/* ================================================================== */
/*  Kernel — abstract                                                  */
/* ================================================================== */

class Kernel {
public:
    explicit Kernel(std::string name) : name_(std::move(name)) {}
    virtual ~Kernel() = default;

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    const std::string& name() const { return name_; }

    virtual uor_status forward(const std::vector<PayloadRef>& inputs,
                               Payload* out, std::string* message) const = 0;

    /** One training step. Optional: UOR_ERROR_UNSUPPORTED by default. */
    virtual uor_status update(const std::vector<PayloadRef>& /*inputs*/,
                              const Payload& /*target*/,
                              KernelState* /*new_state*/, std::string* message) {
        if (message) *message = "kernel '" + name_ + "' does not support training";
        return UOR_ERROR_UNSUPPORTED;
    }

    virtual KernelState state() const { return KernelState{}; }

private:
    std::string name_;
};

using KernelPtr = std::shared_ptr<Kernel>;

/**
 * Flatten inputs into one feature vector: scalars and vectors are
 * concatenated in input order. UOR_ERROR_SHAPE_MISMATCH otherwise.
 */
uor_status flatten_features(const std::vector<PayloadRef>& inputs,
                            std::vector<double>* features, std::string* message);

/* ================================================================== */
/*  LinearKernel — y = w·x + b, trained by SGD on squared error        */
/* ================================================================== */

class LinearKernel : public Kernel {
public:
    LinearKernel(std::string name, size_t n_features, double learning_rate = 0.01);

    uor_status forward(const std::vector<PayloadRef>& inputs,
                       Payload* out, std::string* message) const override;

    uor_status update(const std::vector<PayloadRef>& inputs, const Payload& target,
                      KernelState* new_state, std::string* message) override;

    KernelState state() const override;

    /** Restore a snapshot; weights must match the feature count. */
    uor_status set_state(const KernelState& s);

    size_t n_features() const    { return n_features_; }
    double learning_rate() const { return lr_; }

private:
    size_t                    n_features_;
    double                    lr_;
    mutable std::shared_mutex mu_;
    KernelState               state_;
};

/* ================================================================== */
/*  KernelOperator — kernel as a terminal, stateful operator           */
/* ================================================================== */

class KernelOperator : public Operator {
public:
    explicit KernelOperator(KernelPtr kernel);

    uor_status apply(OpCall& call) const override;

    const KernelPtr& kernel() const { return kernel_; }

private:
    KernelPtr kernel_;
};

} // namespace uor

#endif // UOR_KERNEL_HPP
