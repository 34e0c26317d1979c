/**
 * @file kernel.cpp
 * @brief LinearKernel + KernelOperator
 */

#include "uor/Kernel.hpp"
#include "uor/metrics.h"

#include <cmath>
#include <mutex>

namespace uor {

uor_status flatten_features(const std::vector<PayloadRef>& inputs,
                            std::vector<double>* features, std::string* message) {
    features->clear();
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (!inputs[i] || !append_numeric(*inputs[i], *features)) {
            if (message)
                *message = "input " + std::to_string(i) + " is not numeric";
            return UOR_ERROR_SHAPE_MISMATCH;
        }
    }
    return UOR_OK;
}

/* ================================================================== */
/*  LinearKernel                                                       */
/* ================================================================== */

LinearKernel::LinearKernel(std::string name, size_t n_features, double learning_rate)
    : Kernel(std::move(name)), n_features_(n_features), lr_(learning_rate) {
    state_.weights.assign(n_features_, 0.0);
}

static double affine(const KernelState& s, const std::vector<double>& x) {
    double y = s.bias;
    for (size_t i = 0; i < x.size(); ++i) y += s.weights[i] * x[i];
    return y;
}

uor_status LinearKernel::forward(const std::vector<PayloadRef>& inputs,
                                 Payload* out, std::string* message) const {
    std::vector<double> x;
    uor_status st = flatten_features(inputs, &x, message);
    if (st != UOR_OK) return st;
    if (x.size() != n_features_) {
        if (message)
            *message = "expected " + std::to_string(n_features_) +
                       " features, got " + std::to_string(x.size());
        return UOR_ERROR_SHAPE_MISMATCH;
    }

    std::shared_lock<std::shared_mutex> lk(mu_);
    *out = Payload::real(affine(state_, x));
    return UOR_OK;
}

/* One SGD step on 0.5 * (y - t)^2: w -= lr * (y - t) * x, b -= lr * (y - t). */
uor_status LinearKernel::update(const std::vector<PayloadRef>& inputs,
                                const Payload& target,
                                KernelState* new_state, std::string* message) {
    if (!target.is_numeric()) {
        if (message) *message = "training target must be numeric";
        return UOR_ERROR_SHAPE_MISMATCH;
    }
    std::vector<double> x;
    uor_status st = flatten_features(inputs, &x, message);
    if (st != UOR_OK) return st;
    if (x.size() != n_features_) {
        if (message)
            *message = "expected " + std::to_string(n_features_) +
                       " features, got " + std::to_string(x.size());
        return UOR_ERROR_SHAPE_MISMATCH;
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    double err = affine(state_, x) - target.as_real();
    if (!std::isfinite(err)) {
        if (message) *message = "non-finite prediction error";
        return UOR_ERROR_COMPUTE;
    }
    for (size_t i = 0; i < x.size(); ++i) state_.weights[i] -= lr_ * err * x[i];
    state_.bias -= lr_ * err;
    ++state_.version;
    if (new_state) *new_state = state_;
    uint64_t version = state_.version;
    lk.unlock();

    uor_log(UOR_LOG_DEBUG, "kernel", "%s: update -> v%llu (error %.6g)",
            name().c_str(), (unsigned long long)version, err);
    return UOR_OK;
}

KernelState LinearKernel::state() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return state_;
}

uor_status LinearKernel::set_state(const KernelState& s) {
    if (s.weights.size() != n_features_) return UOR_ERROR_SHAPE_MISMATCH;
    std::unique_lock<std::shared_mutex> lk(mu_);
    state_ = s;
    return UOR_OK;
}

/* ================================================================== */
/*  KernelOperator                                                     */
/* ================================================================== */

static OperatorContract kernel_contract() {
    OperatorContract c;
    c.min_arity   = 1;
    c.max_arity   = UOR_VARIADIC;
    c.output_kind = UOR_PAYLOAD_REAL;
    c.flags       = UOR_OP_STATEFUL | UOR_OP_TERMINAL;
    return c;
}

KernelOperator::KernelOperator(KernelPtr kernel)
    : Operator(kernel->name(), kernel_contract()), kernel_(std::move(kernel)) {}

uor_status KernelOperator::apply(OpCall& call) const {
    return kernel_->forward(call.inputs, &call.output, &call.message);
}

} // namespace uor
