/**
 * @file builtin_ops.cpp
 * @brief Built-in operators + RetryOperator
 */

#include "uor/builtin_ops.hpp"
#include "uor/metrics.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <thread>

namespace uor {

namespace {

bool all_int(const OpCall& c) {
    for (auto& in : c.inputs)
        if (in->kind() != UOR_PAYLOAD_INT) return false;
    return true;
}

/* ================================================================== */
/*  Sources                                                            */
/* ================================================================== */

uor_status op_const(OpCall& c) {
    const Payload* v = find_param(c.params, "value");
    if (!v) return c.fail(UOR_ERROR_COMPUTE, "missing parameter 'value'");
    c.output = *v;
    return UOR_OK;
}

uor_status op_input(OpCall& c) {
    return c.fail(UOR_ERROR_COMPUTE, "input '" + c.node_id + "' was never seeded");
}

uor_status op_identity(OpCall& c) {
    c.output = c.input(0);
    return UOR_OK;
}

/* ================================================================== */
/*  Arithmetic                                                         */
/* ================================================================== */

/*
 * INT arithmetic stays exact: a result outside int64_t fails the node
 * instead of wrapping. Mixed inputs go through REAL.
 */
uor_status int_overflow(OpCall& c, const char* op) {
    return c.fail(UOR_ERROR_COMPUTE, std::string("integer overflow in ") + op);
}

uor_status op_add(OpCall& c) {
    if (all_int(c)) {
        int64_t acc = 0;
        for (auto& in : c.inputs)
            if (__builtin_add_overflow(acc, in->as_int(), &acc)) return int_overflow(c, "add");
        c.output = Payload::integer(acc);
    } else {
        double acc = 0.0;
        for (auto& in : c.inputs) acc += in->as_real();
        c.output = Payload::real(acc);
    }
    return UOR_OK;
}

uor_status op_mul(OpCall& c) {
    if (all_int(c)) {
        int64_t acc = 1;
        for (auto& in : c.inputs)
            if (__builtin_mul_overflow(acc, in->as_int(), &acc)) return int_overflow(c, "mul");
        c.output = Payload::integer(acc);
    } else {
        double acc = 1.0;
        for (auto& in : c.inputs) acc *= in->as_real();
        c.output = Payload::real(acc);
    }
    return UOR_OK;
}

uor_status op_sub(OpCall& c) {
    if (all_int(c)) {
        int64_t r = 0;
        if (__builtin_sub_overflow(c.input(0).as_int(), c.input(1).as_int(), &r))
            return int_overflow(c, "sub");
        c.output = Payload::integer(r);
    } else {
        c.output = Payload::real(c.input(0).as_real() - c.input(1).as_real());
    }
    return UOR_OK;
}

uor_status op_div(OpCall& c) {
    double d = c.input(1).as_real();
    if (d == 0.0) return c.fail(UOR_ERROR_COMPUTE, "division by zero");
    c.output = Payload::real(c.input(0).as_real() / d);
    return UOR_OK;
}

uor_status op_neg(OpCall& c) {
    const Payload& x = c.input(0);
    if (x.kind() != UOR_PAYLOAD_INT) {
        c.output = Payload::real(-x.as_real());
        return UOR_OK;
    }
    if (x.as_int() == INT64_MIN) return int_overflow(c, "neg");
    c.output = Payload::integer(-x.as_int());
    return UOR_OK;
}

uor_status op_scale(OpCall& c) {
    double f = param_real(c.params, "factor", 1.0);
    const Payload& x = c.input(0);
    if (x.is_numeric()) {
        c.output = Payload::real(x.as_real() * f);
    } else if (x.kind() == UOR_PAYLOAD_VECTOR) {
        std::vector<double> v = x.as_vector();
        for (double& e : v) e *= f;
        c.output = Payload::vector(std::move(v));
    } else {
        return c.fail(UOR_ERROR_SHAPE_MISMATCH,
                      std::string("scale expects numeric or vector, got ") +
                      uor_payload_kind_str(x.kind()));
    }
    return UOR_OK;
}

/* ================================================================== */
/*  Vectors                                                            */
/* ================================================================== */

uor_status op_concat(OpCall& c) {
    std::vector<double> out;
    for (size_t i = 0; i < c.inputs.size(); ++i) {
        if (!append_numeric(c.input(i), out))
            return c.fail(UOR_ERROR_SHAPE_MISMATCH,
                          "input " + std::to_string(i) + " is not numeric");
    }
    c.output = Payload::vector(std::move(out));
    return UOR_OK;
}

uor_status op_sum(OpCall& c) {
    double acc = 0.0;
    for (double e : c.input(0).as_vector()) acc += e;
    c.output = Payload::real(acc);
    return UOR_OK;
}

uor_status op_dot(OpCall& c) {
    auto& a = c.input(0).as_vector();
    auto& b = c.input(1).as_vector();
    if (a.size() != b.size())
        return c.fail(UOR_ERROR_SHAPE_MISMATCH,
                      "length mismatch: " + std::to_string(a.size()) + " vs " +
                      std::to_string(b.size()));
    double acc = 0.0;
    for (size_t i = 0; i < a.size(); ++i) acc += a[i] * b[i];
    c.output = Payload::real(acc);
    return UOR_OK;
}

uor_status op_relu(OpCall& c) {
    const Payload& x = c.input(0);
    switch (x.kind()) {
        case UOR_PAYLOAD_INT:
            c.output = Payload::integer(x.as_int() > 0 ? x.as_int() : 0);
            return UOR_OK;
        case UOR_PAYLOAD_REAL:
            c.output = Payload::real(x.as_real() > 0.0 ? x.as_real() : 0.0);
            return UOR_OK;
        case UOR_PAYLOAD_VECTOR: {
            std::vector<double> v = x.as_vector();
            for (double& e : v) if (e < 0.0) e = 0.0;
            c.output = Payload::vector(std::move(v));
            return UOR_OK;
        }
        default:
            return c.fail(UOR_ERROR_SHAPE_MISMATCH,
                          std::string("relu expects numeric or vector, got ") +
                          uor_payload_kind_str(x.kind()));
    }
}

/*
 * Element i accumulates into component i % 4 of (w, x, y, z); the sum is
 * normalised to unit length. An all-zero input maps to the identity.
 */
uor_status op_embed_quaternion(OpCall& c) {
    std::vector<double> values;
    if (!append_numeric(c.input(0), values))
        return c.fail(UOR_ERROR_SHAPE_MISMATCH,
                      std::string("embed_quaternion expects numeric or vector, got ") +
                      uor_payload_kind_str(c.input(0).kind()));

    double q[4] = {0.0, 0.0, 0.0, 0.0};
    for (size_t i = 0; i < values.size(); ++i) q[i % 4] += values[i];
    double norm = std::sqrt(q[0] * q[0] + q[1] * q[1] + q[2] * q[2] + q[3] * q[3]);
    if (norm == 0.0 || !std::isfinite(norm)) {
        c.output = Payload::vector({1.0, 0.0, 0.0, 0.0});
        return UOR_OK;
    }
    c.output = Payload::vector({q[0] / norm, q[1] / norm, q[2] / norm, q[3] / norm});
    return UOR_OK;
}

/* ================================================================== */
/*  Control                                                            */
/* ================================================================== */

uor_status op_fail(OpCall& c) {
    const Payload* m = find_param(c.params, "message");
    return c.fail(UOR_ERROR_COMPUTE,
                  m && m->kind() == UOR_PAYLOAD_TEXT ? m->as_text() : "forced failure");
}

/* Elapsed time is compared in double milliseconds; no deadline is formed. */
uor_status op_sleep(OpCall& c) {
    using Clock = std::chrono::steady_clock;
    const double ms = param_real(c.params, "ms", 0.0);
    if (!std::isfinite(ms))
        return c.fail(UOR_ERROR_INVALID_ARG, "parameter 'ms' must be finite");
    const auto t0 = Clock::now();
    while (std::chrono::duration<double, std::milli>(Clock::now() - t0).count() < ms) {
        if (c.should_stop()) return c.fail(UOR_ERROR_CANCELLED, "interrupted");
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    c.output = c.inputs.empty() ? Payload::integer(0) : c.input(0);
    return UOR_OK;
}

/* -- Registration table ------------------------------------------- */

struct BuiltinDesc {
    const char*        name;
    OperatorContract   contract;
    uor_status       (*fn)(OpCall&);
};

OperatorContract contract(uint32_t lo, uint32_t hi,
                          std::vector<uor_payload_kind> in,
                          uor_payload_kind out,
                          std::vector<std::string> required = {},
                          uint32_t flags = UOR_OP_PURE) {
    OperatorContract c;
    c.min_arity       = lo;
    c.max_arity       = hi;
    c.input_kinds     = std::move(in);
    c.output_kind     = out;
    c.required_params = std::move(required);
    c.flags           = flags;
    return c;
}

} // namespace

uor_status register_builtin_operators(OperatorRegistry& registry, RegistryError* err) {
    const uor_payload_kind ANY = UOR_PAYLOAD_ANY;
    const uor_payload_kind NUM = UOR_PAYLOAD_NUMERIC;
    const uor_payload_kind VEC = UOR_PAYLOAD_VECTOR;
    const uint32_t         VAR = UOR_VARIADIC;

    const BuiltinDesc table[] = {
        {"const",    contract(0, 0, {}, ANY, {"value"}), op_const},
        {"input",    contract(0, 0, {}, ANY, {}, UOR_OP_NONE), op_input},
        {"identity", contract(1, 1, {ANY}, ANY), op_identity},
        {"add",      contract(1, VAR, {NUM}, NUM), op_add},
        {"mul",      contract(1, VAR, {NUM}, NUM), op_mul},
        {"sub",      contract(2, 2, {NUM}, NUM), op_sub},
        {"div",      contract(2, 2, {NUM}, UOR_PAYLOAD_REAL), op_div},
        {"neg",      contract(1, 1, {NUM}, NUM), op_neg},
        {"scale",    contract(1, 1, {ANY}, ANY, {"factor"}), op_scale},
        {"concat",   contract(1, VAR, {ANY}, VEC), op_concat},
        {"sum",      contract(1, 1, {VEC}, UOR_PAYLOAD_REAL), op_sum},
        {"dot",      contract(2, 2, {VEC}, UOR_PAYLOAD_REAL), op_dot},
        {"relu",     contract(1, 1, {ANY}, ANY), op_relu},
        {"embed_quaternion", contract(1, 1, {ANY}, VEC), op_embed_quaternion},
        {"fail",     contract(0, VAR, {}, ANY, {}, UOR_OP_NONE), op_fail},
        {"sleep",    contract(0, VAR, {}, ANY, {}, UOR_OP_NONE), op_sleep},
    };

    for (auto& d : table) {
        uor_status st = registry.add(make_operator(d.name, d.contract, d.fn), err);
        if (st != UOR_OK) return st;
    }
    uor_log(UOR_LOG_DEBUG, "registry", "registered %zu built-in operators",
            sizeof(table) / sizeof(table[0]));
    return UOR_OK;
}

/* ================================================================== */
/*  RetryOperator                                                      */
/* ================================================================== */

/* A null inner operator yields an empty contract and every call fails. */
static OperatorContract wrapped_contract(const OperatorPtr& inner) {
    return inner ? inner->contract() : OperatorContract{};
}

RetryOperator::RetryOperator(std::string name, OperatorPtr inner,
                             uint32_t max_attempts, uint32_t backoff_ms)
    : Operator(std::move(name), wrapped_contract(inner)),
      inner_(std::move(inner)),
      max_attempts_(max_attempts == 0 ? 1 : max_attempts),
      backoff_ms_(backoff_ms) {}

uor_status RetryOperator::apply(OpCall& call) const {
    if (!inner_) return call.fail(UOR_ERROR_INTERNAL, "retry '" + name() + "' wraps no operator");
    uor_status st = UOR_OK;
    for (uint32_t attempt = 1; attempt <= max_attempts_; ++attempt) {
        call.message.clear();
        st = inner_->apply(call);
        if (st != UOR_ERROR_COMPUTE) return st;
        if (attempt == max_attempts_ || call.should_stop()) break;

        uor_log(UOR_LOG_DEBUG, "retry", "%s: attempt %u/%u failed: %s",
                call.node_id.c_str(), attempt, max_attempts_, call.message.c_str());
        if (backoff_ms_)
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms_));
    }
    return st;
}

} // namespace uor
