/**
 * @file operator.cpp
 * @brief Contract checking and OperatorRegistry
 */

#include "uor/Operator.hpp"
#include "uor/metrics.h"

#include <mutex>

namespace uor {

uor_status check_inputs(const OperatorContract& contract,
                        const std::vector<PayloadRef>& inputs,
                        std::string* message) {
    if (!contract.accepts_arity(inputs.size())) {
        if (message) {
            *message = "expected ";
            if (contract.max_arity == UOR_VARIADIC)
                *message += "at least " + std::to_string(contract.min_arity);
            else if (contract.min_arity == contract.max_arity)
                *message += std::to_string(contract.min_arity);
            else
                *message += std::to_string(contract.min_arity) + ".." +
                            std::to_string(contract.max_arity);
            *message += " inputs, got " + std::to_string(inputs.size());
        }
        return UOR_ERROR_SHAPE_MISMATCH;
    }

    for (size_t i = 0; i < inputs.size(); ++i) {
        uor_payload_kind want = contract.input_kind(i);
        if (!inputs[i] || !inputs[i]->matches(want)) {
            if (message) {
                *message = "input " + std::to_string(i) + ": expected " +
                           uor_payload_kind_str(want) + ", got " +
                           uor_payload_kind_str(inputs[i] ? inputs[i]->kind()
                                                          : UOR_PAYLOAD_NONE);
            }
            return UOR_ERROR_SHAPE_MISMATCH;
        }
    }
    return UOR_OK;
}

/* -- Registry ----------------------------------------------------- */

uor_status OperatorRegistry::add(OperatorPtr op, RegistryError* err) {
    if (!op || op->name().empty())
        return report(err, ErrorDomain::Registry, UOR_ERROR_INVALID_ARG, "",
                      "operator must be non-null and named");

    std::unique_lock<std::shared_mutex> lk(mu_);
    if (ops_.find(op->name()) != ops_.end()) {
        lk.unlock();
        uor_log(UOR_LOG_WARN, "registry", "conflict: '%s' already registered",
                op->name().c_str());
        return report(err, ErrorDomain::Registry, UOR_ERROR_CONFLICT, "",
                      "operator '" + op->name() + "' is already registered");
    }
    std::string name = op->name();
    ops_.emplace(name, std::move(op));
    lk.unlock();

    uor_log(UOR_LOG_TRACE, "registry", "registered '%s'", name.c_str());
    return UOR_OK;
}

OperatorPtr OperatorRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = ops_.find(name);
    return it == ops_.end() ? nullptr : it->second;
}

bool OperatorRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return ops_.find(name) != ops_.end();
}

size_t OperatorRegistry::size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return ops_.size();
}

std::vector<std::string> OperatorRegistry::names() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(ops_.size());
    for (auto& [name, op] : ops_) out.push_back(name);
    return out;
}

ChartSchema OperatorRegistry::schema() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    ChartSchema s;
    for (auto& [name, op] : ops_)
        s.required[name] = op->contract().required_params;
    return s;
}

} // namespace uor
