/**
 * @file Diagnostic.hpp
 * @brief Structured error detail for chart, build and registry failures
 *
 * Functions return a uor_status and, when the caller passes a non-null
 * Diagnostic*, fill it with the domain, code, offending node and message.
 */

#ifndef UOR_DIAGNOSTIC_HPP
#define UOR_DIAGNOSTIC_HPP

#include "uor/uor_abi.h"

#include <cstdint>
#include <string>

namespace uor {

enum class ErrorDomain : uint8_t {
    Schema,     /**< chart text malformed or invalid   */
    Build,      /**< manifold would be invalid         */
    Registry    /**< operator registration rejected    */
};

inline const char* domain_str(ErrorDomain d) {
    switch (d) {
        case ErrorDomain::Schema:   return "schema";
        case ErrorDomain::Build:    return "build";
        case ErrorDomain::Registry: return "registry";
    }
    return "?";
}

struct Diagnostic {
    ErrorDomain domain = ErrorDomain::Schema;
    uor_status  code   = UOR_OK;
    std::string node_id;
    std::string message;

    bool ok() const { return code == UOR_OK; }

    void clear() {
        code = UOR_OK;
        node_id.clear();
        message.clear();
    }

    /** "build error (cycle) at 'c': ..." */
    std::string to_string() const {
        std::string s = domain_str(domain);
        s += " error (";
        s += uor_status_str(code);
        s += ")";
        if (!node_id.empty()) s += " at '" + node_id + "'";
        if (!message.empty()) s += ": " + message;
        return s;
    }
};

using SchemaError   = Diagnostic;
using BuildError    = Diagnostic;
using RegistryError = Diagnostic;

/** Fill `d` (if non-null) and return `code`, for one-line early returns. */
inline uor_status report(Diagnostic* d, ErrorDomain domain, uor_status code,
                         const std::string& node_id, const std::string& message) {
    if (d) {
        d->domain  = domain;
        d->code    = code;
        d->node_id = node_id;
        d->message = message;
    }
    return code;
}

} // namespace uor

#endif // UOR_DIAGNOSTIC_HPP
