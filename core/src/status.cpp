/**
 * @file status.cpp
 * @brief Printable names for the ABI enums
 */

#include "uor/uor_abi.h"

const char* uor_status_str(uor_status st) {
    switch (st) {
        case UOR_OK:                   return "ok";
        case UOR_ERROR_INVALID_ARG:    return "invalid_argument";
        case UOR_ERROR_NOT_FOUND:      return "not_found";
        case UOR_ERROR_UNSUPPORTED:    return "unsupported";
        case UOR_ERROR_SCHEMA:         return "schema_error";
        case UOR_ERROR_DUPLICATE_ID:   return "duplicate_id";
        case UOR_ERROR_UNKNOWN_DEP:    return "unknown_dependency";
        case UOR_ERROR_MISSING_PARAM:  return "missing_parameter";
        case UOR_ERROR_UNKNOWN_OP:     return "unknown_operator";
        case UOR_ERROR_CYCLE:          return "cycle";
        case UOR_ERROR_ARITY:          return "arity";
        case UOR_ERROR_TERMINAL:       return "terminal_has_dependents";
        case UOR_ERROR_CONFLICT:       return "conflict";
        case UOR_ERROR_SHAPE_MISMATCH: return "shape_mismatch";
        case UOR_ERROR_COMPUTE:        return "compute_error";
        case UOR_ERROR_TIMEOUT:        return "timeout";
        case UOR_ERROR_EXECUTION:      return "execution_error";
        case UOR_ERROR_CANCELLED:      return "cancelled";
        case UOR_ERROR_INVARIANT:      return "invariant_violation";
        case UOR_ERROR_INTERNAL:       return "internal";
    }
    return "unknown";
}

const char* uor_node_status_str(uor_node_status st) {
    switch (st) {
        case UOR_NODE_PENDING:  return "pending";
        case UOR_NODE_READY:    return "ready";
        case UOR_NODE_COMPUTED: return "computed";
        case UOR_NODE_SKIPPED:  return "skipped";
        case UOR_NODE_FAILED:   return "failed";
    }
    return "unknown";
}

const char* uor_payload_kind_str(uor_payload_kind k) {
    switch (k) {
        case UOR_PAYLOAD_NONE:    return "none";
        case UOR_PAYLOAD_BOOL:    return "bool";
        case UOR_PAYLOAD_INT:     return "int";
        case UOR_PAYLOAD_REAL:    return "real";
        case UOR_PAYLOAD_TEXT:    return "text";
        case UOR_PAYLOAD_VECTOR:  return "vector";
        case UOR_PAYLOAD_ANY:     return "any";
        case UOR_PAYLOAD_NUMERIC: return "numeric";
    }
    return "unknown";
}
