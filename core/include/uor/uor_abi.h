/**
 * @file uor_abi.h
 * @brief UOR Engine ABI Contract — status codes, node states, payload kinds
 *
 * Pure C header shared by the C++ core, the C API gateway and any
 * surrounding tooling. Every symbol here is:
 *   - Pure C linkage (extern "C")
 *   - POD or enum typed
 *   - Free of C++ types, so it can be consumed from FFI bindings
 *
 * ABI version is encoded as a uint32_t monotonic counter. A consumer built
 * against a different major version MUST be rejected at load time.
 */

#ifndef UOR_ABI_H
#define UOR_ABI_H

#include <stddef.h>
#include <stdint.h>

/* ------------------------------------------------------------------ */
/*  1. Export / Visibility Macros                                      */
/* ------------------------------------------------------------------ */

#if defined(_WIN32) || defined(__CYGWIN__)
  #ifdef UOR_BUILDING_DLL
    #define UOR_API __declspec(dllexport)
  #else
    #define UOR_API __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define UOR_API __attribute__((visibility("default")))
#else
  #define UOR_API
#endif

/* ------------------------------------------------------------------ */
/*  2. ABI Version                                                     */
/* ------------------------------------------------------------------ */

#define UOR_ABI_VERSION_MAJOR 0
#define UOR_ABI_VERSION_MINOR 2
#define UOR_ABI_VERSION_PATCH 0

/** Packed ABI version: 0x00MMNNPP */
#define UOR_ABI_VERSION \
    (((uint32_t)UOR_ABI_VERSION_MAJOR << 16) | \
     ((uint32_t)UOR_ABI_VERSION_MINOR << 8)  | \
     ((uint32_t)UOR_ABI_VERSION_PATCH))

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------ */
/*  3. Status Codes                                                    */
/*     Grouped by the layer that raises them. Schema-class codes come  */
/*     from the chart loader, build-class from the manifold builder,   */
/*     operator-class from a single invocation, run-class from the     */
/*     scheduler as an aggregate.                                      */
/* ------------------------------------------------------------------ */

typedef enum uor_status {
    UOR_OK                    = 0,

    /* generic */
    UOR_ERROR_INVALID_ARG     = 1,
    UOR_ERROR_NOT_FOUND       = 2,
    UOR_ERROR_UNSUPPORTED     = 3,

    /* chart / build */
    UOR_ERROR_SCHEMA          = 10,  /**< malformed chart text           */
    UOR_ERROR_DUPLICATE_ID    = 11,
    UOR_ERROR_UNKNOWN_DEP     = 12,  /**< edge names an undeclared node  */
    UOR_ERROR_MISSING_PARAM   = 13,
    UOR_ERROR_UNKNOWN_OP      = 14,
    UOR_ERROR_CYCLE           = 15,
    UOR_ERROR_ARITY           = 16,
    UOR_ERROR_TERMINAL        = 17,  /**< terminal op has dependents     */

    /* registry */
    UOR_ERROR_CONFLICT        = 20,

    /* single invocation */
    UOR_ERROR_SHAPE_MISMATCH  = 30,
    UOR_ERROR_COMPUTE         = 31,
    UOR_ERROR_TIMEOUT         = 32,

    /* run aggregate */
    UOR_ERROR_EXECUTION       = 40,
    UOR_ERROR_CANCELLED       = 41,
    UOR_ERROR_INVARIANT       = 42,  /**< cycle found at run time — fatal */

    UOR_ERROR_INTERNAL        = 255
} uor_status;

/** Static, never-null name for a status code. */
UOR_API const char* uor_status_str(uor_status st);

/* ------------------------------------------------------------------ */
/*  4. Node Status — lifecycle of one manifold vertex                  */
/* ------------------------------------------------------------------ */

typedef enum uor_node_status {
    UOR_NODE_PENDING   = 0,
    UOR_NODE_READY     = 1,   /**< every dependency computed          */
    UOR_NODE_COMPUTED  = 2,   /**< terminal: payload is set, read-only */
    UOR_NODE_SKIPPED   = 3,   /**< terminal: upstream failure          */
    UOR_NODE_FAILED    = 4    /**< terminal: own operator failed       */
} uor_node_status;

UOR_API const char* uor_node_status_str(uor_node_status st);

/* ------------------------------------------------------------------ */
/*  5. Payload Kinds                                                   */
/*     ANY and NUMERIC only appear in operator contracts; a concrete   */
/*     payload is always one of NONE..VECTOR.                          */
/* ------------------------------------------------------------------ */

typedef enum uor_payload_kind {
    UOR_PAYLOAD_NONE     = 0,
    UOR_PAYLOAD_BOOL     = 1,
    UOR_PAYLOAD_INT      = 2,
    UOR_PAYLOAD_REAL     = 3,
    UOR_PAYLOAD_TEXT     = 4,
    UOR_PAYLOAD_VECTOR   = 5,

    UOR_PAYLOAD_ANY      = 100,
    UOR_PAYLOAD_NUMERIC  = 101   /**< INT or REAL */
} uor_payload_kind;

UOR_API const char* uor_payload_kind_str(uor_payload_kind k);

/* ------------------------------------------------------------------ */
/*  6. Operator Flags                                                  */
/* ------------------------------------------------------------------ */

typedef enum uor_op_flags {
    UOR_OP_NONE      = 0,
    UOR_OP_PURE      = 0x01,  /**< referentially transparent: cacheable   */
    UOR_OP_STATEFUL  = 0x02,  /**< external/learned state: never replayed */
    UOR_OP_TERMINAL  = 0x04   /**< must not have dependents (kernels)     */
} uor_op_flags;

/** max_arity value meaning "unbounded". */
#define UOR_VARIADIC UINT32_MAX

#ifdef __cplusplus
}
#endif

#endif /* UOR_ABI_H */
