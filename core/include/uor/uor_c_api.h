/**
 * @file uor_c_api.h
 * @brief UOR Engine C API — FFI Gateway
 *
 * Pure C header. Opaque handles, zero C++ leakage.
 * This is the sole exported symbol surface for external consumers.
 */

#ifndef UOR_C_API_H
#define UOR_C_API_H

#include <stddef.h>
#include <stdint.h>

#include "uor_abi.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------ */
/*  Opaque Handles                                                     */
/* ------------------------------------------------------------------ */

typedef struct uor_engine_s*   uor_engine_t;
typedef struct uor_manifold_s* uor_manifold_t;

/* ------------------------------------------------------------------ */
/*  Engine Lifecycle                                                   */
/*  n_threads 0 = hardware concurrency; timeout_ms 0 = none.           */
/* ------------------------------------------------------------------ */

UOR_API uor_engine_t uor_create_engine(uint32_t n_threads, uint32_t timeout_ms,
                                       int enable_cache);
UOR_API void         uor_destroy_engine(uor_engine_t engine);

/* ------------------------------------------------------------------ */
/*  Manifold Lifecycle                                                 */
/* ------------------------------------------------------------------ */

/** Parse + validate + build. Returns NULL on error; see uor_last_error. */
UOR_API uor_manifold_t uor_build_manifold_json(uor_engine_t engine,
                                               const char* chart_json);
UOR_API void           uor_destroy_manifold(uor_manifold_t manifold);

/* ------------------------------------------------------------------ */
/*  Execution                                                          */
/* ------------------------------------------------------------------ */

/** Runs in place. UOR_OK, UOR_ERROR_EXECUTION, ... */
UOR_API uor_status uor_run(uor_engine_t engine, uor_manifold_t manifold);

/* ------------------------------------------------------------------ */
/*  Queries                                                            */
/* ------------------------------------------------------------------ */

UOR_API uor_status uor_get_node_status(uor_manifold_t manifold, const char* node_id,
                                       uor_node_status* out);

/** Numeric payload (INT promotes). UOR_ERROR_SHAPE_MISMATCH otherwise. */
UOR_API uor_status uor_read_real(uor_manifold_t manifold, const char* node_id,
                                 double* out);

/**
 * Rendered payload text, NUL-terminated and truncated to buf_size.
 * *needed (optional) receives the full length excluding the NUL.
 */
UOR_API uor_status uor_read_text(uor_manifold_t manifold, const char* node_id,
                                 char* buf, size_t buf_size, size_t* needed);

/** Last error message on the calling thread; "" when none. */
UOR_API const char* uor_last_error(void);

#ifdef __cplusplus
}
#endif

#endif /* UOR_C_API_H */
