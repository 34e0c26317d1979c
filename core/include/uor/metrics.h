/**
 * @file metrics.h
 * @brief Structured logging & run metrics collection
 *
 * C-ABI compatible. Logging goes through a single process-wide sink that
 * can be redirected with a callback; metrics are lock-free counters that
 * the scheduler bumps at the end of every run.
 */

#ifndef UOR_METRICS_H
#define UOR_METRICS_H

#include <stdint.h>
#include <stddef.h>

#include "uor_abi.h" /* UOR_API */

#ifdef __cplusplus
extern "C" {
#endif

/* ---- Log Levels ---- */
typedef enum uor_log_level {
    UOR_LOG_TRACE = 0,
    UOR_LOG_DEBUG = 1,
    UOR_LOG_INFO  = 2,
    UOR_LOG_WARN  = 3,
    UOR_LOG_ERROR = 4,
    UOR_LOG_FATAL = 5,
    UOR_LOG_OFF   = 6
} uor_log_level;

/* ---- Log callback ---- */
typedef void (*uor_log_fn)(uor_log_level level, const char* component,
                           const char* message, void* userdata);

UOR_API void uor_log_set_callback(uor_log_fn fn, void* userdata);
UOR_API void uor_log_set_level(uor_log_level level);
UOR_API uor_log_level uor_log_get_level(void);
UOR_API void uor_log(uor_log_level level, const char* component, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/** Parse "trace".."off" or "0".."6". Returns 0 on unknown input. */
UOR_API int uor_log_level_parse(const char* text, uor_log_level* out);

/* ---- Metrics Collector ---- */

typedef struct uor_metrics_snapshot {
    uint64_t runs_completed;
    uint64_t runs_failed;
    uint64_t runs_cancelled;
    uint64_t nodes_computed;
    uint64_t nodes_failed;
    uint64_t nodes_skipped;
    uint64_t cache_hits;
    uint64_t timeouts;
    uint64_t total_run_us;
    double   avg_run_us;
} uor_metrics_snapshot;

UOR_API void uor_metrics_reset(void);
UOR_API void uor_metrics_record_run(uor_status result, uint64_t us,
                                    uint32_t computed, uint32_t failed,
                                    uint32_t skipped, uint32_t cache_hits);
UOR_API void uor_metrics_record_timeout(void);
UOR_API void uor_metrics_snapshot_get(uor_metrics_snapshot* out);
UOR_API size_t uor_metrics_to_json(char* buf, size_t buf_size);
UOR_API size_t uor_metrics_to_prometheus(char* buf, size_t buf_size);

#ifdef __cplusplus
}
#endif

#endif /* UOR_METRICS_H */
