// SPDX-License-Identifier: MIT
/**
 * @file sash_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the sash library
 *
 * Probes compile to single NOP instructions until a tracing tool attaches.
 * They are the library's only logging channel: nothing is written to
 * stdout/stderr from library code.
 *
 * Example usage with bpftrace:
 *   # Watch every category fallback
 *   sudo bpftrace -e 'usdt:./lib*.so:sash:category_fallback { printf("%s -> %s\n", str(arg0), str(arg1)); }'
 *
 *   # Count superseded client requests per second
 *   sudo bpftrace -e 'usdt:./lib*.so:sash:client_superseded { @[probe] = count(); } interval:s:1 { print(@); clear(@); }'
 *
 * String arguments are passed as `const char*` and are only valid for the
 * duration of the probe.
 */

#ifndef SASH_TRACE_H
#define SASH_TRACE_H

#include <stddef.h>

#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
// Fallback: define empty macros when SDT is not available
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all sash library probes
 */
#define SASH_PROVIDER sash

/**
 * Module identifiers, passed as the first argument of the generic probes
 */
#define SASH_MODULE_TABLE      1
#define SASH_MODULE_RESOLVER   2
#define SASH_MODULE_SERVICE    3
#define SASH_MODULE_CLIENT     4
#define SASH_MODULE_TRANSPORT  5

/**
 * Dataset source format identifiers
 */
#define SASH_SOURCE_MEMORY   0
#define SASH_SOURCE_JSON     1
#define SASH_SOURCE_PARQUET  2

/**
 * Axis identifiers for clamp probes
 */
#define SASH_AXIS_WIDTH   0
#define SASH_AXIS_HEIGHT  1

/**
 * ============================================================================
 * Table Store Probes
 * ============================================================================
 */

/**
 * Fired before a dataset is parsed
 * @param source: SASH_SOURCE_* constant
 */
#define SASH_TRACE_TABLE_LOAD_START(source) \
    DTRACE_PROBE1(SASH_PROVIDER, table_load_start, source)

/**
 * Fired once a table passed validation
 * @param n_systems: Number of systems
 * @param n_grids: Total number of (system, category) grids
 */
#define SASH_TRACE_TABLE_LOAD_DONE(n_systems, n_grids) \
    DTRACE_PROBE2(SASH_PROVIDER, table_load_done, n_systems, n_grids)

/**
 * Fired when a table is rejected
 * @param error_code: TableErrorCode as int
 * @param system_key: Offending system (may be "")
 * @param category: Offending category (may be "")
 */
#define SASH_TRACE_TABLE_LOAD_FAILED(error_code, system_key, category) \
    DTRACE_PROBE3(SASH_PROVIDER, table_load_failed, error_code, system_key, category)

/**
 * ============================================================================
 * Resolver Probes
 * ============================================================================
 */

#define SASH_TRACE_RESOLVE_START(system_key, category, width, height) \
    DTRACE_PROBE4(SASH_PROVIDER, resolve_start, system_key, category, width, height)

/**
 * Fired when a coefficient is produced
 * @param coefficient: Result value
 * @param is_fallback: 1 when a substitute category was used
 * @param clamped_axes: Bit mask, bit 0 width, bit 1 height
 */
#define SASH_TRACE_RESOLVE_DONE(coefficient, is_fallback, clamped_axes) \
    DTRACE_PROBE3(SASH_PROVIDER, resolve_done, coefficient, is_fallback, clamped_axes)

#define SASH_TRACE_CATEGORY_FALLBACK(requested, substitute) \
    DTRACE_PROBE2(SASH_PROVIDER, category_fallback, requested, substitute)

/**
 * Fired when a requested dimension lies outside the measured range
 * @param axis: SASH_AXIS_* constant
 * @param requested: Requested value in meters
 * @param clamped: Bound actually used
 */
#define SASH_TRACE_AXIS_CLAMP(axis, requested, clamped) \
    DTRACE_PROBE3(SASH_PROVIDER, axis_clamp, axis, requested, clamped)

/**
 * Fired when a request is rejected
 * @param module_id: Module identifier
 * @param error_code: Module-specific error code
 * @param value: Offending value (0 if not applicable)
 */
#define SASH_TRACE_REQUEST_FAILED(module_id, error_code, value) \
    DTRACE_PROBE3(SASH_PROVIDER, request_failed, module_id, error_code, value)

/**
 * ============================================================================
 * Client Probes
 * ============================================================================
 * sash_id arguments are the caller's opaque 64-bit identity.
 */

#define SASH_TRACE_CLIENT_CACHE_HIT(sash_id) \
    DTRACE_PROBE1(SASH_PROVIDER, client_cache_hit, sash_id)

/**
 * Fired when a debounce timer is armed
 * @param sash_id: Caller identity
 * @param debounce_ms: Debounce window in milliseconds
 */
#define SASH_TRACE_CLIENT_SCHEDULED(sash_id, debounce_ms) \
    DTRACE_PROBE2(SASH_PROVIDER, client_scheduled, sash_id, debounce_ms)

/**
 * Fired when a newer request replaces pending or in-flight work
 * @param sash_id: Caller identity
 * @param had_timer: 1 if a debounce timer was cleared
 * @param had_call: 1 if an in-flight call was aborted
 */
#define SASH_TRACE_CLIENT_SUPERSEDED(sash_id, had_timer, had_call) \
    DTRACE_PROBE3(SASH_PROVIDER, client_superseded, sash_id, had_timer, had_call)

#define SASH_TRACE_CLIENT_DISPATCHED(sash_id) \
    DTRACE_PROBE1(SASH_PROVIDER, client_dispatched, sash_id)

#define SASH_TRACE_CLIENT_DELIVERED(sash_id, coefficient) \
    DTRACE_PROBE2(SASH_PROVIDER, client_delivered, sash_id, coefficient)

#define SASH_TRACE_CLIENT_FAILED(sash_id, error_code) \
    DTRACE_PROBE2(SASH_PROVIDER, client_failed, sash_id, error_code)

#define SASH_TRACE_CLIENT_RELEASED(sash_id) \
    DTRACE_PROBE1(SASH_PROVIDER, client_released, sash_id)

/**
 * Fired on a full session reset
 * @param n_sashes: Number of sashes released
 * @param n_cached: Number of cache entries dropped
 */
#define SASH_TRACE_CLIENT_RESET(n_sashes, n_cached) \
    DTRACE_PROBE2(SASH_PROVIDER, client_reset, n_sashes, n_cached)

/**
 * ============================================================================
 * Transport Probes
 * ============================================================================
 */

#define SASH_TRACE_TRANSPORT_SENT(request_bytes) \
    DTRACE_PROBE1(SASH_PROVIDER, transport_sent, request_bytes)

#define SASH_TRACE_TRANSPORT_ABORTED() \
    DTRACE_PROBE(SASH_PROVIDER, transport_aborted)

/**
 * Fired when a response arrives, before decoding
 * @param status: HTTP-like status code
 * @param response_bytes: Response body size
 */
#define SASH_TRACE_TRANSPORT_RECEIVED(status, response_bytes) \
    DTRACE_PROBE2(SASH_PROVIDER, transport_received, status, response_bytes)

#endif // SASH_TRACE_H
