// SPDX-License-Identifier: MIT
/**
 * @file dvol_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the dvolkit library
 *
 * The numerical core never writes to stdout/stderr. Instead, every stage
 * exposes tracing points that can be enabled at runtime with bpftrace,
 * systemtap or perf. When tracing is disabled (default), probes compile to
 * nothing.
 *
 * Example usage with bpftrace:
 *   # Watch every hour that produced no DVOL and why
 *   sudo bpftrace -e 'usdt:./lib*.so:dvolkit:insufficient_data { printf("%d %d %d\n", arg0, arg1, arg2); }'
 *
 *   # Follow the advisory comparison against the official index
 *   sudo bpftrace -e 'usdt:./lib*.so:dvolkit:comparison_result { ... }'
 */

#ifndef DVOL_TRACE_H
#define DVOL_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all dvolkit probes
 */
#define DVOLKIT_PROVIDER dvolkit

/**
 * Module identifiers, passed as the first parameter to most probes
 */
#define MODULE_EXPIRY_VARIANCE  1
#define MODULE_DVOL_INDEX       2
#define MODULE_DVOL_BATCH       3
#define MODULE_SNAPSHOT         4
#define MODULE_VOV              5
#define MODULE_COMPARATOR       6

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when a computation begins
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific size (quotes, items, days)
 * @param param2: Module-specific parameter (T, window)
 * @param param3: Module-specific parameter (F, spot)
 */
#define DVOLKIT_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(DVOLKIT_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when a computation completes with a result
 * @param module_id: Module identifier
 * @param count: Number of elements produced or used
 * @param final_metric: Headline value (variance, dvol, mean vov)
 */
#define DVOLKIT_TRACE_ALGO_COMPLETE(module_id, count, final_metric) \
    DTRACE_PROBE3(DVOLKIT_PROVIDER, algo_complete, module_id, count, final_metric)

/**
 * ============================================================================
 * Data Sufficiency and Validation Probes
 * ============================================================================
 */

/**
 * Fired when a stage returns no estimate for routine reasons
 * @param module_id: Module identifier
 * @param error_code: DvolErrorCode as int
 * @param achieved_count: Strikes per side, expiries or days actually available
 * @param value: Offending value where meaningful
 */
#define DVOLKIT_TRACE_INSUFFICIENT_DATA(module_id, error_code, achieved_count, value) \
    DTRACE_PROBE4(DVOLKIT_PROVIDER, insufficient_data, module_id, error_code, achieved_count, value)

/**
 * Fired when input violates the caller contract
 * @param module_id: Module identifier
 * @param error_code: DvolErrorCode or ValidationErrorCode as int
 * @param value: Offending value
 * @param index: Position of the offending element
 */
#define DVOLKIT_TRACE_VALIDATION_ERROR(module_id, error_code, value, index) \
    DTRACE_PROBE4(DVOLKIT_PROVIDER, validation_error, module_id, error_code, value, index)

/**
 * ============================================================================
 * Module-Specific Probes
 * ============================================================================
 */

/**
 * Fired for every DVOL produced by the hourly driver
 * @param dvol: Annualized 30-day volatility (decimal)
 * @param quality: 0=high, 1=medium, 2=low
 * @param n_near: Strike count of the near expiry
 * @param n_far: Strike count of the far expiry
 */
#define DVOLKIT_TRACE_DVOL_RESULT(dvol, quality, n_near, n_far) \
    DTRACE_PROBE4(DVOLKIT_PROVIDER, dvol_result, dvol, quality, n_near, n_far)

/**
 * Fired when the batch driver finishes
 * @param n_items: Work items submitted
 * @param n_ok: Work items that produced a DVOL
 */
#define DVOLKIT_TRACE_BATCH_COMPLETE(n_items, n_ok) \
    DTRACE_PROBE3(DVOLKIT_PROVIDER, batch_complete, MODULE_DVOL_BATCH, n_items, n_ok)

/**
 * Fired for every snapshot hour emitted by the assembler
 * @param hour_ms: Snapshot hour in epoch milliseconds
 * @param n_instruments: Instruments in the window
 */
#define DVOLKIT_TRACE_SNAPSHOT_EMITTED(hour_ms, n_instruments) \
    DTRACE_PROBE3(DVOLKIT_PROVIDER, snapshot_emitted, MODULE_SNAPSHOT, hour_ms, n_instruments)

/**
 * Fired with the full-sample mean VoV before the f_VoV pass
 * @param n_valid: Number of non-null VoV values
 * @param vov_bar: Mean VoV (1.0 when none exist)
 */
#define DVOLKIT_TRACE_VOV_BAR(n_valid, vov_bar) \
    DTRACE_PROBE3(DVOLKIT_PROVIDER, vov_bar, MODULE_VOV, n_valid, vov_bar)

/**
 * Fired with the advisory comparison against an official index
 * @param n_days: Matched days
 * @param correlation: Pearson correlation (NaN when undefined)
 * @param mae: Mean absolute error
 * @param rmse: Root mean squared error
 * @param passed: 1 if correlation exceeded the threshold
 */
#define DVOLKIT_TRACE_COMPARISON_RESULT(n_days, correlation, mae, rmse, passed) \
    DTRACE_PROBE5(DVOLKIT_PROVIDER, comparison_result, n_days, correlation, mae, rmse, passed)

#endif // DVOL_TRACE_H
