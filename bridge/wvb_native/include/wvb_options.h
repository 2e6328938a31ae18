/**
 * @file wvb_options.h
 * @brief Well-known bridge option key/value constants.
 *
 * Shared by BridgeConfig and embedders so option strings stay consistent.
 */
#ifndef WVBRIDGE_OPTIONS_H_
#define WVBRIDGE_OPTIONS_H_

/* ── Option Keys ────────────────────────────────────────────────── */

/** spdlog level name ("trace" … "off"). */
#define WVB_OPTION_LOG_LEVEL              "log_level"

/** Longest time one pump step may block, in milliseconds. */
#define WVB_OPTION_PUMP_TIMEOUT_MS        "pump_timeout_ms"

/** Default IPC request timeout in milliseconds. */
#define WVB_OPTION_IPC_TIMEOUT_MS         "ipc_timeout_ms"

/** What the pump does when an event handler throws. */
#define WVB_OPTION_BOUNDARY_POLICY        "boundary_policy"

/* ── Boundary Policy Values ─────────────────────────────────────── */

/** Log the exception and keep the loop running (default). */
#define WVB_BOUNDARY_POLICY_CONTINUE      "continue"

/** Log the exception and stop the loop. */
#define WVB_BOUNDARY_POLICY_EXIT          "exit"

/* ── Environment Overrides ──────────────────────────────────────── */

#define WVB_ENV_LOG_LEVEL                 "WVB_LOG_LEVEL"
#define WVB_ENV_PUMP_TIMEOUT_MS           "WVB_PUMP_TIMEOUT_MS"
#define WVB_ENV_IPC_TIMEOUT_MS            "WVB_IPC_TIMEOUT_MS"
#define WVB_ENV_BOUNDARY_POLICY           "WVB_BOUNDARY_POLICY"

#endif  /* WVBRIDGE_OPTIONS_H_ */
