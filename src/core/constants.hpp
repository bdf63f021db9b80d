#pragma once

// ── Files ───────────────────────────────────────────────────
constexpr const char* SESSIONS_FILE_NAME  = ".remote_jupyter_sessions";
constexpr const char* CONFIG_FILE_NAME    = ".rjy.yaml";
constexpr const char* DEBUG_LOG_NAME      = "rjy_debug.log";

// ── Environment overrides ───────────────────────────────────
constexpr const char* ENV_SESSIONS_FILE   = "RJY_SESSIONS_FILE";
constexpr const char* ENV_CONFIG_FILE     = "RJY_CONFIG";

// ── SSH forward ─────────────────────────────────────────────
// Used with fmt::format(FORWARD_SPEC, bind_address, port, port)
constexpr const char* FORWARD_SPEC        = "{}:{}:localhost:{}";

// ── Ports ───────────────────────────────────────────────────
constexpr int MIN_PORT                    = 1;
constexpr int MAX_PORT                    = 65535;

constexpr const char* RJY_VERSION         = "0.2.0";
