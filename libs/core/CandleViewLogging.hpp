#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// CANDLEVIEW LOGGING CATEGORIES
// =============================================================================
// Four categories, each with atomic per-call-site throttling for hot paths

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: mount/unmount, config, themes, view resets
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: reconciliation passes, day boundaries, symbol changes
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: resize, pointer moves, engine calls
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace candleview::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Log every app event (low frequency)
    inline constexpr int kData   = 1;    // Reconciliation runs once per snapshot
    inline constexpr int kRender = 50;   // Pointer moves arrive per mouse event
    inline constexpr int kDebug  = 10;
}

// Throttling macro with runtime env var override
#define CVLOG_THROTTLED(cat, defaultInterval, ...)                                  \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("CANDLEVIEW_LOG_" #cat "_INTERVAL");      \
            const int parsed = env ? std::atoi(env) : (defaultInterval);             \
            return parsed > 0 ? parsed : 1;                                          \
        }();                                                                         \
        if (_interval == 1 || (++_counter % _interval) == 1) {                       \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

// Primary logging macros
#define cvLog_App(...)     CVLOG_THROTTLED(App, candleview::log_throttle::kApp, __VA_ARGS__)
#define cvLog_Data(...)    CVLOG_THROTTLED(Data, candleview::log_throttle::kData, __VA_ARGS__)
#define cvLog_Render(...)  CVLOG_THROTTLED(Render, candleview::log_throttle::kRender, __VA_ARGS__)
#define cvLog_Debug(...)   CVLOG_THROTTLED(Debug, candleview::log_throttle::kDebug, __VA_ARGS__)

// Explicit throttle intervals
#define cvLog_AppN(n, ...)    CVLOG_THROTTLED(App, n, __VA_ARGS__)
#define cvLog_DataN(n, ...)   CVLOG_THROTTLED(Data, n, __VA_ARGS__)
#define cvLog_RenderN(n, ...) CVLOG_THROTTLED(Render, n, __VA_ARGS__)
#define cvLog_DebugN(n, ...)  CVLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define cvLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define cvLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export CANDLEVIEW_LOG_Render_INTERVAL=1   # See every pointer move
//   export QT_LOGGING_RULES="candleview.*.debug=true"
//
// CATEGORY GUIDELINES:
// - cvLog_App():    mount, unmount, config, view resets      (every 1)
// - cvLog_Data():   reconciliation passes, symbol changes    (every 1)
// - cvLog_Render(): resize, pointer moves                    (every 50)
// - cvLog_Debug():  detailed diagnostics                     (every 10)
