#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// CHARTWELL LOGGING CATEGORIES
// =============================================================================
// Four categories; hot-path call sites are throttled with a per-site atomic counter.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config, window
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: fetches, payload parsing, dataset validation
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: panes, surfaces, reconcile cycles, resize
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

namespace chartwell::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;
    inline constexpr int kData   = 1;
    inline constexpr int kRender = 1;
    inline constexpr int kDebug  = 10;
}

// Atomic throttling macro with runtime env var override
#define CWLOG_THROTTLED(cat, defaultInterval, ...)                                  \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("CHARTWELL_LOG_" #cat "_INTERVAL");       \
            const int parsed = env ? std::atoi(env) : (defaultInterval);            \
            return parsed > 0 ? parsed : 1;                                         \
        }();                                                                         \
        if (_interval == 1 || (++_counter % _interval) == 1) {                      \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define cwLog_App(...)     CWLOG_THROTTLED(App, chartwell::log_throttle::kApp, __VA_ARGS__)
#define cwLog_Data(...)    CWLOG_THROTTLED(Data, chartwell::log_throttle::kData, __VA_ARGS__)
#define cwLog_Render(...)  CWLOG_THROTTLED(Render, chartwell::log_throttle::kRender, __VA_ARGS__)
#define cwLog_Debug(...)   CWLOG_THROTTLED(Debug, chartwell::log_throttle::kDebug, __VA_ARGS__)

// Override macros for specific throttle intervals
#define cwLog_AppN(n, ...)    CWLOG_THROTTLED(App, n, __VA_ARGS__)
#define cwLog_DataN(n, ...)   CWLOG_THROTTLED(Data, n, __VA_ARGS__)
#define cwLog_RenderN(n, ...) CWLOG_THROTTLED(Render, n, __VA_ARGS__)
#define cwLog_DebugN(n, ...)  CWLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on macros (no throttling)
#define cwLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define cwLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

/*
USAGE:
cwLog_App("Main window ready");
cwLog_Data("Fetch finished:" << symbol << candles.size() << "candles");
cwLog_Render("Mounted pane" << paneName(id) << "width" << width);
cwLog_RenderN(50, "Crosshair moved" << x);      // every 50th call

RUNTIME CONTROL:
export CHARTWELL_LOG_Render_INTERVAL=10   # log every 10th render message
export QT_LOGGING_RULES="chartwell.*.debug=true"
*/
