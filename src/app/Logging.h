/**
 * @file Logging.h
 * @brief Process-wide Qt message handler writing to console and a run log file
 */
#ifndef PARTCAD_APP_LOGGING_H
#define PARTCAD_APP_LOGGING_H

#include <QString>

namespace partcad::app {

struct LoggingOptions {
    QString appName = QStringLiteral("partcad");
    bool debug = false;          ///< enable every *.debug category
    QString logDirectory;        ///< empty: PARTCAD_LOG_DIR, then app data dir
    bool writeFile = true;
};

/**
 * @brief Installs the PartCAD message handler
 *
 * Lines look like:
 *   <ISO timestamp> [LEVEL] [tid=0x..] [category] [file:line] [function] message
 *
 * Debug output is off by default except for the categories listed in
 * PARTCAD_LOG_DEBUG_CATEGORIES (comma separated, wildcards allowed).
 * PARTCAD_LOG_DEBUG=1 enables all debug output.
 */
class Logging {
public:
    /**
     * @brief Install the handler; later calls are no-ops until shutdown()
     *
     * The console handler is always installed. When the run log cannot be
     * created, a warning is logged and output goes to the console only.
     *
     * @return false if a log file was requested but could not be opened
     */
    static bool initialize(const LoggingOptions& options);
    static void shutdown();

    /// Path of the open run log, empty when logging to the console only.
    static QString logFilePath();
    static bool isDebugLoggingEnabled();
};

} // namespace partcad::app

#endif // PARTCAD_APP_LOGGING_H
