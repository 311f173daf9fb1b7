#ifndef LOGMANAGER_H
#define LOGMANAGER_H

#include <QString>

/**
 * @brief Routes Qt's message output to a numbered log file and stderr.
 *
 * Each run writes to logs/log_<N>.txt where N follows the highest existing number.
 * Lines look like "2025-01-01 12:00:00,123 - message"; warnings and above
 * carry a level tag after the dash.
 */
class LogManager
{
public:
    /**
     * @brief Create the log directory, open the next log file and install
     * the message handler. Returns false when the file cannot be opened;
     * console output keeps working in that case.
     */
    static bool install(const QString &logDir = QStringLiteral("logs"));

    /**
     * @brief Restore the previous message handler and close the file.
     */
    static void uninstall();

    static bool isInstalled();

    /**
     * @brief Absolute path of the active log file, empty when not installed.
     */
    static QString logFilePath();

    static QString nextLogFilePath(const QString &logDir);

    /**
     * @brief Delete the oldest log_<N>.txt files so that at most @p keep remain.
     * @return Number of files removed
     */
    static int pruneLogFiles(const QString &logDir, int keep);

    static constexpr int kMaxLogFiles = 50;
};

#endif // LOGMANAGER_H
