#include "logging/LogManager.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QTextStream>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <utility>
#include <vector>

namespace {

QMutex g_logMutex;
std::unique_ptr<QFile> g_logFile;
QtMessageHandler g_previousHandler = nullptr;
bool g_installed = false;

const QRegularExpression &logFilePattern()
{
    static const QRegularExpression pattern(QStringLiteral("^log_(\\d+)\\.txt$"));
    return pattern;
}

QString levelTag(QtMsgType type)
{
    switch (type) {
    case QtWarningMsg:  return QStringLiteral("WARNING: ");
    case QtCriticalMsg: return QStringLiteral("ERROR: ");
    case QtFatalMsg:    return QStringLiteral("FATAL: ");
    default:            return QString();
    }
}

void fileMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    Q_UNUSED(context);

    const QString line = QStringLiteral("%1 - %2%3")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss,zzz")),
             levelTag(type), message);

    QMutexLocker locker(&g_logMutex);
    if (g_logFile && g_logFile->isOpen()) {
        QTextStream stream(g_logFile.get());
        stream << line << '\n';
        stream.flush();
    }

    const QByteArray local = line.toLocal8Bit();
    std::fprintf(stderr, "%s\n", local.constData());
    std::fflush(stderr);
}

// Numbered log files found in @p dir, sorted by number ascending.
std::vector<std::pair<int, QString>> numberedLogFiles(const QString &logDir)
{
    std::vector<std::pair<int, QString>> files;
    const QDir dir(logDir);
    const QStringList names = dir.entryList({QStringLiteral("log_*.txt")}, QDir::Files);
    for (const QString &name : names) {
        const auto match = logFilePattern().match(name);
        if (match.hasMatch()) {
            files.emplace_back(match.captured(1).toInt(), dir.filePath(name));
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

bool LogManager::install(const QString &logDir)
{
    if (g_installed) {
        return true;
    }

    if (!QDir().mkpath(logDir)) {
        std::fprintf(stderr, "LogManager: cannot create log directory %s\n",
                     qPrintable(logDir));
    }

    pruneLogFiles(logDir, kMaxLogFiles - 1);

    auto file = std::make_unique<QFile>(nextLogFilePath(logDir));
    const bool opened = file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
    {
        QMutexLocker locker(&g_logMutex);
        g_logFile.reset();
        if (opened) {
            g_logFile = std::move(file);
        }
    }

    g_previousHandler = qInstallMessageHandler(fileMessageHandler);
    g_installed = true;

    if (!opened) {
        qWarning() << "LogManager: Failed to open log file in" << logDir;
    }
    return opened;
}

void LogManager::uninstall()
{
    if (!g_installed) {
        return;
    }

    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
    g_installed = false;

    QMutexLocker locker(&g_logMutex);
    g_logFile.reset();
}

bool LogManager::isInstalled()
{
    return g_installed;
}

QString LogManager::logFilePath()
{
    QMutexLocker locker(&g_logMutex);
    if (!g_logFile) {
        return QString();
    }
    return QFileInfo(*g_logFile).absoluteFilePath();
}

QString LogManager::nextLogFilePath(const QString &logDir)
{
    // Numbers keep increasing after pruning so the newest file is always the highest.
    const auto files = numberedLogFiles(logDir);
    const int number = files.empty() ? 1 : files.back().first + 1;
    return QDir(logDir).filePath(QStringLiteral("log_%1.txt").arg(number));
}

int LogManager::pruneLogFiles(const QString &logDir, int keep)
{
    auto files = numberedLogFiles(logDir);
    const int excess = static_cast<int>(files.size()) - qMax(0, keep);
    int removed = 0;
    for (int i = 0; i < excess; ++i) {
        if (QFile::remove(files[static_cast<size_t>(i)].second)) {
            ++removed;
        }
    }
    return removed;
}
