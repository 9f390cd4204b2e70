/**
 * @file Logging.cpp
 */
#include "Logging.h"

#include "Environment.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QStringList>
#include <QTextStream>
#include <QThread>

#include <cstdio>
#include <cstdlib>

namespace partcad::app {
namespace {

constexpr int kLogRetentionDays = 30;
constexpr int kMaxRunLogFiles = 30;

struct LogState {
    QMutex mutex;
    QFile file;
    QtMessageHandler previousHandler = nullptr;
    bool installed = false;
    bool debugEnabled = false;
};

LogState& state() {
    static LogState instance;
    return instance;
}

QLatin1String levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:    return QLatin1String("DEBUG");
        case QtInfoMsg:     return QLatin1String("INFO");
        case QtWarningMsg:  return QLatin1String("WARN");
        case QtCriticalMsg: return QLatin1String("ERROR");
        case QtFatalMsg:    return QLatin1String("FATAL");
    }
    return QLatin1String("UNKNOWN");
}

// Info and above always pass. Debug passes for everything when enabled,
// otherwise only for the categories named in PARTCAD_LOG_DEBUG_CATEGORIES.
QString buildFilterRules(bool debugEverywhere) {
    QStringList rules{QStringLiteral("*.info=true"),
                      QStringLiteral("*.warning=true"),
                      QStringLiteral("*.critical=true")};
    rules << (debugEverywhere ? QStringLiteral("*.debug=true") : QStringLiteral("*.debug=false"));
    if (!debugEverywhere) {
        for (const QString& category : env::list("PARTCAD_LOG_DEBUG_CATEGORIES")) {
            rules << category + QStringLiteral(".debug=true");
        }
    }
    return rules.join(QLatin1Char('\n'));
}

QString formatLine(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QLatin1String unknown("<unknown>");
    const QString where = (context.file && context.line > 0)
                              ? QFileInfo(QString::fromUtf8(context.file)).fileName() + QLatin1Char(':')
                                    + QString::number(context.line)
                              : QString(unknown);
    const QString function = context.function ? QString::fromUtf8(context.function) : QString(unknown);
    const QString category = context.category ? QString::fromUtf8(context.category) : QStringLiteral("default");

    QString line;
    QTextStream out(&line);
    out << QDateTime::currentDateTime().toString(Qt::ISODateWithMs)
        << " [" << levelName(type) << ']'
        << " [tid=0x" << QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16) << ']'
        << " [" << category << ']'
        << " [" << where << ']'
        << " [" << function << "] "
        << msg;
    out.flush();
    return line;
}

void handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QByteArray line = formatLine(type, context, msg).toUtf8();
    LogState& log = state();
    {
        QMutexLocker lock(&log.mutex);
        if (log.file.isOpen()) {
            log.file.write(line);
            log.file.write("\n");
            log.file.flush();
        }
    }

    // Warnings and errors go to stderr so they stay visible when stdout is piped.
    const bool problem = type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
    std::FILE* console = problem ? stderr : stdout;
    std::fprintf(console, "%s\n", line.constData());
    std::fflush(console);

    if (type == QtFatalMsg) {
        std::abort();
    }
}

QString logDirectoryFor(const LoggingOptions& options) {
    if (!options.logDirectory.trimmed().isEmpty()) {
        return options.logDirectory;
    }
    if (const auto fromEnvironment = env::value("PARTCAD_LOG_DIR")) {
        return *fromEnvironment;
    }
    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return QDir(appData.isEmpty() ? QDir::currentPath() : appData).filePath(QStringLiteral("logs"));
}

// Removes run logs past the retention window, then trims to the newest kMaxRunLogFiles.
void pruneRunLogs(const QDir& dir, const QString& keep) {
    const QDateTime cutoff = QDateTime::currentDateTime().addDays(-kLogRetentionDays);
    const QFileInfoList newestFirst =
        dir.entryInfoList(QStringList{QStringLiteral("*.log")}, QDir::Files, QDir::Time);
    int kept = 0;
    for (const QFileInfo& info : newestFirst) {
        const bool current = info.absoluteFilePath() == keep;
        const bool expired = info.lastModified().isValid() && info.lastModified() < cutoff;
        if (!current && (expired || kept >= kMaxRunLogFiles)) {
            QFile::remove(info.absoluteFilePath());
        } else {
            ++kept;
        }
    }
}

// Opens <dir>/<app>_<timestamp>_<pid>.log. On failure the reason is left in
// @p error and the file stays closed.
bool openRunLog(QFile& file, const LoggingOptions& options, QString& error) {
    const QString directory = logDirectoryFor(options);
    QDir dir(directory);
    if (!dir.mkpath(QStringLiteral("."))) {
        error = QStringLiteral("cannot create log directory %1").arg(directory);
        return false;
    }

    const QString fileName = QStringLiteral("%1_%2_%3.log")
                                 .arg(options.appName.toLower(),
                                      QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz")))
                                 .arg(QCoreApplication::applicationPid());
    file.setFileName(dir.absoluteFilePath(fileName));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        error = QStringLiteral("cannot open log file %1: %2").arg(file.fileName(), file.errorString());
        file.setFileName(QString());
        return false;
    }
    return true;
}

} // namespace

bool Logging::initialize(const LoggingOptions& options) {
    LogState& log = state();
    QString fileError;
    QString logFile;
    {
        QMutexLocker lock(&log.mutex);
        if (log.installed) {
            return true;
        }

        log.debugEnabled = options.debug || env::flag("PARTCAD_LOG_DEBUG").value_or(false);
        QLoggingCategory::setFilterRules(buildFilterRules(log.debugEnabled));

        if (options.writeFile && openRunLog(log.file, options, fileError)) {
            logFile = log.file.fileName();
        }

        log.previousHandler = qInstallMessageHandler(handleMessage);
        log.installed = true;
    }

    const bool fileOk = fileError.isEmpty();
    if (!fileOk) {
        qWarning().noquote() << "File logging disabled, console only" << "reason=" << fileError;
    }
    qInfo().noquote() << "Logging initialized"
                      << "app=" << options.appName
                      << "logFile=" << (logFile.isEmpty() ? QStringLiteral("<none>") : logFile)
                      << "debugLogsEnabled=" << log.debugEnabled;

    if (!logFile.isEmpty()) {
        pruneRunLogs(QFileInfo(logFile).absoluteDir(), logFile);
    }
    return fileOk;
}

void Logging::shutdown() {
    LogState& log = state();
    {
        QMutexLocker lock(&log.mutex);
        if (!log.installed) {
            return;
        }
    }

    qInfo().noquote() << "Logging shutdown" << "logFile=" << logFilePath();

    QMutexLocker lock(&log.mutex);
    qInstallMessageHandler(log.previousHandler);
    log.previousHandler = nullptr;
    if (log.file.isOpen()) {
        log.file.close();
    }
    log.file.setFileName(QString());
    log.installed = false;
    log.debugEnabled = false;
}

QString Logging::logFilePath() {
    LogState& log = state();
    QMutexLocker lock(&log.mutex);
    return log.file.isOpen() ? log.file.fileName() : QString();
}

bool Logging::isDebugLoggingEnabled() {
    LogState& log = state();
    QMutexLocker lock(&log.mutex);
    return log.debugEnabled;
}

} // namespace partcad::app
