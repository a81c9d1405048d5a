#include "Logger.h"
#include "Version.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRecursiveMutex>
#include <QStringConverter>
#include <QTextStream>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>

namespace {

// The active log is archived at startup once it is larger than this
constexpr qint64 kArchiveBytes = 8 * 1024 * 1024;

struct LogState {
    QRecursiveMutex mutex;
    std::unique_ptr<QFile> file;
    std::unique_ptr<QTextStream> stream;
    QString directory;
    QString path;
    int maxArchives = 5;
    Logger::Level minimumLevel = Logger::Debug;
    Logger::Level consoleLevel = Logger::Fatal;
    QtMessageHandler previousHandler = nullptr;
};

LogState& state()
{
    static LogState s;
    return s;
}

QString banner(const QString& what)
{
    const QString rule(80, '=');
    return QString("%1\nQuasar %2 - %3 %4\n%1\n")
        .arg(rule, Quasar::getVersion(), what, QDateTime::currentDateTime().toString(Qt::ISODate));
}

void archiveIfLarge(const LogState& s)
{
    const QFileInfo active(s.path);
    if (!active.exists() || active.size() < kArchiveBytes) return;

    const QString archived = QString("%1/Quasar_%2.log")
        .arg(s.directory, QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss"));
    if (!QFile::rename(s.path, archived)) {
        std::cerr << "Cannot archive log file " << s.path.toStdString() << std::endl;
        return;
    }

    // Newest first
    QFileInfoList archives = QDir(s.directory).entryInfoList({ "Quasar_*.log" }, QDir::Files, QDir::Time);
    while (archives.size() > s.maxArchives) {
        QFile::remove(archives.takeLast().absoluteFilePath());
    }
}

void qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    Logger::Level level = Logger::Info;
    switch (type) {
        case QtDebugMsg:    level = Logger::Debug; break;
        case QtInfoMsg:     level = Logger::Info; break;
        case QtWarningMsg:  level = Logger::Warning; break;
        case QtCriticalMsg: level = Logger::Critical; break;
        case QtFatalMsg:    level = Logger::Fatal; break;
    }

    QString category;
    if (context.category && std::strcmp(context.category, "default") != 0) {
        category = QString::fromUtf8(context.category);
    }
    Logger::log(level, msg, category);

    if (type == QtFatalMsg) {
        Logger::shutdown();
        std::abort();
    }
}

} // namespace

void Logger::init(const QString& logDirPath, int maxLogFiles)
{
    LogState& s = state();
    QMutexLocker locker(&s.mutex);
    if (s.file) return;

    s.maxArchives = std::max(1, maxLogFiles);
    s.directory = logDirPath.isEmpty() ? QCoreApplication::applicationDirPath() + "/logs" : logDirPath;

    if (!QDir().mkpath(s.directory)) {
        std::cerr << "Cannot create log directory " << s.directory.toStdString() << std::endl;
        return;
    }

    s.path = s.directory + "/Quasar.log";
    archiveIfLarge(s);

    auto file = std::make_unique<QFile>(s.path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Append)) {
        std::cerr << "Cannot open log file " << s.path.toStdString() << std::endl;
        s.path.clear();
        return;
    }
    s.file = std::move(file);
    s.stream = std::make_unique<QTextStream>(s.file.get());
    s.stream->setEncoding(QStringConverter::Utf8);
    *s.stream << banner("started") << "\n";
    s.stream->flush();

    s.previousHandler = qInstallMessageHandler(qtMessageHandler);

    log(Info, QString("Logging to %1").arg(s.path), "Logger");
}

void Logger::shutdown()
{
    LogState& s = state();
    QMutexLocker locker(&s.mutex);
    if (!s.file) return;

    qInstallMessageHandler(s.previousHandler);
    s.previousHandler = nullptr;

    *s.stream << "\n" << banner("ended");
    s.stream->flush();
    s.stream.reset();
    s.file->close();
    s.file.reset();
}

bool Logger::isInitialized()
{
    LogState& s = state();
    QMutexLocker locker(&s.mutex);
    return s.file != nullptr;
}

void Logger::log(Level level, const QString& message, const QString& category)
{
    LogState& s = state();
    QMutexLocker locker(&s.mutex);
    if (level < s.minimumLevel) return;

    const QString line = QString("[%1] [%2] %3%4")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz"))
        .arg(levelToString(level), -8)
        .arg(category.isEmpty() ? QString() : QString("[%1] ").arg(category))
        .arg(message);

    if (s.stream) {
        *s.stream << line << "\n";
        s.stream->flush();
        if (level >= s.consoleLevel) std::cerr << line.toStdString() << std::endl;
    } else if (level >= Warning) {
        std::cerr << line.toStdString() << std::endl;
    }
}

void Logger::setMinimumLevel(Level level)
{
    LogState& s = state();
    QMutexLocker locker(&s.mutex);
    s.minimumLevel = level;
}

void Logger::setConsoleLevel(Level level)
{
    LogState& s = state();
    QMutexLocker locker(&s.mutex);
    s.consoleLevel = level;
}

QString Logger::currentLogFile()
{
    LogState& s = state();
    QMutexLocker locker(&s.mutex);
    return s.file ? s.path : QString();
}

QString Logger::levelToString(Level level)
{
    switch (level) {
        case Debug:    return "DEBUG";
        case Info:     return "INFO";
        case Warning:  return "WARNING";
        case Error:    return "ERROR";
        case Critical: return "CRITICAL";
        case Fatal:    return "FATAL";
    }
    return "UNKNOWN";
}
