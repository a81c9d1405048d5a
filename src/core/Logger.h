#ifndef LOGGER_H
#define LOGGER_H

#include <QString>

/**
 * @brief Process-wide log for Quasar sessions
 *
 * Lines go to <logDir>/Quasar.log, appended across runs; the file is
 * archived as Quasar_<timestamp>.log once it grows large and only the newest
 * archives are kept. qDebug/qWarning output is captured too. Before init()
 * (and if the file cannot be opened) warnings and errors go to stderr.
 *
 * Line format: [yyyy-MM-dd HH:mm:ss.zzz] [LEVEL   ] [category] message
 *
 * Thread-safe; workers log from the tool pool.
 */
class Logger
{
public:
    enum Level {
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Fatal
    };

    /// Empty logDirPath uses <application dir>/logs.
    static void init(const QString& logDirPath = QString(), int maxLogFiles = 5);
    static void shutdown();
    static bool isInitialized();

    static void log(Level level, const QString& message, const QString& category = QString());

    static void debug(const QString& msg, const QString& cat = QString())    { log(Debug, msg, cat); }
    static void info(const QString& msg, const QString& cat = QString())     { log(Info, msg, cat); }
    static void warning(const QString& msg, const QString& cat = QString())  { log(Warning, msg, cat); }
    static void error(const QString& msg, const QString& cat = QString())    { log(Error, msg, cat); }
    static void critical(const QString& msg, const QString& cat = QString()) { log(Critical, msg, cat); }

    /// Messages below this level are dropped (Debug by default).
    static void setMinimumLevel(Level level);

    /// Also echo messages at or above this level to stderr while a file is open (Fatal: only fatal ones).
    static void setConsoleLevel(Level level);

    /// Active log file, empty when not initialized.
    static QString currentLogFile();

    static QString levelToString(Level level);

private:
    Logger() = delete;
};

#endif // LOGGER_H
