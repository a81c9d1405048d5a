#include "ErrorHandling.h"
#include "Logger.h"

#include <QFileInfo>

namespace {

QString titled(const QString& title, const QString& message) {
    return title.isEmpty() ? message : QString("%1 - %2").arg(title, message);
}

} // namespace

void reportUserError(const QString& title, const QString& message) {
    Logger::error(titled(title, message), "User");
}

void reportWarning(const QString& title, const QString& message) {
    Logger::warning(titled(title, message), "User");
}

void reportInfo(const QString& title, const QString& message) {
    Logger::info(titled(title, message), "User");
}

bool validateFileExists(const QString& path, QString* error) {
    if (path.isEmpty()) {
        if (error) *error = "File path cannot be empty";
        return false;
    }

    const QFileInfo info(path);
    if (!info.exists()) {
        if (error) *error = formatError("File not found", path, QString());
        return false;
    }
    if (!info.isFile() || !info.isReadable()) {
        if (error) *error = formatError("Cannot read file", path, QString());
        return false;
    }
    return true;
}
