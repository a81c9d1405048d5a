#ifndef QUASAR_CORE_ERRORS_H
#define QUASAR_CORE_ERRORS_H

#include <QString>
#include <stdexcept>
#include <string>

namespace Quasar {

/**
 * @brief Root of the exceptions thrown by the synchronous image core.
 *
 * Processing calls (ImageBuffer transforms, stretch constructors, history)
 * throw these; I/O and scripting boundaries convert them to the usual
 * bool + QString* errorMsg convention.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
    explicit Error(const QString& message)
        : std::runtime_error(message.toStdString()) {}

    QString message() const { return QString::fromUtf8(what()); }
};

/// Out-of-range numbers, contradictory bounds, negative factors, bad depth or extension.
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const QString& message) : Error(message) {}
};

/// Channel counts, sample types or frame layouts the core cannot represent.
class UnsupportedFormatError : public Error {
public:
    explicit UnsupportedFormatError(const QString& message) : Error(message) {}
};

/// PixelMath parse or evaluation failure.
class ExpressionError : public Error {
public:
    explicit ExpressionError(const QString& message) : Error(message) {}
};

class IOError : public Error {
public:
    explicit IOError(const QString& message)
        : Error("I/O error: " + message) {}
};

class ExternalProcessError : public Error {
public:
    explicit ExternalProcessError(const QString& message)
        : Error("External process error: " + message) {}
};

} // namespace Quasar

#endif // QUASAR_CORE_ERRORS_H
