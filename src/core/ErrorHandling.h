#ifndef ERRORHANDLING_H
#define ERRORHANDLING_H

#include "Errors.h"

#include <QString>
#include <exception>
#include <optional>
#include <utility>

/**
 * @brief Error plumbing between the image core and its callers
 *
 * The core throws Quasar::Error subclasses (core/Errors.h). Boundaries do not:
 *
 * 1. File I/O returns bool and fills an optional QString* errorMsg.
 * 2. Tool runs and the external editor hand back a Result<T>.
 * 3. Background jobs report through Task::failed / ToolSession::failed.
 *
 * Conditions such as "nothing to do" are not errors and go to reportInfo().
 */

/**
 * @brief "operation: context (error N)", used for CFITSIO status codes
 */
inline QString formatError(const QString& operation, const QString& context, int errorCode) {
    return QString("%1: %2 (error %3)").arg(operation, context, QString::number(errorCode));
}

/**
 * @brief "operation: context - reason", or "operation: context" without a reason
 */
inline QString formatError(const QString& operation, const QString& context, const QString& reason) {
    if (reason.isEmpty()) return QString("%1: %2").arg(operation, context);
    return QString("%1: %2 - %3").arg(operation, context, reason);
}

/**
 * @brief Value or error message, for results crossing a thread or process boundary
 */
template<typename T>
class Result {
public:
    explicit Result(T value) : m_value(std::move(value)) {}

    static Result failure(const QString& error) { return Result(error, 0); }
    static Result failure(const Quasar::Error& error) { return Result(error.message(), 0); }

    /// Keeps the exception that caused the failure so the receiver can rethrow it with its type.
    static Result failure(const QString& error, std::exception_ptr cause) {
        Result r(error, 0);
        r.m_cause = std::move(cause);
        return r;
    }

    bool isSuccess() const { return m_value.has_value(); }
    bool isError() const { return !m_value.has_value(); }
    explicit operator bool() const { return isSuccess(); }

    const T& value() const {
        Q_ASSERT(isSuccess());
        return *m_value;
    }

    T take() {
        Q_ASSERT(isSuccess());
        return std::move(*m_value);
    }

    const QString& error() const { return m_error; }

    bool hasCause() const { return static_cast<bool>(m_cause); }
    void rethrowCause() const {
        if (m_cause) std::rethrow_exception(m_cause);
    }

private:
    Result(const QString& error, int) : m_error(error) {}

    std::optional<T> m_value;
    QString m_error;
    std::exception_ptr m_cause;
};

/**
 * @brief Runs a cleanup callable when leaving scope (CFITSIO handles, temp files)
 */
template<typename CleanupFunc>
class ScopeGuard {
public:
    explicit ScopeGuard(CleanupFunc func) : m_cleanup(std::move(func)) {}
    ~ScopeGuard() { if (m_armed) m_cleanup(); }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    void dismiss() { m_armed = false; }

private:
    CleanupFunc m_cleanup;
    bool m_armed = true;
};

// Messages for the person running the session, logged under "User"
void reportUserError(const QString& title, const QString& message);
void reportWarning(const QString& title, const QString& message);
void reportInfo(const QString& title, const QString& message);

/// False with a message when 'path' is empty, missing, or unreadable.
bool validateFileExists(const QString& path, QString* error = nullptr);

#endif // ERRORHANDLING_H
