#ifndef QUASAR_TASK_H
#define QUASAR_TASK_H

#include <QObject>
#include <QRunnable>
#include <QString>
#include <atomic>
#include <functional>

namespace Threading {

/**
 * @brief A tool job run on the TaskManager pool (or inline with runHere()).
 *
 * The label names the tool for logs. Status goes Queued -> Running and ends
 * in Done, Failed or Cancelled; a task is never run twice. Exceptions thrown
 * by execute() are turned into failed(). The manager owns tasks through
 * shared_ptr, so autoDelete is off.
 */
class Task : public QObject, public QRunnable
{
    Q_OBJECT
    Q_DISABLE_COPY(Task)

public:
    using Id = quint64;

    enum class Status { Queued, Running, Done, Failed, Cancelled };
    Q_ENUM(Status)

    explicit Task(const QString& label, QObject* parent = nullptr);

    Id id() const noexcept { return m_id; }
    const QString& label() const { return m_label; }
    Status status() const noexcept { return m_status.load(std::memory_order_acquire); }
    bool isFinished() const noexcept;

    /// Ask the job to stop at its next shouldContinue() check.
    void cancel() { m_cancel.store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return m_cancel.load(std::memory_order_acquire); }

    /// Run the job on the calling thread; signals are emitted directly.
    void runHere() { run(); }

signals:
    void finished(quint64 id);
    void failed(quint64 id, const QString& message);
    void cancelled(quint64 id);

protected:
    virtual void execute() = 0;

    /// False once cancel() or a script stop was requested.
    bool shouldContinue() const noexcept;

private:
    void run() override final;
    void finish(Status status);

    const Id m_id;
    const QString m_label;
    std::atomic<Status> m_status { Status::Queued };
    std::atomic<bool> m_cancel { false };
};

/**
 * @brief Task whose body is a callable given the continuation check.
 */
class FunctionTask : public Task
{
    Q_OBJECT

public:
    using Body = std::function<void(const std::function<bool()>& shouldContinue)>;

    FunctionTask(const QString& label, Body body, QObject* parent = nullptr)
        : Task(label, parent), m_body(std::move(body)) {}

protected:
    void execute() override;

private:
    Body m_body;
};

} // namespace Threading

#endif // QUASAR_TASK_H
