#ifndef QUASAR_TOOLSESSION_H
#define QUASAR_TOOLSESSION_H

#include "ErrorHandling.h"
#include "Task.h"
#include "../ImageBuffer.h"

#include <QObject>
#include <functional>
#include <memory>
#include <optional>

/**
 * @brief One run of an editing tool against a frozen reference image.
 *
 * The reference is a const snapshot shared with the worker; the current image
 * is owned by the session and only touched on the owner thread. A job always
 * computes from the reference, so re-running with new parameters never
 * compounds earlier results.
 *
 * Only one job may be in flight. Results reach the owner thread through a
 * queued signal and are applied only if the session is still open and the
 * run was not cancelled in the meantime.
 */
class ToolSession : public QObject
{
    Q_OBJECT

public:
    using ContinueCheck = std::function<bool()>;
    using Job = std::function<ImageBuffer(const ImageBuffer& reference, const ContinueCheck& shouldContinue)>;

    explicit ToolSession(const ImageBuffer& reference, const QString& toolName = "Tool", QObject* parent = nullptr);
    ~ToolSession() override;

    const ImageBuffer& reference() const { return *m_reference; }
    const ImageBuffer& current() const { return m_current; }
    const QString& toolName() const { return m_toolName; }

    bool isOpen() const { return m_open; }
    bool isRunning() const { return m_running; }

    /// Run 'job' on the task pool. Returns false if a run is already in flight or the session is closed.
    bool start(Job job);

    /// Same as start() on the calling thread; the result is also applied to current().
    Result<ImageBuffer> runSynchronously(const Job& job);

    /// Drop any in-flight result and restore current() from the reference.
    void cancel();

    /// Stop accepting results. Pending runs are cancelled.
    void close();

signals:
    void applied();
    void failed(const QString& message);
    void discarded();

private:
    std::shared_ptr<Threading::FunctionTask> makeTask(const Job& job, const std::shared_ptr<std::optional<ImageBuffer>>& slot);
    void onTaskFinished(quint64 taskId, quint64 run, const std::shared_ptr<std::optional<ImageBuffer>>& slot);
    void onTaskFailed(quint64 taskId, const QString& message);
    void onTaskCancelled(quint64 taskId);

    QString m_toolName;
    std::shared_ptr<const ImageBuffer> m_reference;
    ImageBuffer m_current;
    bool m_open = true;
    bool m_running = false;        // Until the task of m_taskId reports back
    quint64 m_run = 0;           // Bumped by start(), cancel() and close()
    Threading::Task::Id m_taskId = 0;
};

#endif // QUASAR_TOOLSESSION_H
