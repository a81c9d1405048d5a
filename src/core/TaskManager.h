#ifndef QUASAR_TASKMANAGER_H
#define QUASAR_TASKMANAGER_H

#include "Task.h"

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QThreadPool>
#include <memory>

namespace Threading {

/**
 * @brief Pool that runs tool jobs in the background.
 *
 * Submitted tasks stay referenced until they report back. The pool is owned
 * by the manager rather than QThreadPool::globalInstance(), which stays free
 * for QtConcurrent statistics. Thread-safe.
 */
class TaskManager : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY(TaskManager)

public:
    static TaskManager& instance();

    /// 0 picks QThread::idealThreadCount().
    void init(int maxThreads = 0);
    int maxThreads() const { return m_pool.maxThreadCount(); }

    Task::Id submit(std::shared_ptr<Task> task);

    /// Unknown or finished ids are ignored.
    void cancel(Task::Id id);
    void cancelAll();

    /// Number of submitted tasks that have not reported back yet.
    int pendingCount() const;

    /// @return false on timeout; -1 waits forever.
    bool waitForAll(int msTimeout = -1);

private:
    TaskManager() = default;
    ~TaskManager() override;

    void release(Task::Id id);

    QThreadPool m_pool;
    mutable QMutex m_mutex;
    QHash<Task::Id, std::shared_ptr<Task>> m_tasks;
};

} // namespace Threading

#endif // QUASAR_TASKMANAGER_H
