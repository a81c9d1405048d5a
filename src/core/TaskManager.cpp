#include "TaskManager.h"
#include "Errors.h"
#include "Logger.h"

#include <QMutexLocker>
#include <QThread>
#include <algorithm>

namespace Threading {

TaskManager& TaskManager::instance()
{
    static TaskManager manager;
    return manager;
}

TaskManager::~TaskManager()
{
    cancelAll();
    m_pool.waitForDone(5000);
}

void TaskManager::init(int maxThreads)
{
    const int n = maxThreads > 0 ? maxThreads : std::max(1, QThread::idealThreadCount());
    m_pool.setMaxThreadCount(n);
    Logger::info(QString("Tool pool: %1 thread(s)").arg(n), "Threading");
}

Task::Id TaskManager::submit(std::shared_ptr<Task> task)
{
    if (!task) {
        throw Quasar::InvalidArgumentError("Cannot submit a null task");
    }
    if (task->status() != Task::Status::Queued) {
        throw Quasar::InvalidArgumentError(QString("Task %1 was already run").arg(task->label()));
    }

    const Task::Id id = task->id();
    {
        QMutexLocker lk(&m_mutex);
        m_tasks.insert(id, task);
    }

    // Emitted on a pool thread, queued back to the manager's thread
    const QString label = task->label();
    connect(task.get(), &Task::finished, this, [this](quint64 tid) { release(tid); });
    connect(task.get(), &Task::cancelled, this, [this, label](quint64 tid) {
        Logger::debug(QString("%1 (task %2) cancelled").arg(label).arg(tid), "Threading");
        release(tid);
    });
    connect(task.get(), &Task::failed, this, [this, label](quint64 tid, const QString& err) {
        Logger::warning(QString("%1 (task %2) failed: %3").arg(label).arg(tid).arg(err), "Threading");
        release(tid);
    });

    m_pool.start(task.get());
    return id;
}

void TaskManager::cancel(Task::Id id)
{
    QMutexLocker lk(&m_mutex);
    const auto it = m_tasks.constFind(id);
    if (it != m_tasks.constEnd()) it.value()->cancel();
}

void TaskManager::cancelAll()
{
    QMutexLocker lk(&m_mutex);
    for (const auto& task : std::as_const(m_tasks)) task->cancel();
}

int TaskManager::pendingCount() const
{
    QMutexLocker lk(&m_mutex);
    return static_cast<int>(m_tasks.size());
}

void TaskManager::release(Task::Id id)
{
    QMutexLocker lk(&m_mutex);
    m_tasks.remove(id);
}

bool TaskManager::waitForAll(int msTimeout)
{
    return m_pool.waitForDone(msTimeout);
}

} // namespace Threading
