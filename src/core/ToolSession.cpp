#include "ToolSession.h"
#include "Logger.h"
#include "TaskManager.h"

ToolSession::ToolSession(const ImageBuffer& reference, const QString& toolName, QObject* parent)
    : QObject(parent)
    , m_toolName(toolName)
    , m_reference(std::make_shared<const ImageBuffer>(reference))
    , m_current(reference)
{
}

ToolSession::~ToolSession()
{
    if (m_running) Threading::TaskManager::instance().cancel(m_taskId);
}

std::shared_ptr<Threading::FunctionTask> ToolSession::makeTask(const Job& job,
                                                              const std::shared_ptr<std::optional<ImageBuffer>>& slot)
{
    // The body only captures shared state, never the session itself
    std::shared_ptr<const ImageBuffer> reference = m_reference;
    auto task = std::make_shared<Threading::FunctionTask>(m_toolName,
        [job, reference, slot](const ContinueCheck& shouldContinue) {
            ImageBuffer result = job(*reference, shouldContinue);
            if (shouldContinue()) *slot = std::move(result);
        });

    const quint64 run = m_run;
    connect(task.get(), &Threading::Task::finished, this,
            [this, run, slot](quint64 tid) { onTaskFinished(tid, run, slot); });
    connect(task.get(), &Threading::Task::failed, this,
            [this](quint64 tid, const QString& msg) { onTaskFailed(tid, msg); });
    connect(task.get(), &Threading::Task::cancelled, this,
            [this](quint64 tid) { onTaskCancelled(tid); });
    return task;
}

bool ToolSession::start(Job job)
{
    if (!m_open) {
        Logger::warning(QString("%1: session is closed, run rejected").arg(m_toolName), "Tool");
        return false;
    }
    if (m_running) {
        Logger::warning(QString("%1: a run is already in progress, run rejected").arg(m_toolName), "Tool");
        return false;
    }

    ++m_run;
    m_running = true;
    auto slot = std::make_shared<std::optional<ImageBuffer>>();
    auto task = makeTask(job, slot);
    m_taskId = Threading::TaskManager::instance().submit(task);
    Logger::info(QString("%1: run %2 started (task %3)").arg(m_toolName).arg(m_run).arg(m_taskId), "Tool");
    return true;
}

Result<ImageBuffer> ToolSession::runSynchronously(const Job& job)
{
    if (!m_open) return Result<ImageBuffer>::failure("Tool session is closed");
    if (m_running) return Result<ImageBuffer>::failure("A tool run is already in progress");

    ++m_run;
    m_running = true;
    auto slot = std::make_shared<std::optional<ImageBuffer>>();
    auto cause = std::make_shared<std::exception_ptr>();
    const Job recording = [job, cause](const ImageBuffer& reference, const ContinueCheck& shouldContinue) {
        try {
            return job(reference, shouldContinue);
        } catch (...) {
            *cause = std::current_exception();
            throw;
        }
    };
    auto task = makeTask(recording, slot);
    m_taskId = task->id();

    QString error;
    QMetaObject::Connection errConn = connect(task.get(), &Threading::Task::failed, this,
                                              [&error](quint64, const QString& msg) { error = msg; });
    task->runHere();
    disconnect(errConn);

    if (!error.isEmpty()) return Result<ImageBuffer>::failure(error, *cause);
    if (!slot->has_value()) return Result<ImageBuffer>::failure("Tool run was cancelled");
    return Result<ImageBuffer>(m_current);
}

void ToolSession::cancel()
{
    ++m_run;
    if (m_running) {
        Threading::TaskManager::instance().cancel(m_taskId);
    }
    m_current = *m_reference;
    Logger::info(QString("%1: cancelled, image restored").arg(m_toolName), "Tool");
}

void ToolSession::close()
{
    if (!m_open) return;
    ++m_run;
    if (m_running) {
        Threading::TaskManager::instance().cancel(m_taskId);
    }
    m_open = false;
    Logger::info(QString("%1: session closed").arg(m_toolName), "Tool");
}

void ToolSession::onTaskFinished(quint64 taskId, quint64 run, const std::shared_ptr<std::optional<ImageBuffer>>& slot)
{
    if (taskId == m_taskId) m_running = false;
    if (run != m_run || !m_open || !slot->has_value()) {
        Logger::debug(QString("%1: discarding result of run %2").arg(m_toolName).arg(run), "Tool");
        emit discarded();
        return;
    }
    m_current = std::move(**slot);
    Logger::info(QString("%1: run %2 finished").arg(m_toolName).arg(run), "Tool");
    emit applied();
}

void ToolSession::onTaskFailed(quint64 taskId, const QString& message)
{
    if (taskId == m_taskId) m_running = false;
    reportWarning(QString("%1 failed").arg(m_toolName), message);
    emit failed(message);
}

void ToolSession::onTaskCancelled(quint64 taskId)
{
    if (taskId == m_taskId) m_running = false;
    emit discarded();
}
