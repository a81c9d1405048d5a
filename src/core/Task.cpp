#include "Task.h"
#include "ThreadState.h"

namespace Threading {

std::atomic<bool> ThreadState::s_stop { false };

namespace {
std::atomic<Task::Id> nextTaskId { 1 };
}

Task::Task(const QString& label, QObject* parent)
    : QObject(parent)
    , m_id(nextTaskId.fetch_add(1, std::memory_order_relaxed))
    , m_label(label)
{
    setAutoDelete(false);
}

bool Task::isFinished() const noexcept
{
    const Status s = status();
    return s != Status::Queued && s != Status::Running;
}

bool Task::shouldContinue() const noexcept
{
    return !isCancelled() && ThreadState::shouldRun();
}

void Task::finish(Status status)
{
    m_status.store(status, std::memory_order_release);
}

void Task::run()
{
    Status expected = Status::Queued;
    if (!m_status.compare_exchange_strong(expected, Status::Running, std::memory_order_acq_rel)) {
        return;
    }
    if (!shouldContinue()) {
        finish(Status::Cancelled);
        emit cancelled(m_id);
        return;
    }

    QString error;
    try {
        execute();
    } catch (const std::exception& ex) {
        error = QString::fromUtf8(ex.what());
    } catch (...) {
        error = QString("%1 raised a non-standard exception").arg(m_label);
    }

    if (!error.isEmpty()) {
        finish(Status::Failed);
        emit failed(m_id, error);
    } else if (!shouldContinue()) {
        finish(Status::Cancelled);
        emit cancelled(m_id);
    } else {
        finish(Status::Done);
        emit finished(m_id);
    }
}

void FunctionTask::execute()
{
    if (m_body) m_body([this]() { return shouldContinue(); });
}

} // namespace Threading
