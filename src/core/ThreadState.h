#ifndef QUASAR_THREADSTATE_H
#define QUASAR_THREADSTATE_H

#include <atomic>

namespace Threading {

/**
 * @brief Process-wide stop request raised when a script is cancelled.
 *
 * Running tool jobs poll it through Task::shouldContinue() next to their
 * own cancel flag, so a script cancel also stops the job it is waiting on.
 */
class ThreadState {
public:
    static bool stopRequested() { return s_stop.load(std::memory_order_acquire); }
    static bool shouldRun() { return !stopRequested(); }

    static void requestCancel() { s_stop.store(true, std::memory_order_release); }
    static void reset() { s_stop.store(false, std::memory_order_release); }

private:
    static std::atomic<bool> s_stop;
};

} // namespace Threading

#endif // QUASAR_THREADSTATE_H
