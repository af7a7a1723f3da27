#ifndef LITECDN_TIMER_QUEUE_H
#define LITECDN_TIMER_QUEUE_H

#include <functional>
#include <memory>

using TimerId = int;

class TimerQueueImpl;

/**
 * One thread serving one-shot and periodic timers.
 *
 * Callbacks run on the timer thread without any internal lock held, so they may
 * schedule or cancel timers (including their own). They should stay short; heavy
 * work belongs on an EventThreadPool.
 */
class TimerQueue {
public:
    using Task = std::function<void()>;

    TimerQueue();
    ~TimerQueue();

    void start();
    void stop();

    // Both return 0 if the queue is stopped.
    TimerId runAfter(int milliseconds, Task t);
    TimerId runEvery(int milliseconds, Task t);

    // After cancelTimer returns, the timer will not fire again. A callback that is
    // already running on the timer thread is allowed to finish.
    void cancelTimer(TimerId id);

    size_t pending() const;

private:
    std::unique_ptr<TimerQueueImpl> m_impl;
};

#endif // LITECDN_TIMER_QUEUE_H
