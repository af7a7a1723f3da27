#include "timer_queue.h"
#include "logger.h"
#include <map>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <chrono>
#include <exception>

struct Timer {
    TimerId id;
    long long expirationMs;
    int intervalMs;   // 0 = one-shot
    TimerQueue::Task task;
};

static long long nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

class TimerQueueImpl {
public:
    TimerQueueImpl() : m_running(false), m_timerSeq(0), m_firingId(0), m_firingCancelled(false) {}

    ~TimerQueueImpl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(m_timerMutex);
        if (m_running) return;
        m_running = true;
        m_thread = std::thread([this]() { loop(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_timerMutex);
            if (!m_running) return;
            m_running = false;
            m_timers.clear();
        }
        m_cv.notify_all();
        if (m_thread.joinable()) {
            if (m_thread.get_id() == std::this_thread::get_id()) {
                m_thread.detach();
            } else {
                m_thread.join();
            }
        }
    }

    TimerId schedule(int ms, int intervalMs, TimerQueue::Task t) {
        std::lock_guard<std::mutex> lock(m_timerMutex);
        if (!m_running) return 0;
        TimerId id = ++m_timerSeq;
        Timer timer{id, nowMs() + (ms > 0 ? ms : 0), intervalMs, std::move(t)};
        m_timers.insert({timer.expirationMs, std::move(timer)});
        m_cv.notify_all();
        return id;
    }

    void cancelTimer(TimerId id) {
        if (id == 0) return;
        std::lock_guard<std::mutex> lock(m_timerMutex);
        if (m_firingId == id) {
            // periodic timer currently executing: do not reschedule it
            m_firingCancelled = true;
        }
        for (auto it = m_timers.begin(); it != m_timers.end(); ) {
            if (it->second.id == id) it = m_timers.erase(it);
            else ++it;
        }
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(m_timerMutex);
        return m_timers.size();
    }

private:
    void loop() {
        std::unique_lock<std::mutex> lock(m_timerMutex);
        while (m_running) {
            if (m_timers.empty()) {
                m_cv.wait(lock);
                continue;
            }

            long long now = nowMs();
            auto it = m_timers.begin();
            if (it->first > now) {
                m_cv.wait_for(lock, std::chrono::milliseconds(it->first - now));
                continue;
            }

            Timer t = std::move(it->second);
            m_timers.erase(it);
            m_firingId = t.id;
            m_firingCancelled = false;

            // Release lock before executing task so it can schedule/cancel timers
            lock.unlock();
            try {
                if (t.task) t.task();
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("TIMER: Timer ") + std::to_string(t.id) + " threw: " + e.what());
            }
            lock.lock();

            if (t.intervalMs > 0 && !m_firingCancelled && m_running) {
                t.expirationMs = nowMs() + t.intervalMs;
                m_timers.insert({t.expirationMs, std::move(t)});
            }
            m_firingId = 0;
        }
    }

    bool m_running;
    std::thread m_thread;
    mutable std::mutex m_timerMutex;
    std::condition_variable m_cv;
    std::multimap<long long, Timer> m_timers;
    TimerId m_timerSeq;
    TimerId m_firingId;
    bool m_firingCancelled;
};

TimerQueue::TimerQueue() : m_impl(std::make_unique<TimerQueueImpl>()) {}
TimerQueue::~TimerQueue() = default;
void TimerQueue::start() { m_impl->start(); }
void TimerQueue::stop() { m_impl->stop(); }
TimerId TimerQueue::runAfter(int ms, Task t) { return m_impl->schedule(ms, 0, std::move(t)); }
TimerId TimerQueue::runEvery(int ms, Task t) { return m_impl->schedule(ms, ms > 0 ? ms : 1, std::move(t)); }
void TimerQueue::cancelTimer(TimerId id) { m_impl->cancelTimer(id); }
size_t TimerQueue::pending() const { return m_impl->pending(); }
