#ifndef LITECDN_EVENT_THREAD_POOL_H
#define LITECDN_EVENT_THREAD_POOL_H

#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <functional>
#include <string>
#include <atomic>

/**
 * Multi-threaded task pool.
 *
 * Tasks submitted with the same key run on the same worker, in submission order.
 * submit_any() spreads tasks round-robin, so two of them may run concurrently and
 * complete in any order. The broker uses that to model out-of-order delivery.
 */
class EventThreadPool {
public:
    using Task = std::function<void()>;

    // num_workers == 0 picks the hardware concurrency
    explicit EventThreadPool(size_t num_workers = 0);
    ~EventThreadPool();

    EventThreadPool(const EventThreadPool&) = delete;
    EventThreadPool& operator=(const EventThreadPool&) = delete;

    // Returns false once the pool is shut down.
    bool submit(const std::string& key, Task task);
    bool submit_any(Task task);

    // Stops accepting tasks. blocking: run what is queued, then join the workers.
    void shutdown(bool blocking = true);

    size_t worker_count() const { return m_num_workers; }
    size_t pending_tasks() const;
    bool is_running() const { return m_running.load(); }

private:
    bool enqueue(size_t worker_id, Task task);
    void worker_loop(size_t worker_id);
    size_t get_worker_id(const std::string& key) const;

    size_t m_num_workers;
    std::vector<std::queue<Task>> m_queues;  // One queue per worker
    mutable std::vector<std::mutex> m_queue_mutexes;
    std::vector<std::condition_variable> m_queue_cvs;
    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_round_robin_counter;
};

#endif // LITECDN_EVENT_THREAD_POOL_H
