#include "event_thread_pool.h"
#include "logger.h"
#include <algorithm>
#include <exception>

EventThreadPool::EventThreadPool(size_t num_workers)
    : m_num_workers(num_workers > 0 ? num_workers : std::max(1u, std::thread::hardware_concurrency())),
      m_queues(m_num_workers),
      m_queue_mutexes(m_num_workers),
      m_queue_cvs(m_num_workers),
      m_running(true),
      m_round_robin_counter(0) {
    for (size_t i = 0; i < m_num_workers; ++i) {
        m_workers.emplace_back([this, i] { worker_loop(i); });
    }
}

EventThreadPool::~EventThreadPool() {
    shutdown(true);
}

bool EventThreadPool::submit(const std::string& key, Task task) {
    return enqueue(get_worker_id(key), std::move(task));
}

bool EventThreadPool::submit_any(Task task) {
    return enqueue(m_round_robin_counter.fetch_add(1) % m_num_workers, std::move(task));
}

bool EventThreadPool::enqueue(size_t worker_id, Task task) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutexes[worker_id]);
        if (!m_running) {
            return false;
        }
        m_queues[worker_id].push(std::move(task));
    }
    m_queue_cvs[worker_id].notify_one();
    return true;
}

void EventThreadPool::shutdown(bool blocking) {
    for (size_t i = 0; i < m_num_workers; ++i) {
        std::lock_guard<std::mutex> lock(m_queue_mutexes[i]);
        m_running = false;
        if (!blocking) {
            std::queue<Task> empty;
            m_queues[i].swap(empty);
        }
    }

    for (auto& cv : m_queue_cvs) {
        cv.notify_all();
    }

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            if (worker.get_id() == std::this_thread::get_id()) {
                // shutdown from inside a task: the worker exits on its own
                worker.detach();
            } else {
                worker.join();
            }
        }
    }
    m_workers.clear();
}

size_t EventThreadPool::pending_tasks() const {
    size_t total = 0;
    for (size_t i = 0; i < m_num_workers; ++i) {
        std::lock_guard<std::mutex> lock(m_queue_mutexes[i]);
        total += m_queues[i].size();
    }
    return total;
}

void EventThreadPool::worker_loop(size_t worker_id) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutexes[worker_id]);
            m_queue_cvs[worker_id].wait(lock, [this, worker_id] {
                return !m_queues[worker_id].empty() || !m_running;
            });

            // queued work is still drained after shutdown(true)
            if (m_queues[worker_id].empty()) {
                break;
            }
            task = std::move(m_queues[worker_id].front());
            m_queues[worker_id].pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("POOL: Task threw on worker ") + std::to_string(worker_id) + ": " + e.what());
        }
    }
}

size_t EventThreadPool::get_worker_id(const std::string& key) const {
    size_t hash_val = 0;
    for (char c : key) {
        hash_val = hash_val * 31 + static_cast<unsigned char>(c);
    }
    return hash_val % m_num_workers;
}
