#include "logger.h"
#include <mutex>
#include <string>
#include <iostream>
#include <queue>
#include <thread>
#include <memory>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cctype>
#include <condition_variable>
#include <atomic>

/**
 * @brief Tag prepended to every line.
 */
static std::string g_sessionId = "litecdn";

/**
 * @brief Protects the tag, the callback and synchronous output.
 */
static std::mutex g_logMutex;

static std::atomic<LogLevel> g_log_level(LogLevel::INFO);
static std::function<void(const std::string&)> g_log_callback;

static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static bool g_log_thread_running = false;
static std::unique_ptr<std::thread> g_log_thread;

static std::string timestamp_now() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms));
    return buf;
}

// Caller must hold g_logMutex.
static void write_line_locked(const std::string& line) {
    if (g_log_callback) {
        g_log_callback(line);
    } else {
        std::cerr << line << std::endl;
    }
}

void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

bool parse_log_level(const std::string& value, LogLevel& out) {
    std::string v = value;
    for (auto& c : v) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (v == "debug") { out = LogLevel::DEBUG; return true; }
    if (v == "info") { out = LogLevel::INFO; return true; }
    if (v == "warn" || v == "warning") { out = LogLevel::WARNING; return true; }
    if (v == "error") { out = LogLevel::ERROR; return true; }
    if (v == "none") { out = LogLevel::NONE; return true; }
    return false;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE: return "NONE";
    }
    return "?";
}

/**
 * @brief Background worker for async logging. Drains the queue before exiting.
 */
static void async_log_worker() {
    std::unique_lock<std::mutex> lock(g_log_queue_mutex);
    while (true) {
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });
        if (g_log_queue.empty() && !g_log_thread_running) {
            break;
        }

        std::queue<std::string> batch;
        batch.swap(g_log_queue);
        lock.unlock();
        {
            std::lock_guard<std::mutex> out_lock(g_logMutex);
            while (!batch.empty()) {
                write_line_locked(batch.front());
                batch.pop();
            }
        }
        lock.lock();
    }
}

void enable_async_logging() {
    if (g_async_logging_enabled.exchange(true)) return;

    std::lock_guard<std::mutex> lock(g_log_queue_mutex);
    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
}

void disable_async_logging() {
    if (!g_async_logging_enabled.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

static void emit(const std::string& line) {
    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            g_log_queue.push(line);
        }
        g_log_queue_cv.notify_one();
        return;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    write_line_locked(line);
}

static std::string current_tag() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_sessionId;
}

void nativeLog(const std::string& message) {
    emit(timestamp_now() + " [" + current_tag() + "] " + message);
}

void log_message(LogLevel level, const std::string& message) {
    emit(timestamp_now() + " [" + current_tag() + "] " + log_level_to_string(level) + " " + message);
}
