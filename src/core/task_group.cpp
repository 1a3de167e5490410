/**
 * @file task_group.cpp
 * @brief Реализация группы фоновых задач
 */

#include "task_group.hpp"

#include <vector>

namespace bundleminer {

bool sleep_for(std::stop_token stop, std::chrono::milliseconds duration) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

TaskGroup::TaskGroup(std::stop_token parent)
    : parent_callback_(std::move(parent), std::function<void()>([this] {
          stop_source_.request_stop();
      })) {}

TaskGroup::~TaskGroup() {
    stop();
}

void TaskGroup::spawn(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked();

    auto entry = std::make_unique<Entry>();
    Entry* raw = entry.get();
    ++running_;

    const std::stop_token token = stop_source_.get_token();
    raw->thread = std::jthread([this, raw, token, task = std::move(task)] {
        task(token);
        std::lock_guard<std::mutex> guard(mutex_);
        raw->done.store(true, std::memory_order_release);
        --running_;
        cv_.notify_all();
    });
    entries_.push_back(std::move(entry));
}

void TaskGroup::reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked();
}

void TaskGroup::reap_locked() {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if ((*it)->done.load(std::memory_order_acquire)) {
            // Поток уже вышел из задачи, join не блокируется надолго
            (*it)->thread.join();
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t TaskGroup::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void TaskGroup::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return running_ == 0; });
    reap_locked();
}

void TaskGroup::stop() {
    stop_source_.request_stop();

    // Задача может успеть запустить вложенную задачу, пока мы ждём
    while (true) {
        std::list<std::unique_ptr<Entry>> entries;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries.swap(entries_);
        }
        if (entries.empty()) {
            break;
        }
        // Join без блокировки: завершающиеся задачи захватывают mutex_
        for (auto& entry : entries) {
            if (entry->thread.joinable()) {
                entry->thread.join();
            }
        }
    }
}

} // namespace bundleminer
