#include "consistency/owner_context.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <exception>

namespace quire::consistency {

OwnerContext::~OwnerContext() {
    stop();
}

void OwnerContext::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) return;
    running_ = true;
    stopping_ = false;
    worker_ = std::thread([this] { loop(); });
    worker_id_ = worker_.get_id();
}

void OwnerContext::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_) return;
        stopping_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lk(mu_);
    running_ = false;
    worker_id_ = std::thread::id{};
}

bool OwnerContext::is_running() const {
    std::lock_guard<std::mutex> lk(mu_);
    return running_ && !stopping_;
}

bool OwnerContext::post(Task task) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void OwnerContext::schedule_every(const std::string& name, std::chrono::milliseconds interval, Task task) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                                     [&](const Timer& t) { return t.name == name; }),
                      timers_.end());
        timers_.push_back(Timer{name, interval, Clock::now() + interval, std::move(task)});
    }
    cv_.notify_one();
}

bool OwnerContext::cancel_timer(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::remove_if(timers_.begin(), timers_.end(), [&](const Timer& t) { return t.name == name; });
    const bool found = it != timers_.end();
    timers_.erase(it, timers_.end());
    return found;
}

size_t OwnerContext::timer_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return timers_.size();
}

bool OwnerContext::is_owner_thread() const {
    std::lock_guard<std::mutex> lk(mu_);
    return running_ && std::this_thread::get_id() == worker_id_;
}

void OwnerContext::run_task(const Task& task, const char* what) {
    try {
        task();
    } catch (const std::exception& e) {
        qCCritical(quireConsistencyLog) << "OwnerContext:" << what << "threw:" << e.what();
    }
}

void OwnerContext::loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (true) {
        if (!queue_.empty()) {
            Task task = std::move(queue_.front());
            queue_.pop_front();
            lk.unlock();
            run_task(task, "task");
            lk.lock();
            continue;
        }

        if (stopping_) break;

        if (timers_.empty()) {
            cv_.wait(lk);
            continue;
        }

        auto next = std::min_element(timers_.begin(), timers_.end(), [](const Timer& a, const Timer& b) {
            return a.next_due < b.next_due;
        });
        const auto now = Clock::now();
        if (next->next_due > now) {
            cv_.wait_until(lk, next->next_due);
            continue;
        }

        next->next_due = now + next->interval;
        Task task = next->task;
        const std::string name = next->name;
        lk.unlock();
        run_task(task, name.c_str());
        lk.lock();
    }
}

} // namespace quire::consistency
