#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace quire::consistency {

/**
 * OwnerContext - the single thread every store mutation runs on.
 *
 * Producers on any thread post tasks; the worker runs them one at a time
 * in posting order, interleaved with repeating timers. Tasks still
 * queued at stop() run before the worker exits.
 */
class OwnerContext {
public:
    using Task = std::function<void()>;

    OwnerContext() = default;
    ~OwnerContext();

    OwnerContext(const OwnerContext&) = delete;
    OwnerContext& operator=(const OwnerContext&) = delete;

    void start();   // spawn the worker
    void stop();    // drain, signal & join

    [[nodiscard]] bool is_running() const;

    /**
     * Queue a task. Returns false once stop() has begun.
     */
    bool post(Task task);

    /**
     * Queue a task and get its result. A task that is never run (posted
     * after stop) leaves the future with a broken promise.
     */
    template<typename F>
    [[nodiscard]] auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        auto future = task->get_future();
        post([task] { (*task)(); });
        return future;
    }

    /**
     * Run `task` on the worker every `interval`, first after one interval.
     * Replaces an existing timer with the same name.
     */
    void schedule_every(const std::string& name, std::chrono::milliseconds interval, Task task);

    bool cancel_timer(const std::string& name);

    [[nodiscard]] size_t timer_count() const;

    /**
     * True when called from the worker thread.
     */
    [[nodiscard]] bool is_owner_thread() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        std::string name;
        std::chrono::milliseconds interval;
        Clock::time_point next_due;
        Task task;
    };

    void loop();
    static void run_task(const Task& task, const char* what);

    std::thread worker_;
    std::thread::id worker_id_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::vector<Timer> timers_;
    bool running_ = false;
    bool stopping_ = false;
};

} // namespace quire::consistency
