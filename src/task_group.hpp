#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace papernotes {

// Shared cancellation state for one pipeline run. Copies observe the same
// flag. A token with a deadline reports cancelled() once it has passed.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken();

    static CancelToken with_deadline(Clock::duration budget);

    void cancel() const;
    bool cancelled() const;

    // Whole seconds left before the deadline (at least 1), or `fallback`
    // when no deadline was set. Used to bound transport timeouts.
    long remaining_seconds(long fallback) const;

    // Raw flag for transports that poll an abort flag
    const std::atomic<bool>* flag() const { return &state_->cancelled; }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
    };
    std::shared_ptr<State> state_;
};

// Fixed set of worker threads consuming a FIFO job queue.
class WorkerPool {
public:
    // threads == 0 picks a default from hardware concurrency (2..8)
    explicit WorkerPool(size_t threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F, typename R = std::invoke_result_t<F&>>
    std::future<R> submit(F&& f) {
        // shared_ptr keeps the move-only packaged_task inside a copyable std::function
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        auto fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

    size_t size() const { return workers_.size(); }

private:
    void run();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
};

// Structured fan-out/join: children run on a pool and never outlive the
// group. A child that throws is logged and counted; the failure is not
// rethrown and does not cancel its siblings. Children spawned after the
// token is cancelled do not run.
class TaskGroup {
public:
    TaskGroup(WorkerPool& pool, CancelToken token, std::string name);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(std::string label, std::function<void()> fn);

    // Block until every child has finished. Returns the number of children
    // that ended with an exception since the previous wait().
    size_t wait();

    const CancelToken& token() const { return token_; }

private:
    struct Child {
        std::string label;
        std::future<void> done;
    };

    WorkerPool& pool_;
    CancelToken token_;
    std::string name_;
    std::vector<Child> children_;
};

} // namespace papernotes
