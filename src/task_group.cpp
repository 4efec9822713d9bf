#include "task_group.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace papernotes {

// ── CancelToken ──────────────────────────────────────────────

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken CancelToken::with_deadline(Clock::duration budget) {
    CancelToken token;
    token.state_->deadline = Clock::now() + budget;
    return token;
}

void CancelToken::cancel() const {
    state_->cancelled.store(true);
}

bool CancelToken::cancelled() const {
    if (state_->cancelled.load()) return true;
    if (state_->deadline && Clock::now() >= *state_->deadline) {
        state_->cancelled.store(true);
        return true;
    }
    return false;
}

long CancelToken::remaining_seconds(long fallback) const {
    if (!state_->deadline) return fallback;
    auto left = std::chrono::duration_cast<std::chrono::seconds>(
        *state_->deadline - Clock::now()).count();
    long secs = std::max<long>(1, static_cast<long>(left));
    return std::min(secs, fallback);
}

// ── WorkerPool ───────────────────────────────────────────────

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        size_t hw = std::max<size_t>(1, std::thread::hardware_concurrency());
        threads = std::clamp<size_t>(hw, 2, 8);
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() { run(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::run() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return done_ || !queue_.empty(); });
            if (done_ && queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop();
        }
        // Jobs are packaged_tasks: exceptions land in their futures
        job();
    }
}

// ── TaskGroup ────────────────────────────────────────────────

TaskGroup::TaskGroup(WorkerPool& pool, CancelToken token, std::string name)
    : pool_(pool), token_(std::move(token)), name_(std::move(name)) {}

TaskGroup::~TaskGroup() {
    wait();
}

void TaskGroup::spawn(std::string label, std::function<void()> fn) {
    CancelToken token = token_;
    auto done = pool_.submit([token, fn = std::move(fn)]() {
        if (token.cancelled()) return;
        fn();
    });
    children_.push_back(Child{std::move(label), std::move(done)});
}

size_t TaskGroup::wait() {
    size_t failures = 0;
    for (auto& child : children_) {
        if (!child.done.valid()) continue;
        try {
            child.done.get();
        } catch (const std::exception& e) {
            failures++;
            std::cerr << "[" << name_ << "] " << child.label << " failed: " << e.what() << "\n";
        } catch (...) {
            failures++;
            std::cerr << "[" << name_ << "] " << child.label
                      << " failed with a non-standard exception\n";
        }
    }
    children_.clear();
    return failures;
}

} // namespace papernotes
