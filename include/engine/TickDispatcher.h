#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace zonerisk {
namespace engine {

// The single tick context. Every zone mutation (touch appends, cycle reconcile)
// is serialized through this strand; handlers run in post order.
class TickDispatcher {
public:
    using Task = std::function<void()>;

    TickDispatcher();
    ~TickDispatcher();

    TickDispatcher(const TickDispatcher&) = delete;
    TickDispatcher& operator=(const TickDispatcher&) = delete;

    bool start();
    // Drains queued handlers, then joins the worker.
    void stop();

    bool isRunning() const;

    // Fire-and-forget. Runs inline before the first start; dropped once stop begins.
    void post(Task task);

    // Runs on the tick context and waits for the result; rethrows the task's exception.
    // When the dispatcher is not running the task runs inline, after any stop in
    // progress has joined the worker.
    template <typename F>
    auto runSync(F&& fn) -> decltype(fn()) {
        using R = decltype(fn());
        if (strand_.running_in_this_thread()) {
            return fn();
        }
        std::unique_lock<std::mutex> lock(state_mutex_);
        stopped_cv_.wait(lock, [this]() { return state_ != State::STOPPING; });
        if (state_ != State::RUNNING) {
            lock.unlock();
            return fn();
        }
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto result = task->get_future();
        boost::asio::post(strand_, [task]() { (*task)(); });
        lock.unlock();
        return result.get();
    }

private:
    void runTask(const Task& task);

    boost::asio::io_context io_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;

    enum class State { IDLE, RUNNING, STOPPING, STOPPED };
    mutable std::mutex state_mutex_;
    std::condition_variable stopped_cv_;
    State state_ = State::IDLE;     // guarded by state_mutex_
    std::thread worker_thread_;
};

} // namespace engine
} // namespace zonerisk
