#include "engine/TickDispatcher.h"

#include "common/Logger.h"

namespace zonerisk {
namespace engine {

TickDispatcher::TickDispatcher()
    : strand_(boost::asio::make_strand(io_)) {}

TickDispatcher::~TickDispatcher() {
    stop();
}

bool TickDispatcher::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == State::RUNNING || state_ == State::STOPPING) {
        return false;
    }

    io_.restart();
    work_.emplace(boost::asio::make_work_guard(io_));
    state_ = State::RUNNING;
    worker_thread_ = std::thread([this]() { io_.run(); });
    return true;
}

void TickDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::RUNNING) {
            return;
        }
        // Handlers posted before this point are drained by io_.run().
        state_ = State::STOPPING;
        work_.reset();
    }

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = State::STOPPED;
    }
    stopped_cv_.notify_all();
}

bool TickDispatcher::isRunning() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == State::RUNNING;
}

void TickDispatcher::post(Task task) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (state_ == State::RUNNING) {
        boost::asio::post(strand_, [this, task = std::move(task)]() { runTask(task); });
        return;
    }
    if (state_ == State::IDLE) {
        lock.unlock();
        runTask(task);
        return;
    }
    LOG_DEBUG("tick dispatcher stopped, handler dropped");
}

void TickDispatcher::runTask(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        LOG_ERROR("tick handler failed: {}", e.what());
    }
}

} // namespace engine
} // namespace zonerisk
