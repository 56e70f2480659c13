#include "solo/listener_task.hpp"
#include "solo/logger.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace solo {

void ListenerTask::start(std::function<void(std::stop_token)> body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        throw std::logic_error("Listener task is already running");
    }
    if (thread_.joinable()) {
        // Previous body returned on its own; reap it.
        thread_.join();
    }

    active_ = true;
    thread_ = std::jthread([this, body = std::move(body)](std::stop_token token) {
        try {
            body(token);
        } catch (const std::exception& e) {
            LOG_ERROR("Listener task ended with error: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR("Listener task ended with an unknown exception");
        }
        active_ = false;
    });
}

void ListenerTask::stop() {
    std::jthread finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) return;
        thread_.request_stop();
        if (thread_.get_id() == std::this_thread::get_id()) return;
        finished = std::move(thread_);
    }
    LOG_DEBUG("Waiting for listener thread to finish...");
    finished.join();
}

ListenerTask::~ListenerTask() {
    stop();
}

} // namespace solo
