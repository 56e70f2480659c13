#ifndef SOLO_LISTENER_TASK_HPP
#define SOLO_LISTENER_TASK_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace solo {

// Owns at most one background jthread. The thread receives a stop token that
// is triggered by stop() or destruction.
class ListenerTask {
public:
    ListenerTask() = default;
    ~ListenerTask();

    // Runs body in a managed jthread. Throws std::logic_error if a previous
    // body is still running.
    void start(std::function<void(std::stop_token)> body);

    // Requests stop and waits for the thread to finish. From inside the
    // thread itself this only requests stop.
    void stop();

    // True while a body is executing.
    bool running() const { return active_; }

    ListenerTask(const ListenerTask&) = delete;
    ListenerTask& operator=(const ListenerTask&) = delete;

private:
    std::jthread thread_;
    std::atomic<bool> active_{false};
    std::mutex mutex_;
};

} // namespace solo

#endif // SOLO_LISTENER_TASK_HPP
