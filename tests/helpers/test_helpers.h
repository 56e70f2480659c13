// tests/helpers/test_helpers.h
//
// Shared fixtures for the solo tests: private runtime directories, unique
// identities, event recording and forked worker processes.
#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

#include "solo/event_dispatcher.hpp"

namespace fs = std::filesystem;

namespace test_utils
{

// A fresh directory under the system temp dir, removed on destruction.
class TempRuntimeDir
{
public:
    TempRuntimeDir();
    ~TempRuntimeDir();

    TempRuntimeDir(const TempRuntimeDir &) = delete;
    TempRuntimeDir &operator=(const TempRuntimeDir &) = delete;

    const fs::path &path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

// Identity unique to this process and call.
std::string unique_identity(const std::string &prefix = "solo-test");

// Records dispatcher events as "new" and "msg:<payload>" in arrival order.
class EventRecorder
{
public:
    void attach(solo::EventDispatcher &events);

    // Waits until at least count events were recorded.
    bool wait_for(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5));
    std::vector<std::string> events() const;

private:
    void push(std::string event);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> events_;
};

// Forks a child that runs fn and leaves through _exit(fn()). No destructors
// run in the child, so objects inherited from the parent (held claims, bound
// sockets) are never released by it. Returns the child pid, or -1.
pid_t fork_worker(const std::function<int()> &fn);

// Blocks until pid exits; returns its exit code, or -1 if it did not exit
// normally.
int wait_for_worker_and_get_exit_code(pid_t pid);

// Threads in this process, from /proc/self/task.
size_t thread_count();

bool wait_until(const std::function<bool()> &pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(5));

} // namespace test_utils
