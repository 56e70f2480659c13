#include "helpers/test_helpers.h"

#include <atomic>
#include <cstdlib>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace test_utils
{

namespace
{
std::atomic<int> g_counter{0};
}

TempRuntimeDir::TempRuntimeDir()
{
    path_ = fs::temp_directory_path() /
            ("solo_tests_" + std::to_string(::getpid()) + "_" + std::to_string(g_counter++));
    fs::remove_all(path_);
    fs::create_directories(path_);
}

TempRuntimeDir::~TempRuntimeDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string unique_identity(const std::string &prefix)
{
    return prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(g_counter++);
}

void EventRecorder::attach(solo::EventDispatcher &events)
{
    events.onNewInstance([this] { push("new"); });
    events.onNewInstanceWithMessage([this](const std::string &msg) { push("msg:" + msg); });
}

void EventRecorder::push(std::string event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

bool EventRecorder::wait_for(size_t count, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return events_.size() >= count; });
}

std::vector<std::string> EventRecorder::events() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

pid_t fork_worker(const std::function<int()> &fn)
{
    pid_t pid = ::fork();
    if (pid == 0)
    {
        int code = 127;
        try
        {
            code = fn();
        }
        catch (const std::exception &)
        {
            code = 126;
        }
        ::_exit(code);
    }
    return pid;
}

int wait_for_worker_and_get_exit_code(pid_t pid)
{
    int status = 0;
    if (::waitpid(pid, &status, 0) == -1)
    {
        return -1;
    }
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    return -1;
}

bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
        {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

size_t thread_count()
{
    size_t count = 0;
    std::error_code ec;
    for (fs::directory_iterator it("/proc/self/task", ec), end; !ec && it != end; it.increment(ec))
    {
        ++count;
    }
    return count;
}

} // namespace test_utils
