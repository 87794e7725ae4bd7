#include "runtime/task_supervisor.hpp"

#include <cerrno>
#include <exception>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolsrv::runtime {

using core::errors::ErrorCategory;
using core::errors::ToolError;

TaskSupervisor::TaskSupervisor() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2 for task wake-up");
    }
    wake_read_fd_ = fds[0];
    wake_write_fd_ = fds[1];
}

TaskSupervisor::~TaskSupervisor() {
    std::unordered_map<std::uint64_t, std::thread> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(workers_);
    }
    for (auto& entry : remaining) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }
    ::close(wake_read_fd_);
    ::close(wake_write_fd_);
}

void TaskSupervisor::launch(std::string request_id, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t serial = next_serial_++;
    // The worker blocks on mutex_ before publishing, so it is registered first.
    workers_.emplace(serial, std::thread([this, serial, id = std::move(request_id),
                                          body = std::move(task)]() {
                         run_task(serial, id, body);
                     }));
}

void TaskSupervisor::run_task(const std::uint64_t serial, const std::string& request_id,
                              const Task& task) {
    core::errors::Result<protocol::ToolResult> outcome =
        ToolError{ErrorCategory::Internal, "Task produced no result", "task_failed"};
    try {
        outcome = task();
    } catch (const std::exception& error) {
        LOG_ERROR("Task " + request_id + " failed: " + error.what());
        outcome = ToolError{ErrorCategory::Internal, error.what(), "task_failed"};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_.push_back(Finished{serial, TaskCompletion{request_id, std::move(outcome)}});
    }
    completed_cv_.notify_all();

    const char byte = 1;
    ssize_t written = 0;
    do {
        written = ::write(wake_write_fd_, &byte, 1);
    } while (written < 0 && errno == EINTR);
    // EAGAIN means the pipe already holds unread wake-ups, which is enough.
}

std::vector<TaskCompletion> TaskSupervisor::drain() {
    char sink[256];
    while (::read(wake_read_fd_, sink, sizeof(sink)) > 0) {
    }

    std::vector<Finished> finished;
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished.swap(finished_);
        for (const auto& item : finished) {
            auto it = workers_.find(item.serial);
            if (it != workers_.end()) {
                done.push_back(std::move(it->second));
                workers_.erase(it);
            }
        }
    }
    for (auto& worker : done) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::vector<TaskCompletion> completions;
    completions.reserve(finished.size());
    for (auto& item : finished) {
        completions.push_back(std::move(item.completion));
    }
    return completions;
}

bool TaskSupervisor::wait_for_completion(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return completed_cv_.wait_for(lock, timeout, [this] { return !finished_.empty(); });
}

std::size_t TaskSupervisor::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size() - finished_.size();
}

}  // namespace toolsrv::runtime
