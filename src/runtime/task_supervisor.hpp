#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolsrv::runtime {

struct TaskCompletion {
    std::string request_id;
    core::errors::Result<protocol::ToolResult> outcome;
};

// Runs each execute request on its own worker thread. Finished tasks are queued and
// announced by one byte on wake_fd(), so a poll() loop can pick them up.
class TaskSupervisor {
public:
    using Task = std::function<protocol::ToolResult()>;

    // Throws std::system_error when the wake pipe cannot be created.
    TaskSupervisor();
    ~TaskSupervisor();
    TaskSupervisor(const TaskSupervisor&) = delete;
    TaskSupervisor& operator=(const TaskSupervisor&) = delete;

    void launch(std::string request_id, Task task);

    // Completed tasks in completion order. Their worker threads are joined.
    std::vector<TaskCompletion> drain();

    // Blocks until at least one completion is queued or the timeout passes.
    bool wait_for_completion(std::chrono::milliseconds timeout);

    std::size_t in_flight() const;
    int wake_fd() const { return wake_read_fd_; }

private:
    struct Finished {
        std::uint64_t serial = 0;
        TaskCompletion completion;
    };

    void run_task(std::uint64_t serial, const std::string& request_id, const Task& task);

    mutable std::mutex mutex_;
    std::condition_variable completed_cv_;
    std::unordered_map<std::uint64_t, std::thread> workers_;
    std::vector<Finished> finished_;
    std::uint64_t next_serial_ = 1;
    int wake_read_fd_ = -1;
    int wake_write_fd_ = -1;
};

}  // namespace toolsrv::runtime
