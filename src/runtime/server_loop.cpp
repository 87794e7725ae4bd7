#include "runtime/server_loop.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolsrv::runtime {

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;

}  // namespace

std::string to_string(const ExitReason reason) {
    switch (reason) {
        case ExitReason::Shutdown:
            return "shutdown";
        case ExitReason::IdleTimeout:
            return "idle_timeout";
        case ExitReason::InputClosed:
            return "input_closed";
        case ExitReason::Signal:
            return "signal";
        default:
            return "unknown";
    }
}

ServerLoop::ServerLoop(core::config::ServerConfig config, const LoopChannels channels)
    : config_(std::move(config)),
      channels_(channels),
      resolver_(config_.workspace_root, config_.skills_root),
      host_(config_, resolver_, vault_),
      writer_(channels.output_fd),
      watchdog_(config_.idle_timeout_ms),
      dispatcher_(vault_, host_, supervisor_, watchdog_,
                  [this](const protocol::Response& response) { writer_.write(response); }) {}

void ServerLoop::flush_completions() {
    for (auto& completion : supervisor_.drain()) {
        dispatcher_.complete(std::move(completion));
    }
}

ExitReason ServerLoop::finish(const ExitReason reason) const {
    const std::size_t pending = supervisor_.in_flight();
    if (pending > 0) {
        LOG_INFO("Abandoning " + std::to_string(pending) + " in-flight execution(s) on " +
                 to_string(reason));
    }
    if (decoder_.buffered_bytes() > 0) {
        LOG_WARN("Discarding " + std::to_string(decoder_.buffered_bytes()) +
                 " bytes of an incomplete frame");
    }
    return reason;
}

ExitReason ServerLoop::run() {
    watchdog_.reset();
    std::vector<char> buffer(kReadChunkBytes);

    while (true) {
        flush_completions();
        if (watchdog_.expired()) {
            LOG_INFO("Idle for " + std::to_string(watchdog_.timeout_ms()) + " ms, exiting");
            return finish(ExitReason::IdleTimeout);
        }

        pollfd fds[3] = {
            {channels_.input_fd, POLLIN, 0},
            {supervisor_.wake_fd(), POLLIN, 0},
            {channels_.signal_fd, POLLIN, 0},
        };
        const nfds_t count = channels_.signal_fd >= 0 ? 3 : 2;
        const int timeout =
            static_cast<int>(std::min<std::int64_t>(watchdog_.remaining_ms(), INT_MAX));

        const int ready = ::poll(fds, count, timeout);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(std::string("poll failed: ") + std::strerror(errno));
            return finish(ExitReason::InputClosed);
        }
        if (ready == 0) {
            continue;  // the watchdog check at the top decides
        }

        if (count == 3 && (fds[2].revents & POLLIN) != 0) {
            LOG_INFO("Termination signal received");
            return finish(ExitReason::Signal);
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }

        const ssize_t got = ::read(channels_.input_fd, buffer.data(), buffer.size());
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            LOG_ERROR(std::string("read failed: ") + std::strerror(errno));
            return finish(ExitReason::InputClosed);
        }
        if (got == 0) {
            LOG_INFO("Input closed");
            return finish(ExitReason::InputClosed);
        }

        for (const auto& frame : decoder_.feed(buffer.data(), static_cast<std::size_t>(got))) {
            if (const auto* oversized = std::get_if<protocol::OversizedFrame>(&frame)) {
                dispatcher_.handle_oversized(oversized->declared_length);
                continue;
            }
            const auto& payload = std::get<protocol::FramePayload>(frame);
            if (dispatcher_.handle_payload(payload.json) == DispatchOutcome::Shutdown) {
                return finish(ExitReason::Shutdown);
            }
        }
    }
}

}  // namespace toolsrv::runtime
