#include "runtime/process_lifecycle.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <unistd.h>

namespace toolsrv::runtime {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

volatile std::sig_atomic_t g_signal_write_fd = -1;

void on_termination_signal(int signo) {
    const int saved_errno = errno;
    const unsigned char byte = static_cast<unsigned char>(signo);
    if (g_signal_write_fd >= 0) {
        static_cast<void>(::write(g_signal_write_fd, &byte, 1));
    }
    errno = saved_errno;
}

ToolError signal_setup_error(const std::string& what) {
    return ToolError{ErrorCategory::Internal, what + ": " + std::strerror(errno),
                     "signal_setup_failed"};
}

}  // namespace

core::errors::Result<int> install_signal_handlers() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        return signal_setup_error("pipe2 for signal delivery");
    }
    g_signal_write_fd = fds[1];

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (::sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        return signal_setup_error("sigaction(SIGPIPE)");
    }

    struct sigaction terminate {};
    terminate.sa_handler = on_termination_signal;
    sigemptyset(&terminate.sa_mask);
    terminate.sa_flags = SA_RESTART;
    if (::sigaction(SIGTERM, &terminate, nullptr) != 0) {
        return signal_setup_error("sigaction(SIGTERM)");
    }
    if (::sigaction(SIGINT, &terminate, nullptr) != 0) {
        return signal_setup_error("sigaction(SIGINT)");
    }
    return fds[0];
}

void exit_process(const int code) {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
    std::_Exit(code);
}

}  // namespace toolsrv::runtime
