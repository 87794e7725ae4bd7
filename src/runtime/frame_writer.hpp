#pragma once

#include "protocol/wire_contract.hpp"

namespace toolsrv::runtime {

// Writes length-prefixed response frames to a file descriptor, one whole frame at a time.
class FrameWriter {
public:
    explicit FrameWriter(int fd) : fd_(fd) {}

    // False when the peer is gone or the write failed; the frame is dropped.
    bool write(const protocol::Response& response);

private:
    int fd_;
};

}  // namespace toolsrv::runtime
