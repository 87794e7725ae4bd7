#include "runtime/frame_writer.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <string>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "protocol/frame_codec.hpp"

namespace toolsrv::runtime {

bool FrameWriter::write(const protocol::Response& response) {
    const std::string frame = protocol::encode_frame(protocol::serialize_response(response));

    std::size_t offset = 0;
    while (offset < frame.size()) {
        const ssize_t written = ::write(fd_, frame.data() + offset, frame.size() - offset);
        if (written > 0) {
            offset += static_cast<std::size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd out{fd_, POLLOUT, 0};
            ::poll(&out, 1, -1);
            continue;
        }
        if (written < 0 && errno == EPIPE) {
            LOG_WARN("Output channel closed; dropping response frame");
        } else {
            LOG_ERROR(std::string("Failed to write response frame: ") +
                      std::strerror(errno));
        }
        return false;
    }
    return true;
}

}  // namespace toolsrv::runtime
