#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace toolsrv::protocol {

// 10 MB ceiling on a single declared payload.
constexpr std::uint32_t kMaxFramePayloadBytes = 10 * 1024 * 1024;

struct FramePayload {
    std::string json;
};

// A header declared more than kMaxFramePayloadBytes; its payload is skipped.
struct OversizedFrame {
    std::uint32_t declared_length = 0;
};

using DecodedFrame = std::variant<FramePayload, OversizedFrame>;

std::string encode_frame(const std::string& payload);

// Owns the inbound byte arena. Bytes go in through feed(), complete frames come out.
class FrameDecoder {
public:
    FrameDecoder() = default;
    FrameDecoder(const FrameDecoder&) = delete;
    FrameDecoder& operator=(const FrameDecoder&) = delete;
    FrameDecoder(FrameDecoder&&) = default;
    FrameDecoder& operator=(FrameDecoder&&) = default;

    std::vector<DecodedFrame> feed(const char* data, std::size_t size);
    std::vector<DecodedFrame> feed(const std::string& chunk);

    // Bytes received but not yet consumed as part of a frame.
    std::size_t buffered_bytes() const;

private:
    void compact();

    std::vector<char> arena_;
    std::size_t cursor_ = 0;
    std::uint64_t skip_remaining_ = 0;
};

}  // namespace toolsrv::protocol
