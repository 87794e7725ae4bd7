#include "protocol/frame_codec.hpp"

#include <algorithm>

namespace toolsrv::protocol {

namespace {

constexpr std::size_t kHeaderBytes = 4;

std::uint32_t read_u32_be(const char* bytes) {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < kHeaderBytes; ++i) {
        value = (value << 8) | static_cast<unsigned char>(bytes[i]);
    }
    return value;
}

}  // namespace

std::string encode_frame(const std::string& payload) {
    const auto length = static_cast<std::uint32_t>(payload.size());
    std::string frame;
    frame.reserve(kHeaderBytes + payload.size());
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    frame += payload;
    return frame;
}

std::vector<DecodedFrame> FrameDecoder::feed(const std::string& chunk) {
    return feed(chunk.data(), chunk.size());
}

std::vector<DecodedFrame> FrameDecoder::feed(const char* data, const std::size_t size) {
    std::vector<DecodedFrame> frames;

    std::size_t offset = 0;
    if (skip_remaining_ > 0) {
        const auto skipped =
            static_cast<std::size_t>(std::min<std::uint64_t>(skip_remaining_, size));
        skip_remaining_ -= skipped;
        offset = skipped;
    }
    arena_.insert(arena_.end(), data + offset, data + size);

    while (arena_.size() - cursor_ >= kHeaderBytes) {
        const std::uint32_t payload_length = read_u32_be(arena_.data() + cursor_);

        if (payload_length > kMaxFramePayloadBytes) {
            frames.push_back(OversizedFrame{payload_length});
            cursor_ += kHeaderBytes;
            const std::size_t available = arena_.size() - cursor_;
            if (available >= payload_length) {
                cursor_ += payload_length;
            } else {
                skip_remaining_ = payload_length - available;
                cursor_ = arena_.size();
            }
            continue;
        }

        if (arena_.size() - cursor_ < kHeaderBytes + payload_length) {
            break;
        }

        const char* begin = arena_.data() + cursor_ + kHeaderBytes;
        frames.push_back(FramePayload{std::string(begin, begin + payload_length)});
        cursor_ += kHeaderBytes + payload_length;
    }

    compact();
    return frames;
}

std::size_t FrameDecoder::buffered_bytes() const {
    return arena_.size() - cursor_;
}

void FrameDecoder::compact() {
    if (cursor_ == arena_.size()) {
        arena_.clear();
        cursor_ = 0;
        return;
    }
    if (cursor_ > arena_.size() / 2) {
        arena_.erase(arena_.begin(),
                     arena_.begin() + static_cast<std::ptrdiff_t>(cursor_));
        cursor_ = 0;
    }
}

}  // namespace toolsrv::protocol
