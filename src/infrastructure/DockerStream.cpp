#include "infrastructure/DockerStream.hpp"

#include <cstdint>

namespace dockbuild::infrastructure {

namespace {

bool LooksLikeHeader(const std::string& raw, std::size_t offset) {
    if (raw.size() - offset < DockerStream::kHeaderSize) return false;
    unsigned char streamId = static_cast<unsigned char>(raw[offset]);
    return streamId <= 2 && raw[offset + 1] == 0 && raw[offset + 2] == 0 && raw[offset + 3] == 0;
}

std::uint32_t ReadLength(const std::string& raw, std::size_t offset) {
    std::uint32_t length = 0;
    for (std::size_t i = 4; i < 8; ++i) {
        length = (length << 8) | static_cast<unsigned char>(raw[offset + i]);
    }
    return length;
}

} // namespace

DockerStream::Output DockerStream::Demultiplex(const std::string& raw) {
    Output output;
    if (raw.empty()) return output;

    if (!LooksLikeHeader(raw, 0)) {
        output.stdoutText = raw;
        return output;
    }

    std::size_t offset = 0;
    while (offset < raw.size()) {
        if (!LooksLikeHeader(raw, offset)) {
            // Garbage after valid frames; keep it rather than lose log output.
            output.stdoutText.append(raw, offset, std::string::npos);
            break;
        }

        unsigned char streamId = static_cast<unsigned char>(raw[offset]);
        std::size_t length = ReadLength(raw, offset);
        std::size_t payloadStart = offset + kHeaderSize;
        std::size_t available = raw.size() - payloadStart;
        std::size_t take = length < available ? length : available;

        if (streamId == 1) {
            output.stdoutText.append(raw, payloadStart, take);
        } else if (streamId == 2) {
            output.stderrText.append(raw, payloadStart, take);
        }
        offset = payloadStart + take;
    }
    return output;
}

} // namespace dockbuild::infrastructure
