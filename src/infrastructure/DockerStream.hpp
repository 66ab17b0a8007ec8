/**
 * @file DockerStream.hpp
 * @brief Decoder for Docker's multiplexed attach/exec stream.
 */

#pragma once

#include <string>

namespace dockbuild::infrastructure {

/**
 * @class DockerStream
 * @brief Splits a non-TTY exec stream into stdout and stderr.
 *
 * Each frame is an 8-byte header (stream id, three zero bytes, big-endian
 * payload length) followed by the payload. Stream id 1 is stdout, 2 is
 * stderr; stdin frames (0) are ignored.
 */
class DockerStream {
public:
    struct Output {
        std::string stdoutText;
        std::string stderrText;
    };

    /**
     * @brief Decodes a complete raw stream.
     *
     * A body that does not start with a valid frame header is treated as
     * unframed TTY output and returned as stdout. A truncated final frame
     * contributes whatever payload bytes are present.
     */
    static Output Demultiplex(const std::string& raw);

    static constexpr std::size_t kHeaderSize = 8;
};

} // namespace dockbuild::infrastructure
