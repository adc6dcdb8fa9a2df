//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing (Content-Length stdio framing) and a stateful stream decoder
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>
#include <vector>

namespace flymcp {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // header+sep or full frame bytes to drop when appropriate
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 1024 * 1024);

//========================================================================================================
// FrameDecoder
// Purpose: Accumulates raw stdin chunks and yields every complete frame body, in order.
// Notes:
//   - A frame with a missing or malformed Content-Length is dropped through its header terminator.
//   - A frame larger than maxMessageBytes is dropped together with its declared body, including body
//     bytes that arrive in later chunks.
//   - Never throws on malformed input; problems are logged.
//========================================================================================================
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t maxMessageBytes);

    //====================================================================================================
    // Feed
    // Purpose: Appends a chunk and extracts all frames now complete.
    // Args:
    //   chunk: Bytes read from the stream (any split point is allowed).
    // Returns:
    //   Bodies of the completed frames, possibly empty.
    //====================================================================================================
    std::vector<std::string> Feed(const std::string& chunk);

    // Bytes held waiting for the rest of a frame
    std::size_t Buffered() const { return buffer.size(); }

private:
    std::unique_ptr<IContentFramer> framer;
    std::string buffer;
    std::size_t discardRemaining{0};
};

} // namespace flymcp
