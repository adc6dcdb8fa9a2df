//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length framer and the chunk-driven FrameDecoder used by the stdio reader
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "flymcp/ContentFramer.h"

namespace flymcp {

namespace {
constexpr const char* HeaderTerminator = "\r\n\r\n";
constexpr std::size_t HeaderTerminatorSize = 4;

// Strict decimal parse; rejects signs, blanks and trailing junk
std::optional<unsigned long long> parseLength(const std::string& text) {
    std::size_t end = text.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    if (end == 0 || end > 19) {
        return std::nullopt;
    }
    unsigned long long v = 0;
    for (std::size_t k = 0; k < end; ++k) {
        unsigned char c = static_cast<unsigned char>(text[k]);
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        v = v * 10 + static_cast<unsigned long long>(c - '0');
    }
    return v;
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + HeaderTerminator;
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t headerEnd = buffer.find(HeaderTerminator);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + HeaderTerminatorSize;

        std::optional<unsigned long long> declared;
        std::size_t pos = 0;
        // The terminator's leading CRLF closes the last header line
        while (pos < headerEnd + 2) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                break;
            }
            std::string line = buffer.substr(pos, eol - pos);
            pos = eol + 2;
            auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            if (name != "content-length") {
                continue;
            }
            std::string value = line.substr(colon + 1);
            value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
            declared = parseLength(value);
            if (!declared.has_value()) {
                LOG_WARN("Invalid Content-Length header: {}", value);
                return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
            }
        }

        if (!declared.has_value()) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        const unsigned long long v64 = declared.value();
        if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
            LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
            std::size_t dropTotal = std::numeric_limits<std::size_t>::max();
            if (v64 <= std::numeric_limits<std::size_t>::max() - headerAndSep) {
                dropTotal = headerAndSep + static_cast<std::size_t>(v64);
            }
            return { DecodeStatus::BodyTooLarge, std::nullopt, dropTotal };
        }

        const std::size_t frameTotal = headerAndSep + static_cast<std::size_t>(v64);
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(headerAndSep, static_cast<std::size_t>(v64));
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

FrameDecoder::FrameDecoder(std::size_t maxMessageBytes)
    : framer(MakeContentLengthFramer(maxMessageBytes)) {}

std::vector<std::string> FrameDecoder::Feed(const std::string& chunk) {
    std::vector<std::string> frames;
    std::size_t offset = 0;
    if (discardRemaining > 0) {
        offset = std::min(discardRemaining, chunk.size());
        discardRemaining -= offset;
    }
    buffer.append(chunk, offset, std::string::npos);

    while (!buffer.empty()) {
        IContentFramer::DecodeResult r = framer->tryDecodeEx(buffer);
        if (r.status == IContentFramer::DecodeStatus::Incomplete) {
            break;
        }
        if (r.status == IContentFramer::DecodeStatus::Ok) {
            frames.push_back(std::move(r.payload.value()));
        } else if (r.status == IContentFramer::DecodeStatus::BodyTooLarge) {
            LOG_WARN("Dropping oversized frame ({} bytes)", r.bytesConsumed);
            if (r.bytesConsumed > buffer.size()) {
                // Rest of the body has not arrived yet
                discardRemaining = r.bytesConsumed - buffer.size();
                buffer.clear();
                break;
            }
        } else {
            LOG_WARN("Dropping frame with invalid header ({} bytes)", r.bytesConsumed);
        }
        buffer.erase(0, r.bytesConsumed);
    }
    return frames;
}

} // namespace flymcp
