//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <cstring>
#ifdef __linux__
#  include <sys/eventfd.h>
#endif

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "flymcp/ContentFramer.h"
#include "flymcp/JSONRPCTypes.h"
#include "flymcp/StdioTransport.hpp"

namespace flymcp {

namespace {
std::future<void> readyFuture() {
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}
} // namespace

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> readerExited{false};
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    std::thread readerThread;
    std::thread writerThread;

#ifdef __linux__
    int wakeEventFd{-1};
#else
    int wakePipe[2]{-1, -1};
#endif

    static constexpr int WaitTimeoutMs = 100;
    std::size_t maxContentLength{2 * 1024 * 1024};
    std::unique_ptr<FrameDecoder> decoder;
    // Stateless; shared by every sending thread
    const std::unique_ptr<IContentFramer> framer;

    // Write queue/backpressure
    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{8 * 1024 * 1024};

    Impl(int in, int out) : inFd(in), outFd(out), decoder(std::make_unique<FrameDecoder>(maxContentLength)),
          framer(MakeContentLengthFramer(maxContentLength)) {
        // Generate session ID
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));

#ifdef __linux__
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
#else
        if (::pipe(wakePipe) != 0) {
            LOG_ERROR("StdioTransport: failed to create self-pipe (errno={} msg={})", errno, ::strerror(errno));
        } else {
            for (int p : wakePipe) {
                int fl = ::fcntl(p, F_GETFL, 0);
                if (fl < 0 || ::fcntl(p, F_SETFL, fl | O_NONBLOCK) < 0) {
                    LOG_WARN("StdioTransport: cannot make wake pipe non-blocking (errno={})", errno);
                }
            }
        }
#endif
    }

    ~Impl() {
#ifdef __linux__
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
#else
        if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
        if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
#endif
    }

    int wakeReadFd() const {
#ifdef __linux__
        return wakeEventFd;
#else
        return wakePipe[0];
#endif
    }

    void signalWake() {
#ifdef __linux__
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
#else
        if (wakePipe[1] < 0) {
            return;
        }
        char b = 'x';
        ssize_t wr;
        do {
            wr = ::write(wakePipe[1], &b, 1);
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: wake pipe write failed (errno={} msg={})", errno, ::strerror(errno));
        }
#endif
    }

    void drainWake() {
        std::array<char, 64> b{};
        while (true) {
            ssize_t r;
            do { r = ::read(wakeReadFd(), b.data(), b.size()); } while (r < 0 && errno == EINTR);
            if (r > 0) { continue; }
            if (r < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("StdioTransport: wake read failed (errno={} msg={})", errno, ::strerror(errno));
            }
            break;
        }
    }

    void reportError(const std::string& message) {
        if (errorHandler) {
            errorHandler(message);
        }
    }

    bool enqueueFrame(const std::string& payload) {
        std::string frame = framer->encode(payload);
        bool overflow = false;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})", queuedBytes, frame.size(), writeQueueMaxBytes);
                overflow = true;
            } else {
                queuedBytes += frame.size();
                writeQueue.emplace_back(std::move(frame));
            }
        }
        if (overflow) {
            connected = false;
            closing = true;
            signalWake();
            cvWrite.notify_all();
            reportError("StdioTransport: write queue overflow");
            return false;
        }
        cvWrite.notify_one();
        return true;
    }

    void processMessage(const std::string& body) {
        LOG_DEBUG("Received message: {}", body);
        auto parsed = ParseMessage(body);
        if (!parsed.has_value()) {
            LOG_DEBUG("StdioTransport: dropped unparseable message ({} bytes)", body.size());
            return;
        }
        if (auto* req = std::get_if<JSONRPCRequest>(&parsed.value())) {
            auto id = req->id;
            if (!requestHandler) {
                LOG_WARN("StdioTransport: no request handler for {}", req->method);
                (void)enqueueFrame(CreateErrorResponse(id, JSONRPCErrorCodes::MethodNotFound,
                                                      "Method not found: " + req->method)->Serialize());
                return;
            }
            try {
                requestHandler(std::make_unique<JSONRPCRequest>(std::move(*req)));
            } catch (const std::exception& e) {
                LOG_ERROR("Request handler exception: {}", e.what());
                (void)enqueueFrame(CreateErrorResponse(id, JSONRPCErrorCodes::InternalError, e.what())->Serialize());
            }
        } else if (auto* note = std::get_if<JSONRPCNotification>(&parsed.value())) {
            if (!notificationHandler) {
                return;
            }
            try {
                notificationHandler(std::make_unique<JSONRPCNotification>(std::move(*note)));
            } catch (const std::exception& e) {
                LOG_ERROR("Notification handler exception: {}", e.what());
            }
        } else {
            LOG_DEBUG("StdioTransport: ignoring response from peer");
        }
    }

    void dispatchChunk(const std::string& chunk) {
        for (const auto& body : decoder->Feed(chunk)) {
            if (!connected) {
                break;
            }
            processMessage(body);
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            int flags = ::fcntl(inFd, F_GETFL, 0);
            if (flags >= 0 && ::fcntl(inFd, F_SETFL, flags | O_NONBLOCK) < 0) {
                LOG_WARN("StdioTransport: cannot make input non-blocking (errno={} msg={})", errno, ::strerror(errno));
            }
            std::vector<char> tmp(4096);
            const int wfd = wakeReadFd();
            struct pollfd pfds[2];
            const nfds_t nfds = (wfd >= 0) ? 2 : 1;

            while (!closing) {
                pfds[0].fd = inFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
                pfds[1].fd = wfd; pfds[1].events = POLLIN; pfds[1].revents = 0;
                int rc = ::poll(pfds, nfds, WaitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioTransport: poll failed");
                    break;
                }
                if (rc == 0) {
                    continue;
                }
                if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                    drainWake();
                    if (closing) {
                        break;
                    }
                }
                if (pfds[0].revents & POLLNVAL) {
                    LOG_ERROR("StdioTransport: input descriptor is invalid");
                    reportError("StdioTransport: invalid input descriptor");
                    break;
                }
                // HUP may still carry unread data; read() returning 0 is the EOF signal
                if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                    ssize_t n = ::read(inFd, tmp.data(), tmp.size());
                    if (n > 0) {
                        dispatchChunk(std::string(tmp.data(), static_cast<std::size_t>(n)));
                    } else if (n == 0) {
                        LOG_INFO("StdioTransport: EOF on stdin");
                        reportError("StdioTransport: EOF on stdin");
                        break;
                    } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                        LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                        reportError("StdioTransport: read error");
                        break;
                    }
                }
            }
            readerExited.store(true);
        });
    }

    bool writeAll(const std::string& frame) {
        std::size_t total = 0;
        while (total < frame.size()) {
            ssize_t w = ::write(outFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                struct pollfd p{outFd, POLLOUT, 0};
                if (::poll(&p, 1, WaitTimeoutMs) < 0 && errno != EINTR) {
                    LOG_ERROR("StdioTransport: poll for write failed (errno={} msg={})", errno, ::strerror(errno));
                    return false;
                }
            } else {
                LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
                return false;
            }
        }
        return true;
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            while (true) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&]{ return closing || !connected || !writeQueue.empty(); });
                    if (!connected || writeQueue.empty()) {
                        break;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                const bool ok = writeAll(frame);
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = (queuedBytes >= frame.size()) ? queuedBytes - frame.size() : 0;
                }
                if (!ok) {
                    connected = false;
                    reportError("StdioTransport: write error");
                    break;
                }
            }
        });
    }
};

StdioTransport::StdioTransport() : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {}

StdioTransport::StdioTransport(int inputFd, int outputFd) : pImpl(std::make_unique<Impl>(inputFd, outputFd)) {
    FUNC_SCOPE();
}

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
    if (pImpl->readerThread.joinable() || pImpl->writerThread.joinable()) {
        Close().get();
    }
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    if (pImpl->readerThread.joinable()) {
        return readyFuture();
    }
    LOG_INFO("Starting StdioTransport ({})", pImpl->sessionId);
    pImpl->closing = false;
    pImpl->connected = true;
    pImpl->startWriter();
    pImpl->startReader();
    return readyFuture();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing StdioTransport ({})", pImpl->sessionId);
    pImpl->closing = true;
    pImpl->signalWake();
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
    // Writer flushes what is already queued, then exits
    pImpl->cvWrite.notify_all();
    if (pImpl->writerThread.joinable()) {
        pImpl->writerThread.join();
    }
    pImpl->connected = false;
    return readyFuture();
}

bool StdioTransport::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->connected && !pImpl->readerExited;
}

std::string StdioTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<void> StdioTransport::SendResponse(std::unique_ptr<JSONRPCResponse> response) {
    FUNC_SCOPE();
    if (!pImpl->connected.load()) {
        LOG_WARN("StdioTransport: dropping response for id {} (not connected)", IdToString(response->id));
        return readyFuture();
    }
    std::string serialized = response->Serialize();
    LOG_DEBUG("Sending framed response ({} bytes)", serialized.size());
    (void)pImpl->enqueueFrame(serialized);
    return readyFuture();
}

std::future<void> StdioTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!pImpl->connected.load()) {
        LOG_DEBUG("StdioTransport: SendNotification called while disconnected; ignoring");
        return readyFuture();
    }
    std::string serialized = notification->Serialize();
    LOG_DEBUG("Sending framed notification ({} bytes)", serialized.size());
    (void)pImpl->enqueueFrame(serialized);
    return readyFuture();
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) { FUNC_SCOPE(); pImpl->notificationHandler = std::move(handler); }
void StdioTransport::SetRequestHandler(RequestHandler handler) { FUNC_SCOPE(); pImpl->requestHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->writeQueueMaxBytes = maxBytes;
}

void StdioTransport::SetMaxContentLength(std::size_t maxBytes) {
    FUNC_SCOPE();
    pImpl->maxContentLength = maxBytes;
    pImpl->decoder = std::make_unique<FrameDecoder>(maxBytes);
}

void StdioTransportTestHooks::drainFrames(StdioTransport& t, const std::string& chunk) {
    t.pImpl->dispatchChunk(chunk);
}

void StdioTransportTestHooks::setConnected(StdioTransport& t, bool v) {
    t.pImpl->connected = v;
}

bool StdioTransportTestHooks::isConnected(const StdioTransport& t) {
    return t.IsConnected();
}

std::size_t StdioTransportTestHooks::writeQueueMaxBytes(const StdioTransport& t) {
    std::lock_guard<std::mutex> lk(t.pImpl->writeMutex);
    return t.pImpl->writeQueueMaxBytes;
}

} // namespace flymcp
