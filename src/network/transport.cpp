/**
 * @file transport.cpp
 * @brief FrameClient / FrameServer implementation over non-blocking POSIX sockets.
 *
 * Every wait goes through poll() against an absolute deadline, so a frame
 * that trickles in byte by byte still cannot exceed its time budget.
 */

#include "network/transport.hpp"

#include "executor/thread_pool.hpp"
#include "network/tool_call_codec.hpp"

#include <arpa/inet.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace hybrid_router {

namespace {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

constexpr int kAcceptPollMs = 100;

std::string errno_text(int err) {
    return std::string(std::strerror(err));
}

void set_nodelay(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
}

int remaining_ms(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (left <= 0) return 0;
    return static_cast<int>(std::min<int64_t>(left, INT_MAX));
}

Result<void, LinkError> wait_for(int fd, short events, Deadline deadline, const char* what) {
    for (;;) {
        pollfd pfd{.fd = fd, .events = events, .revents = 0};
        int ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready > 0) return {};
        if (ready == 0) {
            return LinkError{LinkFailure::Timeout, std::string("Timed out ") + what};
        }
        if (errno != EINTR) {
            return LinkError{LinkFailure::Closed, "poll: " + errno_text(errno)};
        }
    }
}

Result<void, LinkError> write_all(int fd, const uint8_t* data, size_t len, Deadline deadline) {
    size_t done = 0;
    while (done < len) {
        if (auto ready = wait_for(fd, POLLOUT, deadline, "writing frame"); !ready) {
            return ready.error();
        }
        ssize_t n = ::send(fd, data + done, len - done, MSG_NOSIGNAL);
        if (n > 0) {
            done += static_cast<size_t>(n);
        } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            return LinkError{LinkFailure::Closed, "send: " + errno_text(errno)};
        }
    }
    return {};
}

Result<void, LinkError> read_exact(int fd, uint8_t* out, size_t len, Deadline deadline) {
    size_t done = 0;
    while (done < len) {
        if (auto ready = wait_for(fd, POLLIN, deadline, "reading frame"); !ready) {
            return ready.error();
        }
        ssize_t n = ::recv(fd, out + done, len - done, 0);
        if (n > 0) {
            done += static_cast<size_t>(n);
        } else if (n == 0) {
            return LinkError{LinkFailure::Closed, "Peer closed the connection"};
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            return LinkError{LinkFailure::Closed, "recv: " + errno_text(errno)};
        }
    }
    return {};
}

Result<void, LinkError> write_frame(int fd, const std::vector<uint8_t>& payload, Deadline deadline) {
    if (payload.size() > kMaxFrameSize) {
        return LinkError{LinkFailure::Oversize,
                         "Frame of " + std::to_string(payload.size()) + " bytes exceeds limit"};
    }
    std::vector<uint8_t> frame;
    frame.reserve(4 + payload.size());
    ToolCallCodec::put_u32(frame, static_cast<uint32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return write_all(fd, frame.data(), frame.size(), deadline);
}

Result<std::vector<uint8_t>, LinkError> read_frame(int fd, Deadline deadline) {
    uint8_t header[4];
    if (auto got = read_exact(fd, header, sizeof(header), deadline); !got) {
        return got.error();
    }
    uint32_t length = ToolCallCodec::get_u32(header);
    if (length > kMaxFrameSize) {
        return LinkError{LinkFailure::Oversize,
                         "Peer announced a frame of " + std::to_string(length) + " bytes"};
    }
    std::vector<uint8_t> payload(length);
    if (length > 0) {
        if (auto got = read_exact(fd, payload.data(), length, deadline); !got) {
            return got.error();
        }
    }
    return payload;
}

Result<Socket, LinkError> open_connection(const std::string& host, uint16_t port,
                                          std::chrono::milliseconds timeout) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return LinkError{LinkFailure::Connect, "Invalid address: " + host};
    }

    Socket sock{::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if (!sock.valid()) {
        return LinkError{LinkFailure::Connect, "socket: " + errno_text(errno)};
    }

    if (::connect(sock.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            return LinkError{LinkFailure::Connect, "connect: " + errno_text(errno)};
        }
        if (auto ready = wait_for(sock.fd(), POLLOUT, Clock::now() + timeout, "connecting"); !ready) {
            return LinkError{LinkFailure::Connect, ready.error().message};
        }
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &err, &len) < 0) err = errno;
        if (err != 0) {
            return LinkError{LinkFailure::Connect, "connect: " + errno_text(err)};
        }
    }

    set_nodelay(sock.fd());
    return Result<Socket, LinkError>{std::move(sock)};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Socket
// ─────────────────────────────────────────────

Socket::Socket(Socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void Socket::reset() noexcept {
    if (fd_ < 0) return;
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
}

// ─────────────────────────────────────────────
// Client Side
// ─────────────────────────────────────────────

Result<void, LinkError> FrameClient::connect(const std::string& host, uint16_t port,
                                             std::chrono::milliseconds timeout) {
    auto sock = open_connection(host, port, timeout);
    if (!sock) {
        return sock.error();
    }
    socket_ = std::move(*sock);
    return {};
}

Result<std::vector<uint8_t>, LinkError> FrameClient::exchange(const std::vector<uint8_t>& request,
                                                              std::chrono::milliseconds timeout) {
    if (!socket_.valid()) {
        return LinkError{LinkFailure::Closed, "Not connected"};
    }

    auto deadline = Clock::now() + timeout;
    if (auto sent = write_frame(socket_.fd(), request, deadline); !sent) {
        return sent.error();
    }
    return read_frame(socket_.fd(), deadline);
}

bool endpoint_reachable(const std::string& host, uint16_t port,
                        std::chrono::milliseconds timeout) {
    return open_connection(host, port, timeout).has_value();
}

// ─────────────────────────────────────────────
// Server Side
// ─────────────────────────────────────────────

FrameServer::FrameServer(size_t worker_count)
    : worker_count_(std::max<size_t>(worker_count, 1)) {}

FrameServer::~FrameServer() {
    stop();
}

Result<uint16_t, LinkError> FrameServer::listen(const std::string& bind_address, uint16_t port,
                                                int backlog) {
    if (listener_.valid()) {
        return LinkError{LinkFailure::Connect, "Already listening"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        return LinkError{LinkFailure::Connect, "Invalid bind address: " + bind_address};
    }

    Socket sock{::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if (!sock.valid()) {
        return LinkError{LinkFailure::Connect, "socket: " + errno_text(errno)};
    }

    int reuse = 1;
    ::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(sock.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        return LinkError{LinkFailure::Connect, "bind: " + errno_text(errno)};
    }
    if (::listen(sock.fd(), backlog) < 0) {
        return LinkError{LinkFailure::Connect, "listen: " + errno_text(errno)};
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(sock.fd(), reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
        return LinkError{LinkFailure::Connect, "getsockname: " + errno_text(errno)};
    }

    listener_ = std::move(sock);
    bound_port_ = ntohs(bound.sin_port);
    listening_ = true;
    return bound_port_;
}

void FrameServer::serve(Handler handler, std::chrono::milliseconds request_timeout) {
    if (!listener_.valid() || accept_thread_.joinable()) return;

    handler_ = std::move(handler);
    workers_ = std::make_unique<ThreadPool>(worker_count_);
    accept_thread_ = std::jthread([this, request_timeout](std::stop_token stop) {
        accept_loop(stop, request_timeout);
    });
}

void FrameServer::stop() {
    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    // Joins workers: running answers complete, queued connections are closed unanswered.
    workers_.reset();
    listener_.reset();
    listening_ = false;
}

void FrameServer::accept_loop(std::stop_token stop, std::chrono::milliseconds request_timeout) {
    while (!stop.stop_requested()) {
        pollfd pfd{.fd = listener_.fd(), .events = POLLIN, .revents = 0};
        if (::poll(&pfd, 1, kAcceptPollMs) <= 0) continue;

        Socket client{::accept4(listener_.fd(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC)};
        if (!client.valid()) continue;
        set_nodelay(client.fd());

        auto conn = std::make_shared<Socket>(std::move(client));
        workers_->submit([this, conn, request_timeout] {
            answer(*conn, request_timeout);
        });
    }
}

void FrameServer::answer(const Socket& conn, std::chrono::milliseconds request_timeout) {
    auto request = read_frame(conn.fd(), Clock::now() + request_timeout);
    if (!request) {
        ++dropped_;
        return;
    }

    std::vector<uint8_t> response;
    try {
        response = handler_(*request);
    } catch (const std::exception&) {
        ++dropped_;
        return;
    }

    // The handler may run long; the reply gets a fresh budget of its own.
    if (auto sent = write_frame(conn.fd(), response, Clock::now() + request_timeout); !sent) {
        ++dropped_;
    }
}

}  // namespace hybrid_router
