#include "bus/redis_bus.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using json = nlohmann::json;

RedisBus::RedisBus(std::string host, uint16_t port, int reply_timeout_ms, int reconnect_backoff_ms)
    : host_(std::move(host)), port_(port), reply_timeout_ms_(reply_timeout_ms),
      reconnect_backoff_(reconnect_backoff_ms) {}

RedisBus::~RedisBus() {
    if (pub_fd_ >= 0) ::close(pub_fd_);
    if (sub_fd_ >= 0) ::close(sub_fd_);
}

bool RedisBus::connect() {
    std::lock_guard lock(pub_mutex_);
    if (pub_fd_ >= 0) return true;
    pub_fd_ = connect_socket();
    pub_parser_ = {};
    if (pub_fd_ < 0) drop_publisher();
    return pub_fd_ >= 0;
}

void RedisBus::drop_publisher() {
    if (pub_fd_ >= 0) ::close(pub_fd_);
    pub_fd_ = -1;
    retry_after_ = std::chrono::steady_clock::now() + reconnect_backoff_;
}

bool RedisBus::publish(const std::string& channel, const json& message) {
    std::lock_guard lock(pub_mutex_);

    if (pub_fd_ < 0) {
        if (std::chrono::steady_clock::now() < retry_after_) return false;
        pub_fd_ = connect_socket();
        pub_parser_ = {};
        if (pub_fd_ < 0) {
            drop_publisher();
            return false;
        }
    }

    auto cmd = resp::encode_command({"PUBLISH", channel, message.dump()});
    resp::Value reply;
    if (!send_all(pub_fd_, cmd) || !recv_reply(pub_fd_, pub_parser_, reply)) {
        drop_publisher();
        return false;
    }

    if (reply.type == resp::Value::Type::Error) {
        std::println(stderr, "bus: PUBLISH {} rejected: {}", channel, reply.str);
        return false;
    }
    return true;
}

bool RedisBus::subscribe(const std::vector<std::string>& channels) {
    if (sub_fd_ >= 0) ::close(sub_fd_);
    sub_parser_ = {};
    sub_fd_ = connect_socket();
    if (sub_fd_ < 0) return false;

    std::vector<std::string> args{"SUBSCRIBE"};
    args.insert(args.end(), channels.begin(), channels.end());

    bool ok = send_all(sub_fd_, resp::encode_command(args));

    // One confirmation per channel: ["subscribe", channel, count]
    for (size_t i = 0; ok && i < channels.size(); ++i) {
        resp::Value reply;
        ok = recv_reply(sub_fd_, sub_parser_, reply) &&
             reply.type == resp::Value::Type::Array &&
             !reply.elements.empty() && reply.elements[0].str == "subscribe";
    }

    if (!ok) {
        std::println(stderr, "bus: SUBSCRIBE failed");
        ::close(sub_fd_);
        sub_fd_ = -1;
        return false;
    }
    return true;
}

bool RedisBus::read_messages(std::vector<BusMessage>& out) {
    if (sub_fd_ < 0) return false;

    char buf[4096];
    while (true) {
        ssize_t n = ::recv(sub_fd_, buf, sizeof(buf), MSG_DONTWAIT);
        if (n > 0) {
            sub_parser_.feed(std::string_view(buf, static_cast<size_t>(n)));
            continue;
        }
        if (n == 0) {
            std::println(stderr, "bus: subscription connection closed by server");
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        std::println(stderr, "bus: recv failed: {}", std::strerror(errno));
        return false;
    }

    while (true) {
        auto v = sub_parser_.next();
        if (!v) {
            std::println(stderr, "bus: protocol error: {}", v.error());
            return false;
        }
        if (!*v) break;

        auto& val = **v;
        // ["message", channel, payload]
        if (val.type != resp::Value::Type::Array || val.elements.size() != 3 ||
            val.elements[0].str != "message") {
            continue;
        }

        try {
            out.push_back({val.elements[1].str, json::parse(val.elements[2].str)});
        } catch (const json::exception& e) {
            std::println(stderr, "bus: invalid payload on {}: {}", val.elements[1].str, e.what());
        }
    }
    return true;
}

bool RedisBus::wait_messages(std::vector<BusMessage>& out, int timeout_ms) {
    if (sub_fd_ < 0) return false;

    pollfd pfd{.fd = sub_fd_, .events = POLLIN, .revents = 0};
    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) return errno == EINTR;
    if (ret == 0) return true;
    return read_messages(out);
}

int RedisBus::connect_socket() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    auto port = std::to_string(port_);
    int rc = ::getaddrinfo(host_.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
        std::println(stderr, "bus: cannot resolve {}: {}", host_, gai_strerror(rc));
        return -1;
    }

    int fd = -1;
    int err = 0;
    for (auto* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
        if (fd < 0) {
            err = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        err = errno;
        if (err == EINPROGRESS && wait_connected(fd)) break;
        if (err == EINPROGRESS) err = errno;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        std::println(stderr, "bus: connect to {}:{} failed: {}", host_, port_, std::strerror(err));
        return -1;
    }

    // Back to blocking; replies are awaited with poll() and sends time out.
    int flags = ::fcntl(fd, F_GETFL);
    ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);

    timeval tv{.tv_sec = reply_timeout_ms_ / 1000, .tv_usec = (reply_timeout_ms_ % 1000) * 1000};
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return fd;
}

// Completes a non-blocking connect within reply_timeout_ms_. On failure
// errno holds the reason.
bool RedisBus::wait_connected(int fd) {
    pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
    int ret;
    do {
        ret = ::poll(&pfd, 1, reply_timeout_ms_);
    } while (ret < 0 && errno == EINTR);

    if (ret == 0) {
        errno = ETIMEDOUT;
        return false;
    }
    if (ret < 0) return false;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) return false;
    if (so_error != 0) {
        errno = so_error;
        return false;
    }
    return true;
}

bool RedisBus::send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            std::println(stderr, "bus: send failed: {}", std::strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool RedisBus::recv_reply(int fd, resp::Parser& parser, resp::Value& reply) {
    while (true) {
        auto v = parser.next();
        if (!v) {
            std::println(stderr, "bus: protocol error: {}", v.error());
            return false;
        }
        if (*v) {
            reply = std::move(**v);
            return true;
        }

        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, reply_timeout_ms_);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) {
            std::println(stderr, "bus: timed out waiting for reply");
            return false;
        }

        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        parser.feed(std::string_view(buf, static_cast<size_t>(n)));
    }
}
