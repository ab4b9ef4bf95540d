#include "platform/linux/linux_event_loop.hpp"

#include "events.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      bus_(config_.bus.host, config_.bus.port),
      core_(config_, verbose_, audio_host_, bus_, vad_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    if (!audio_host_.init()) return false;
    if (!vad_.init(config_.vad.aggressiveness)) return false;

    if (!bus_.connect()) {
        std::println(stderr, "bus: cannot connect to {}:{}", config_.bus.host, config_.bus.port);
        return false;
    }
    if (!bus_.subscribe({channel::COMMANDS})) {
        std::println(stderr, "bus: subscribe to '{}' failed", channel::COMMANDS);
        return false;
    }
    log(std::format("Listening on {}:{} channel '{}'",
                    config_.bus.host, config_.bus.port, channel::COMMANDS));

    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN)) return false;
    if (!add_fd(bus_.event_fd(), EPOLLIN)) return false;

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == bus_.event_fd()) {
                dispatch_bus_messages();
            }
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::dispatch_bus_messages() {
    std::vector<BusMessage> messages;
    bool ok = bus_.read_messages(messages);

    for (auto& msg : messages) {
        if (msg.channel != channel::COMMANDS) continue;
        log("Command: " + msg.payload.dump());
        core_.handle_command(msg.payload);
    }

    if (!ok) {
        std::println(stderr, "bus: command connection lost, shutting down");
        running_.store(false, std::memory_order_release);
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetcap] {}", msg);
    }
}
