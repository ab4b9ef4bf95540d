#pragma once

#include "bus/redis_bus.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/portaudio_host.hpp"
#include "vad/webrtc_vad.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void dispatch_bus_messages();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PortAudioHost audio_host_;
    RedisBus bus_;
    WebRtcVad vad_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
