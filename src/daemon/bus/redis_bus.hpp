#pragma once

#include "bus/resp.hpp"
#include "platform/message_bus.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Redis pub/sub over plain TCP. Publishing uses its own connection, guarded
// by a mutex, because a subscribed connection only accepts (UN)SUBSCRIBE.
class RedisBus : public MessageBus {
public:
    // reply_timeout_ms also bounds connect and send. After a failed
    // connection publish() fails fast for reconnect_backoff_ms.
    RedisBus(std::string host, uint16_t port, int reply_timeout_ms = 2000,
             int reconnect_backoff_ms = 5000);
    ~RedisBus() override;

    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

    // Opens the publishing connection. publish() reconnects lazily after errors.
    bool connect();

    bool publish(const std::string& channel, const nlohmann::json& message) override;
    bool subscribe(const std::vector<std::string>& channels) override;
    int event_fd() const override { return sub_fd_; }
    bool read_messages(std::vector<BusMessage>& out) override;

    // Waits up to timeout_ms for subscribed messages; used by the client.
    bool wait_messages(std::vector<BusMessage>& out, int timeout_ms);

private:
    int connect_socket();
    bool wait_connected(int fd);
    void drop_publisher();
    bool send_all(int fd, const std::string& data);
    // Blocks (bounded by reply_timeout_ms_) until one complete reply is parsed.
    bool recv_reply(int fd, resp::Parser& parser, resp::Value& reply);
    void drain(std::vector<BusMessage>& out);

    std::string host_;
    uint16_t port_;
    int reply_timeout_ms_;
    std::chrono::milliseconds reconnect_backoff_;

    std::mutex pub_mutex_;
    int pub_fd_ = -1;
    resp::Parser pub_parser_;
    std::chrono::steady_clock::time_point retry_after_{};

    int sub_fd_ = -1;
    resp::Parser sub_parser_;
};
