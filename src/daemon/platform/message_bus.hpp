#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct BusMessage {
    std::string channel;
    nlohmann::json payload;
};

// Publish/subscribe transport. publish() may be called from any thread;
// the subscription side belongs to the event loop thread.
class MessageBus {
public:
    virtual ~MessageBus() = default;
    virtual bool publish(const std::string& channel, const nlohmann::json& message) = 0;
    virtual bool subscribe(const std::vector<std::string>& channels) = 0;
    // FD that becomes readable when subscribed messages arrive, or -1.
    virtual int event_fd() const = 0;
    // Appends every complete message received so far. Payloads that are not
    // valid JSON are dropped. Returns false on disconnect or protocol error.
    virtual bool read_messages(std::vector<BusMessage>& out) = 0;
};
