#pragma once
#include <kestrel/core/order.hpp>
#include <kestrel/core/signal.hpp>
#include <zmq.hpp>
#include <mutex>
#include <string>

namespace kestrel::live {

// PUB socket exposing signal and order events. Each message is two frames:
// the topic ("signal" or "order") and the JSON payload, so subscribers can
// filter by topic prefix.
class ZmqEventPublisher {
private:
    zmq::context_t context_;
    zmq::socket_t socket_;
    std::mutex socket_mutex_;
    size_t published_ = 0;

    void send(const char* topic, const std::string& payload);

public:
    explicit ZmqEventPublisher(const std::string& endpoint);

    void publish(const core::Signal& signal);
    void publish(const core::Order& order);

    size_t published() const { return published_; }
};

} // namespace kestrel::live
