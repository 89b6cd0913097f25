#include <kestrel/live/zmq_event_publisher.hpp>
#include <kestrel/live/event_codec.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/utils/logger.hpp>

namespace kestrel::live {

ZmqEventPublisher::ZmqEventPublisher(const std::string& endpoint)
    : context_(1), socket_(context_, zmq::socket_type::pub) {
    try {
        socket_.bind(endpoint);
    } catch (const zmq::error_t& e) {
        throw core::ConfigurationError("Cannot bind event stream to " + endpoint + ": " + e.what());
    }
    utils::Logger::info() << "Publishing signal and order events on " << endpoint << utils::Logger::endl;
}

void ZmqEventPublisher::send(const char* topic, const std::string& payload) {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    try {
        socket_.send(zmq::buffer(std::string(topic)), zmq::send_flags::sndmore);
        socket_.send(zmq::buffer(payload), zmq::send_flags::none);
        ++published_;
    } catch (const zmq::error_t& e) {
        utils::Logger::warn() << "Failed to publish " << topic << " event: " << e.what() << utils::Logger::endl;
    }
}

void ZmqEventPublisher::publish(const core::Signal& signal) {
    send(kSignalTopic, encode_signal_json(signal));
}

void ZmqEventPublisher::publish(const core::Order& order) {
    send(kOrderTopic, encode_order_json(order));
}

} // namespace kestrel::live
