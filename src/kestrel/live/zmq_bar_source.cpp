#include <kestrel/live/zmq_bar_source.hpp>
#include <kestrel/live/event_codec.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/utils/logger.hpp>
#include <cerrno>

namespace kestrel::live {

ZmqBarSource::ZmqBarSource(const std::string& endpoint)
    : context_(1), socket_(context_, zmq::socket_type::sub), endpoint_(endpoint) {
    try {
        utils::Logger::info() << "Connecting to market data socket at " << endpoint_ << utils::Logger::endl;
        socket_.connect(endpoint_);
        socket_.set(zmq::sockopt::subscribe, "");  // Subscribe to all messages
    } catch (const zmq::error_t& e) {
        throw core::FeedDisconnected("Failed to connect to " + endpoint_ + ": " + e.what(), false);
    }
}

std::optional<core::Bar> ZmqBarSource::receive(std::chrono::milliseconds timeout) {
    zmq::message_t message;
    try {
        socket_.set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout.count()));
        if (!socket_.recv(message, zmq::recv_flags::none)) {
            return std::nullopt;
        }
    } catch (const zmq::error_t& e) {
        // EINTR is a signal during recv, not a broken socket
        throw core::FeedDisconnected("Receive failed on " + endpoint_ + ": " + e.what(), e.num() == EINTR);
    }

    std::string json_str(static_cast<char*>(message.data()), message.size());
    std::optional<core::Bar> bar = parse_bar_json(json_str);
    if (!bar) {
        ++malformed_;
        utils::Logger::debug() << "Dropping unparseable message: " << json_str << utils::Logger::endl;
    }
    return bar;
}

} // namespace kestrel::live
