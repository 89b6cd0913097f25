#pragma once
#include <kestrel/data/live_feed.hpp>
#include <zmq.hpp>
#include <string>

namespace kestrel::live {

// SUB socket reading JSON bar or tick messages (see event_codec.hpp)
class ZmqBarSource : public data::BarSource {
private:
    zmq::context_t context_;
    zmq::socket_t socket_;
    std::string endpoint_;
    size_t malformed_ = 0;

public:
    explicit ZmqBarSource(const std::string& endpoint);

    std::optional<core::Bar> receive(std::chrono::milliseconds timeout) override;

    // A subscription never ends on its own
    bool finished() const override { return false; }

    size_t malformed_count() const { return malformed_; }
};

} // namespace kestrel::live
