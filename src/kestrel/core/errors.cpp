#include <kestrel/core/errors.hpp>

namespace kestrel::core {

const char* to_string(ErrorLayer layer) {
    switch (layer) {
        case ErrorLayer::FEED: return "feed";
        case ErrorLayer::FACTOR: return "factor";
        case ErrorLayer::CONFIGURATION: return "configuration";
        case ErrorLayer::EXECUTION: return "execution";
        case ErrorLayer::STRATEGY: return "strategy";
        case ErrorLayer::LEDGER: return "ledger";
    }
    return "unknown";
}

} // namespace kestrel::core
