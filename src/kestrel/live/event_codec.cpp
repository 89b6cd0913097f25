#include <kestrel/live/event_codec.hpp>
#include <kestrel/utils/logger.hpp>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace kestrel::live {

namespace {

// Raw text of a field value, quotes stripped
std::optional<std::string> find_field(const std::string& json, const std::string& key) {
    std::string needle = "\"" + key + "\"";
    size_t pos = json.find(needle);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find(':', pos + needle.size());
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    ++pos;
    while (pos < json.length() && (json[pos] == ' ' || json[pos] == '\t')) {
        ++pos;
    }

    if (pos < json.length() && json[pos] == '"') {
        size_t end = json.find('"', pos + 1);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        return json.substr(pos + 1, end - pos - 1);
    }

    size_t end = json.find_first_of(",}", pos);
    std::string value = json.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    size_t last = value.find_last_not_of(" \t\r\n");
    if (last == std::string::npos) {
        return std::nullopt;
    }
    return value.substr(0, last + 1);
}

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::optional<core::Bar> parse_bar_json(const std::string& json) {
    try {
        if (auto symbol = find_field(json, "symbol")) {
            auto timestamp = find_field(json, "timestamp");
            auto close = find_field(json, "close");
            if (!timestamp || !close) {
                return std::nullopt;
            }

            double close_price = std::stod(*close);
            auto open = find_field(json, "open");
            auto high = find_field(json, "high");
            auto low = find_field(json, "low");
            auto volume = find_field(json, "volume");

            core::Bar bar(*symbol, std::stoll(*timestamp),
                          open ? std::stod(*open) : close_price,
                          high ? std::stod(*high) : close_price,
                          low ? std::stod(*low) : close_price,
                          close_price,
                          volume ? std::stod(*volume) : 0.0);
            if (!bar.is_valid()) {
                return std::nullopt;
            }
            return bar;
        }

        // Tick format published by the market data simulator. Ticks carry no
        // time of their own and are stamped to the second; the scheduler folds
        // same-second ticks of one instrument into a single bar.
        auto symbol = find_field(json, "Symbol");
        auto price = find_field(json, "Price");
        if (!symbol || !price) {
            return std::nullopt;
        }
        auto size = find_field(json, "Size");
        double p = std::stod(*price);
        int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        core::Bar bar(*symbol, now, p, p, p, p, size ? std::stod(*size) : 0.0);
        if (!bar.is_valid()) {
            return std::nullopt;
        }
        return bar;
    } catch (const std::logic_error& e) {
        utils::Logger::debug() << "Error parsing market data: " << e.what() << utils::Logger::endl;
        return std::nullopt;
    }
}

std::string encode_signal_json(const core::Signal& signal) {
    std::ostringstream oss;
    oss << std::setprecision(10);
    oss << "{\"symbol\":\"" << escape(signal.symbol) << "\""
        << ",\"type\":\"" << core::to_string(signal.type) << "\""
        << ",\"timestamp\":" << signal.timestamp
        << ",\"strength\":" << signal.strength;
    if (signal.target_quantity) {
        oss << ",\"target_quantity\":" << *signal.target_quantity;
    }
    if (signal.target_weight) {
        oss << ",\"target_weight\":" << *signal.target_weight;
    }
    if (signal.limit_price) {
        oss << ",\"limit_price\":" << *signal.limit_price;
    }
    oss << ",\"reason\":\"" << escape(signal.reason) << "\"}";
    return oss.str();
}

std::string encode_order_json(const core::Order& order) {
    std::ostringstream oss;
    oss << std::setprecision(10);
    oss << "{\"id\":" << order.id
        << ",\"symbol\":\"" << escape(order.symbol) << "\""
        << ",\"side\":\"" << core::to_string(order.side) << "\""
        << ",\"type\":\"" << core::to_string(order.type) << "\""
        << ",\"quantity\":" << order.quantity
        << ",\"filled_quantity\":" << order.filled_quantity
        << ",\"average_fill_price\":" << order.average_fill_price
        << ",\"commission\":" << order.total_commission
        << ",\"status\":\"" << core::to_string(order.status) << "\""
        << ",\"reject_reason\":\"" << core::to_string(order.reject_reason) << "\""
        << ",\"updated_at\":" << order.updated_at << "}";
    return oss.str();
}

} // namespace kestrel::live
