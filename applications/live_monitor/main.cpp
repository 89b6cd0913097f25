// applications/live_monitor/main.cpp
#include "kestrel/backtest/configuration.hpp"
#include "kestrel/backtest/report.hpp"
#include "kestrel/backtest/scheduler.hpp"
#include "kestrel/data/live_feed.hpp"
#include "kestrel/live/zmq_bar_source.hpp"
#include "kestrel/live/zmq_event_publisher.hpp"
#include "kestrel/strategy/strategy_factory.hpp"
#include "kestrel/utils/config.hpp"
#include "kestrel/utils/logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --socket-endpoint <endpoint>  Market data SUB endpoint (default: tcp://127.0.0.1:5555)\n"
              << "  --publish-endpoint <endpoint> Signal/order PUB endpoint (default: tcp://*:5556)\n"
              << "  --config <file>               Configuration file (default: kestrel.conf)\n"
              << "  --strategy <name>             Strategy type, overrides strategy\n"
              << "  --stall-timeout <ms>          Pause after this long without data (default: 5000)\n"
              << "  --help                        Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    // Register signal handler for Ctrl+C
    std::signal(SIGINT, signal_handler);

    std::string socket_endpoint = "tcp://127.0.0.1:5555";
    std::string publish_endpoint = "tcp://*:5556";
    std::string config_file = "kestrel.conf";
    std::string strategy_override;
    long stall_timeout_ms = 5000;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--socket-endpoint" && i + 1 < argc) {
            socket_endpoint = argv[++i];
        } else if (arg == "--publish-endpoint" && i + 1 < argc) {
            publish_endpoint = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--strategy" && i + 1 < argc) {
            strategy_override = argv[++i];
        } else if (arg == "--stall-timeout" && i + 1 < argc) {
            std::string value = argv[++i];
            size_t used = 0;
            try {
                stall_timeout_ms = std::stol(value, &used);
            } catch (const std::logic_error&) {
                used = 0;
            }
            if (value.empty() || used != value.size() || stall_timeout_ms <= 0) {
                std::cerr << "Invalid --stall-timeout: " << value << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        kestrel::utils::Config config;
        if (!config.load_from_file(config_file)) {
            std::cerr << "No configuration file, using defaults." << std::endl;
        }
        if (!strategy_override.empty()) {
            config.set("strategy", strategy_override);
        }
        kestrel::utils::Logger::set_level(kestrel::utils::parse_log_level(config.get("log_level", "info")));
        auto backtest_config = kestrel::backtest::load_backtest_configuration(config);

        auto factory = kestrel::strategy::StrategyFactory::with_builtins();
        auto strategy = factory.create(backtest_config.strategy, backtest_config.strategy_parameters);

        kestrel::data::LiveFeedOptions options;
        options.stall_timeout = std::chrono::milliseconds(stall_timeout_ms);
        auto feed = std::make_unique<kestrel::data::LiveFeed>(
            std::make_unique<kestrel::live::ZmqBarSource>(socket_endpoint), backtest_config.instruments, options);
        feed->start();

        kestrel::live::ZmqEventPublisher publisher(publish_endpoint);
        kestrel::backtest::BacktestScheduler scheduler(backtest_config, std::move(feed), strategy);
        scheduler.set_signal_callback([&publisher](const kestrel::core::Signal& signal) {
            publisher.publish(signal);
        });
        scheduler.set_order_callback([&publisher](const kestrel::core::Order& order) {
            publisher.publish(order);
        });

        kestrel::utils::Logger::info() << "Monitoring " << socket_endpoint << " with " << strategy->name()
                                       << ", press Ctrl+C to stop" << kestrel::utils::Logger::endl;

        while (true) {
            while (scheduler.step()) {
                if (!g_running) {
                    scheduler.cancel();
                }
            }
            if (scheduler.status() != kestrel::backtest::RunStatus::PAUSED) {
                break;
            }
            if (!g_running) {
                scheduler.cancel();
                continue;
            }
            auto checkpoint = scheduler.checkpoint();
            kestrel::utils::Logger::info() << "Waiting for market data after step " << checkpoint.steps
                                           << ", equity " << checkpoint.account.equity << ", "
                                           << checkpoint.open_orders.size() << " open orders"
                                           << kestrel::utils::Logger::endl;
            scheduler.resume();
        }

        auto run = scheduler.seal();
        kestrel::backtest::write_summary(std::cout, run);
        std::cout << "Published " << publisher.published() << " events" << std::endl;
        return run.status() == kestrel::backtest::RunStatus::FAILED ? 2 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
