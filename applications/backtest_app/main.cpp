// applications/backtest_app/main.cpp
#include "kestrel/backtest/batch_runner.hpp"
#include "kestrel/backtest/configuration.hpp"
#include "kestrel/backtest/report.hpp"
#include "kestrel/backtest/scheduler.hpp"
#include "kestrel/core/errors.hpp"
#include "kestrel/data/historical_feed.hpp"
#include "kestrel/strategy/strategy_factory.hpp"
#include "kestrel/utils/config.hpp"
#include "kestrel/utils/logger.hpp"
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
    g_interrupted = true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <file>          Configuration file (default: kestrel.conf)\n"
              << "  --data <file>            CSV bars, overrides data_file\n"
              << "  --strategy <name>        Strategy type, overrides strategy\n"
              << "  --set <key=value>        Override any configuration key\n"
              << "  --sweep <param=v1,v2>    Add a parameter to a parallel sweep (repeatable)\n"
              << "  --threads <n>            Parallel sweep jobs (default: hardware threads)\n"
              << "  --report <prefix>        Export equity, order and trade CSV files\n"
              << "  --list-strategies        Show strategies and their parameters\n"
              << "  --help                   Show this help message\n";
}

void list_strategies(const kestrel::strategy::StrategyFactory& factory) {
    for (const auto& type : factory.registered_types()) {
        std::cout << type << "\n";
        for (const auto& spec : factory.describe(type)) {
            std::cout << "  " << std::left << std::setw(20) << spec.name << " default " << spec.default_value
                      << " range [" << spec.min_value << ", " << spec.max_value << "]  " << spec.description
                      << "\n";
        }
    }
}

std::pair<std::string, std::vector<double>> parse_sweep(const std::string& text) {
    size_t pos = text.find('=');
    if (pos == std::string::npos) {
        throw kestrel::core::InvalidParameter("sweep", "expected param=v1,v2,... got '" + text + "'");
    }
    std::vector<double> values;
    std::stringstream ss(text.substr(pos + 1));
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            values.push_back(std::stod(item));
        } catch (const std::exception&) {
            throw kestrel::core::InvalidParameter("sweep", "not a number: '" + item + "'");
        }
    }
    return {text.substr(0, pos), values};
}

int run_single(const kestrel::backtest::BacktestConfiguration& config,
               const kestrel::strategy::StrategyFactory& factory,
               std::vector<kestrel::core::Bar> bars, const std::string& report_prefix) {
    kestrel::data::HistoricalFeedOptions options;
    options.start = config.start;
    options.end = config.end;
    options.bar_interval = config.bar_interval;
    options.gap_tolerance = config.gap_tolerance;
    auto feed = std::make_unique<kestrel::data::HistoricalFeed>(std::move(bars), config.instruments, options);

    auto strategy = factory.create(config.strategy, config.strategy_parameters);
    kestrel::backtest::BacktestScheduler scheduler(config, std::move(feed), strategy);

    // Ctrl+C stops between steps and still seals a consistent run
    while (scheduler.step()) {
        if (g_interrupted) {
            scheduler.cancel();
        }
    }

    kestrel::backtest::BacktestRun run = scheduler.seal();
    kestrel::backtest::write_summary(std::cout, run);
    if (!report_prefix.empty() && !kestrel::backtest::export_run(run, report_prefix)) {
        return 1;
    }
    return run.status() == kestrel::backtest::RunStatus::FAILED ? 2 : 0;
}

int run_sweep(const kestrel::backtest::BacktestConfiguration& config,
              const kestrel::strategy::StrategyFactory& factory,
              std::vector<kestrel::core::Bar> bars,
              const std::map<std::string, std::vector<double>>& grid, size_t threads) {
    auto shared_bars = std::make_shared<const std::vector<kestrel::core::Bar>>(std::move(bars));
    auto jobs = kestrel::backtest::parameter_grid(config, shared_bars, grid);

    kestrel::backtest::BatchRunner runner(factory, threads);
    auto results = runner.run(jobs);

    std::cout << std::left << std::setw(40) << "parameters" << std::right << std::setw(12) << "status"
              << std::setw(12) << "return%" << std::setw(12) << "maxdd%" << std::setw(10) << "sharpe"
              << std::setw(8) << "trades" << "\n";
    std::cout << std::fixed << std::setprecision(2);
    for (const auto& result : results) {
        std::cout << std::left << std::setw(40) << result.label << std::right;
        if (!result.ok()) {
            std::cout << std::setw(12) << "ERROR" << "  " << result.error << "\n";
            continue;
        }
        const auto& metrics = result.run->metrics();
        std::cout << std::setw(12) << kestrel::backtest::to_string(result.run->status())
                  << std::setw(12) << metrics.cumulative_return * 100.0
                  << std::setw(12) << metrics.max_drawdown * 100.0
                  << std::setw(10) << metrics.sharpe_like_ratio
                  << std::setw(8) << metrics.trade_count << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);

    std::string config_file = "kestrel.conf";
    bool config_given = false;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::map<std::string, std::vector<double>> grid;
    std::string report_prefix;
    size_t threads = std::thread::hardware_concurrency();
    bool list = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_file = argv[++i];
                config_given = true;
            } else if (arg == "--data" && i + 1 < argc) {
                overrides.emplace_back("data_file", argv[++i]);
            } else if (arg == "--strategy" && i + 1 < argc) {
                overrides.emplace_back("strategy", argv[++i]);
            } else if (arg == "--set" && i + 1 < argc) {
                std::string setting = argv[++i];
                size_t pos = setting.find('=');
                if (pos == std::string::npos) {
                    std::cerr << "Expected key=value after --set, got " << setting << std::endl;
                    return 1;
                }
                overrides.emplace_back(setting.substr(0, pos), setting.substr(pos + 1));
            } else if (arg == "--sweep" && i + 1 < argc) {
                grid.insert(parse_sweep(argv[++i]));
            } else if (arg == "--threads" && i + 1 < argc) {
                threads = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--report" && i + 1 < argc) {
                report_prefix = argv[++i];
            } else if (arg == "--list-strategies") {
                list = true;
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        auto factory = kestrel::strategy::StrategyFactory::with_builtins();
        if (list) {
            list_strategies(factory);
            return 0;
        }

        kestrel::utils::Config config;
        if (!config.load_from_file(config_file)) {
            if (config_given) {
                std::cerr << "Failed to load configuration file " << config_file << std::endl;
                return 1;
            }
            std::cerr << "No configuration file, using defaults." << std::endl;
        }
        for (const auto& [key, value] : overrides) {
            config.set(key, value);
        }
        kestrel::utils::Logger::set_level(kestrel::utils::parse_log_level(config.get("log_level", "info")));

        auto backtest_config = kestrel::backtest::load_backtest_configuration(config);
        if (backtest_config.data_file.empty()) {
            std::cerr << "No data file: set data_file or pass --data" << std::endl;
            return 1;
        }
        auto bars = kestrel::data::load_bars_csv(backtest_config.data_file);

        if (!grid.empty()) {
            return run_sweep(backtest_config, factory, std::move(bars), grid, threads);
        }
        return run_single(backtest_config, factory, std::move(bars), report_prefix);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
