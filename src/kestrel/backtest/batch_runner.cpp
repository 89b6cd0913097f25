#include <kestrel/backtest/batch_runner.hpp>
#include <kestrel/backtest/scheduler.hpp>
#include <kestrel/core/errors.hpp>
#include <kestrel/data/historical_feed.hpp>
#include <kestrel/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <future>
#include <sstream>

namespace kestrel::backtest {

BatchRunner::BatchRunner(const strategy::StrategyFactory& factory, size_t max_parallel)
    : factory_(factory), max_parallel_(std::max<size_t>(1, max_parallel)) {}

BatchResult BatchRunner::run_job(const BatchJob& job) const {
    BatchResult result;
    result.label = job.label;
    try {
        if (!job.bars) {
            throw core::InvalidParameter("bars", "job " + job.label + " has no market data");
        }

        data::HistoricalFeedOptions options;
        options.start = job.config.start;
        options.end = job.config.end;
        options.bar_interval = job.config.bar_interval;
        options.gap_tolerance = job.config.gap_tolerance;
        auto feed = std::make_unique<data::HistoricalFeed>(*job.bars, job.config.instruments, options);

        auto strategy = factory_.create(job.config.strategy, job.config.strategy_parameters);
        BacktestScheduler scheduler(job.config, std::move(feed), strategy);
        scheduler.run();
        result.run.emplace(scheduler.seal());
    } catch (const std::exception& e) {
        // Construction problems only; run-time faults are in the sealed run
        result.error = e.what();
        utils::Logger::warn() << "Batch job " << job.label << " not run: " << e.what() << utils::Logger::endl;
    }
    return result;
}

std::vector<BatchResult> BatchRunner::run(const std::vector<BatchJob>& jobs) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    utils::Logger::info() << "Running " << jobs.size() << " backtests, up to " << max_parallel_
                          << " at a time" << utils::Logger::endl;

    std::vector<BatchResult> results;
    results.reserve(jobs.size());

    for (size_t wave_start = 0; wave_start < jobs.size(); wave_start += max_parallel_) {
        size_t wave_end = std::min(wave_start + max_parallel_, jobs.size());

        std::vector<std::future<BatchResult>> futures;
        for (size_t i = wave_start; i < wave_end; ++i) {
            futures.push_back(std::async(std::launch::async,
                [this, &job = jobs[i]]() { return this->run_job(job); }));
        }
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    size_t failed = static_cast<size_t>(std::count_if(results.begin(), results.end(), [](const BatchResult& r) {
        return !r.ok() || r.run->status() != RunStatus::COMPLETED;
    }));
    utils::Logger::info() << "Batch finished in " << duration << "ms, " << failed << " of " << results.size()
                          << " jobs did not complete" << utils::Logger::endl;
    return results;
}

std::vector<BatchJob> parameter_grid(const BacktestConfiguration& base,
                                     std::shared_ptr<const std::vector<core::Bar>> bars,
                                     const std::map<std::string, std::vector<double>>& grid) {
    std::vector<BatchJob> jobs;
    jobs.push_back({"", base, bars});

    for (const auto& [name, values] : grid) {
        std::vector<BatchJob> expanded;
        for (const auto& job : jobs) {
            for (double value : values) {
                BatchJob next = job;
                next.config.strategy_parameters[name] = value;
                std::ostringstream label;
                label << job.label << (job.label.empty() ? "" : ",") << name << "=" << value;
                next.label = label.str();
                expanded.push_back(std::move(next));
            }
        }
        jobs = std::move(expanded);
    }
    return jobs;
}

} // namespace kestrel::backtest
