#include <iostream>
#include <string>
#include <vector>
#include "tcrimer/core/logger.hpp"
#include "tcrimer/core/time_utils.hpp"
#include "tcrimer/data/csv_collector.hpp"
#include "tcrimer/service/analytics_service.hpp"
#include "tcrimer/strategy/strategy_factory.hpp"

using namespace tcrimer;

// Usage: bt_ma_crossover [config.json] [symbol] [csv_dir] [start] [end]
int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "config/tcrimer.json";
        const std::string symbol = argc > 2 ? argv[2] : "BTC-USD";
        const std::string csv_dir = argc > 3 ? argv[3] : "data/csv";
        const std::string start_text = argc > 4 ? argv[4] : "2024-01-01";
        const std::string end_text = argc > 5 ? argv[5] : "2024-12-31";

        auto config = load_system_config(config_path);
        if (config.is_error()) {
            std::cerr << "Failed to load config: " << config.error()->what() << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        LoggerConfig logger_config = config.value().logging;
        logger_config.filename_prefix = "bt_ma_crossover";
        logger.initialize(logger_config);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }

        auto start = core::parse_utc(start_text);
        auto end = core::parse_utc(end_text);
        if (!start || !end) {
            ERROR("Dates must be YYYY-MM-DD, got " << start_text << " and " << end_text);
            return 1;
        }

        auto service =
            AnalyticsService::create(config.value(), std::make_shared<CsvCollector>(csv_dir));
        if (service.is_error()) {
            ERROR("Failed to start analytics service: " << service.error()->what());
            return 1;
        }
        auto analytics = service.value();

        // Submit every MA crossover preset, then collect; the runs overlap
        std::vector<std::pair<StrategyPreset, std::string>> submitted;
        for (const auto& preset : available_strategies()) {
            if (preset.strategy_id != MovingAverageCrossover::kId) {
                continue;
            }
            BacktestRequest request;
            request.strategy_id = preset.strategy_id;
            request.symbol = symbol;
            request.timeframe = DataFrequency::DAILY;
            request.start = *start;
            request.end = *end;
            request.params = preset.params;

            auto run_id = analytics->submit_backtest(request);
            if (run_id.is_error()) {
                ERROR("Could not submit " << preset.name << ": " << run_id.error()->what());
                continue;
            }
            submitted.emplace_back(preset, run_id.value());
        }

        int failures = 0;
        for (const auto& [preset, run_id] : submitted) {
            auto result = analytics->wait_backtest(run_id);
            if (result.is_error()) {
                ERROR(preset.name << " failed: " << result.error()->what());
                ++failures;
                continue;
            }
            const auto& m = result.value().metrics;
            INFO(preset.name << " on " << symbol << ": trades=" << m.total_trades
                             << " return=" << m.total_return_pct * 100.0 << "%"
                             << " max_drawdown=" << m.max_drawdown_pct * 100.0 << "%"
                             << " sharpe="
                             << (m.sharpe_ratio ? std::to_string(*m.sharpe_ratio) : "n/a")
                             << " win_rate=" << m.win_rate * 100.0 << "%"
                             << " vs_market=" << m.outperformance_pct * 100.0 << "%");
        }

        const auto stats = analytics->cache_stats();
        INFO("Cache hit rate " << stats.hit_rate() * 100.0 << "% over " << stats.requests
                               << " lookups");
        analytics->shutdown();
        return failures == 0 ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
