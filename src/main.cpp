#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/ResultSerializer.h"
#include "analytics/PerformanceReport.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using namespace finpack;

namespace {
void printUsage() {
    std::cout << "Usage: finpack --backtest <bundle.json> [options]\n"
              << "  --config <file>          configuration file (default: config/config.json)\n"
              << "  --json                   print the result as JSON\n"
              << "  --initial-capital <X>    override initial capital (TWD)\n"
              << "  --market <us|tw|global>  override market scope\n"
              << "  --start <YYYY-MM-DD>     override start date\n"
              << "  --end <YYYY-MM-DD>       override end date\n"
              << "  --output <file>          also write the JSON result to a file\n";
}

void printPositions(const backtest::BacktestResult& result) {
    if (result.final_positions.empty()) {
        std::cout << "No open positions.\n";
        return;
    }
    std::cout << "Open positions:\n";
    for (const auto& p : result.final_positions) {
        std::cout << "  " << std::left << std::setw(10) << p.ticker
                  << std::setw(4) << p.country
                  << std::right << std::fixed
                  << std::setprecision(p.country == COUNTRY_TW ? 0 : 4) << std::setw(14) << p.shares
                  << std::setprecision(2) << std::setw(12) << p.last_price
                  << std::setprecision(0) << std::setw(14) << p.market_value << " TWD"
                  << std::setprecision(2) << std::setw(9) << p.profit_pct << "%"
                  << "  since " << p.entry_date << "\n";
    }
}

void printDateAdjustments(const backtest::DateMetadata& meta) {
    if (meta.start_adjusted) {
        std::cout << "Start date adjusted: " << meta.configured_start << " -> " << meta.actual_start << "\n";
    }
    if (meta.end_adjusted) {
        std::cout << "End date adjusted: " << meta.configured_end << " -> " << meta.actual_end << "\n";
    }
}
}

int main(int argc, char* argv[]) {
    std::string bundle_path;
    std::string config_path = (utils::PathUtils::getConfigDir() / "config.json").string();
    std::string output_path;
    bool json_mode = false;
    double cli_initial_capital = -1.0;
    std::string cli_market;
    std::string cli_start;
    std::string cli_end;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--backtest" && i + 1 < argc) {
            bundle_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--json") {
            json_mode = true;
        } else if (arg == "--initial-capital" && i + 1 < argc) {
            try {
                cli_initial_capital = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --initial-capital value: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--market" && i + 1 < argc) {
            cli_market = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            cli_start = argv[++i];
        } else if (arg == "--end" && i + 1 < argc) {
            cli_end = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (bundle_path.empty()) {
        printUsage();
        return 1;
    }

    auto& config = Config::getInstance();
    try {
        config.load(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    if (cli_initial_capital > 0.0) {
        config.setInitialCapital(cli_initial_capital);
    }
    if (!cli_market.empty()) {
        config.setMarket(cli_market);
    }
    if (!cli_start.empty()) {
        config.setStartDate(cli_start);
    }
    if (!cli_end.empty()) {
        config.setEndDate(cli_end);
    }

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel(), !json_mode);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (!std::filesystem::exists(bundle_path)) {
        std::cerr << "Bundle file not found: " << bundle_path << "\n";
        return 1;
    }
    LOG_INFO("Starting backtest with bundle: {}", bundle_path);

    auto data = backtest::DataHistory::loadBundle(bundle_path);
    if (!data) {
        std::cerr << "Failed to load bundle: " << bundle_path << "\n";
        return 1;
    }

    backtest::BacktestEngine engine(config.getBacktestConfig());
    if (!json_mode) {
        engine.setProgressCallback([](const backtest::Progress& p) {
            if (p.day_index % 20 == 0 || p.day_index == p.total_days) {
                LOG_INFO("Progress {}/{} {} equity {:.0f}", p.day_index, p.total_days, p.date, p.equity);
            }
        });
    }

    const auto result = engine.run(*data);

    if (!output_path.empty() && !backtest::ResultSerializer::writeFile(result, output_path)) {
        std::cerr << "Failed to write result file: " << output_path << "\n";
    }

    if (json_mode) {
        std::cout << backtest::ResultSerializer::toJson(result).dump(2) << std::endl;
        return result.success ? 0 : 1;
    }

    if (!result.success) {
        std::cerr << "Backtest failed (" << backtest::runErrorToString(result.error_kind) << "): "
                  << result.error << "\n";
        return 1;
    }

    std::cout << "\n";
    printDateAdjustments(result.date_metadata);
    std::cout << analytics::PerformanceReport::generateText(result.metrics);
    if (result.benchmark && !result.benchmark->points.empty()) {
        std::cout << "Benchmark " << result.benchmark->name << ": " << std::fixed << std::setprecision(2)
                  << result.benchmark->total_return_pct << "%\n";
    }
    printPositions(result);
    return 0;
}
