#include "common/Config.h"

#include <cmath>
#include <iostream>

int main() {
    using namespace finpack;

    Config& config = Config::getInstance();
    config.reset();

    // Defaults
    {
        const auto& cfg = config.getBacktestConfig();
        if (cfg.market != "us" || cfg.max_positions != 10 ||
            cfg.rebalance_frequency != backtest::RebalanceFrequency::WEEKLY || cfg.rebalance.type != "delayed") {
            std::cerr << "[TEST] unexpected defaults\n";
            return 1;
        }
        if (!cfg.validate().empty()) {
            std::cerr << "[TEST] default config should validate\n";
            return 1;
        }
    }

    // Full document
    {
        const auto j = nlohmann::json::parse(R"({
            "logging": {"log_dir": "out/logs", "level": "DEBUG"},
            "backtest": {
                "initial_capital": 2000000,
                "amount_per_stock": 50000,
                "max_positions": 4,
                "market": "Global",
                "start_date": "2024-02-01",
                "end_date": "2024-06-28",
                "rebalance_freq": "Monthly",
                "allow_fractional_us": true,
                "fees": {"us": {"rate": 0.001, "min_fee": 5}},
                "buy_conditions": {
                    "sharpe_rank": {"top_n": 20},
                    "growth_streak": false,
                    "Sort_Industry": {"enabled": true, "select_n": 6, "per_industry": 1}
                },
                "sell_conditions": {
                    "drawdown": {"threshold": 0.25, "from_highest": true}
                },
                "rebalance_strategy": {"type": "Concentrated", "concentrate_top_k": 2, "lead_margin": 0.1}
            }
        })");
        try {
            config.loadFromJson(j);
        } catch (const ConfigError& e) {
            std::cerr << "[TEST] valid config rejected: " << e.what() << "\n";
            return 1;
        }

        const auto& cfg = config.getBacktestConfig();
        if (config.getLogDir() != "out/logs" || config.getLogLevel() != "debug") {
            std::cerr << "[TEST] logging section not applied\n";
            return 1;
        }
        if (cfg.initial_capital != 2000000.0 || cfg.max_positions != 4 || cfg.market != "global" ||
            cfg.end_date != "2024-06-28" || cfg.rebalance_frequency != backtest::RebalanceFrequency::MONTHLY ||
            !cfg.allow_fractional_us) {
            std::cerr << "[TEST] backtest scalars not applied\n";
            return 1;
        }
        const auto& us_fee = cfg.fees.at(COUNTRY_US);
        if (std::abs(us_fee.rate - 0.001) > 1e-12 || us_fee.min_fee != 5.0 || cfg.fees.count(COUNTRY_TW) != 1) {
            std::cerr << "[TEST] fee override should be keyed by upper-case country\n";
            return 1;
        }
        if (cfg.buy_conditions.size() != 3 || cfg.buy_conditions.count("sharpe_threshold") != 0) {
            std::cerr << "[TEST] buy_conditions should replace the defaults\n";
            return 1;
        }
        if (cfg.buy_conditions.at("growth_streak").enabled || !cfg.buy_conditions.at("sharpe_rank").enabled) {
            std::cerr << "[TEST] enabled flags not parsed\n";
            return 1;
        }
        const auto sector = cfg.buy_conditions.find("sort_sector");
        if (sector == cfg.buy_conditions.end() || sector->second.param("per_industry", 0) != 1.0) {
            std::cerr << "[TEST] sort_industry should be stored as sort_sector\n";
            return 1;
        }
        const auto& dd = cfg.sell_conditions.at("drawdown");
        if (cfg.sell_conditions.size() != 1 || dd.param("from_highest", 0) != 1.0) {
            std::cerr << "[TEST] sell_conditions not parsed\n";
            return 1;
        }
        if (cfg.rebalance.type != "concentrated" || cfg.rebalance.param("concentrate_top_k", 0) != 2.0 ||
            cfg.rebalance.params.count("type") != 0) {
            std::cerr << "[TEST] rebalance_strategy not parsed\n";
            return 1;
        }
    }

    // Malformed documents
    const char* malformed_docs[] = {
        R"({"backtest": {"rebalance_freq": "hourly"}})",
        R"({"backtest": {"max_positions": "ten"}})",
        R"({"backtest": {"buy_conditions": {"sharpe_rank": 15}}})",
        R"([1, 2, 3])"
    };
    for (const char* doc : malformed_docs) {
        config.reset();
        bool threw = false;
        try {
            config.loadFromJson(nlohmann::json::parse(doc));
        } catch (const ConfigError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[TEST] expected ConfigError for " << doc << "\n";
            return 1;
        }
    }

    // Well-formed but invalid values load, and validation reports them
    const char* invalid_docs[] = {
        R"({"backtest": {"market": "jp"}})",
        R"({"backtest": {"rebalance_strategy": {"type": "sometimes"}}})",
        R"({"backtest": {"buy_conditions": {"sort_sharpe": {"select_n": 3}}}})",
        R"({"backtest": {"start_date": "2024-03-01", "end_date": "2024-01-01"}})"
    };
    for (const char* doc : invalid_docs) {
        config.reset();
        try {
            config.loadFromJson(nlohmann::json::parse(doc));
        } catch (const ConfigError& e) {
            std::cerr << "[TEST] well-formed config should load: " << doc << " (" << e.what() << ")\n";
            return 1;
        }
        if (config.getBacktestConfig().validate().empty()) {
            std::cerr << "[TEST] expected validation errors for " << doc << "\n";
            return 1;
        }
    }

    // A missing start date can be supplied after loading, as the command line does
    config.reset();
    try {
        config.loadFromJson(nlohmann::json::parse(R"({"backtest": {"start_date": ""}})"));
    } catch (const ConfigError& e) {
        std::cerr << "[TEST] config without start_date should load: " << e.what() << "\n";
        return 1;
    }
    if (config.getBacktestConfig().validate().empty()) {
        std::cerr << "[TEST] empty start_date should fail validation\n";
        return 1;
    }
    config.setStartDate("2024-01-02");
    if (!config.getBacktestConfig().validate().empty()) {
        std::cerr << "[TEST] start date override should make the config valid\n";
        return 1;
    }

    if (Config::parseRebalanceFrequency("DAILY") != backtest::RebalanceFrequency::DAILY) {
        std::cerr << "[TEST] rebalance frequency parsing should ignore case\n";
        return 1;
    }

    // Missing file keeps defaults
    config.reset();
    config.setMarket("tw");
    try {
        config.load("/nonexistent/finpack/config.json");
    } catch (const ConfigError& e) {
        std::cerr << "[TEST] missing file should not throw: " << e.what() << "\n";
        return 1;
    }
    if (config.getBacktestConfig().market != "tw") {
        std::cerr << "[TEST] missing file should leave the config untouched\n";
        return 1;
    }
    config.reset();

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
