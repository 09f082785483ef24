#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"

namespace finpack {

// Invalid configuration value; message names the offending key
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; malformed values throw ConfigError.
    // Range and consistency checks are left to BacktestConfig::validate()
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // Back to built-in defaults
    void reset();

    const backtest::BacktestConfig& getBacktestConfig() const { return backtest_config_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }

    // Command-line overrides
    void setInitialCapital(double v) { backtest_config_.initial_capital = v; }
    void setMarket(const std::string& v) { backtest_config_.market = v; }
    void setStartDate(const std::string& v) { backtest_config_.start_date = v; }
    void setEndDate(const std::string& v) { backtest_config_.end_date = v; }

    static backtest::RebalanceFrequency parseRebalanceFrequency(const std::string& value);

private:
    Config() = default;

    void parseBacktest(const nlohmann::json& b);
    static std::map<std::string, backtest::RuleSpec> parseRules(const nlohmann::json& j, const std::string& section);

    backtest::BacktestConfig backtest_config_;
    std::string log_dir_ = "logs";
    std::string log_level_ = "info";
};

} // namespace finpack
