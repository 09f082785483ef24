#include "common/Config.h"
#include "common/PathUtils.h"
#include "strategy/BuyPipeline.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace finpack {

namespace {
std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Numbers as-is, booleans as 0/1
double ruleParam(const nlohmann::json& v, const std::string& where) {
    if (v.is_boolean()) {
        return v.get<bool>() ? 1.0 : 0.0;
    }
    if (v.is_number()) {
        return v.get<double>();
    }
    throw ConfigError(where + " must be a number or boolean");
}

template <typename T>
T typedValue(const nlohmann::json& j, const std::string& key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError("backtest." + key + " has the wrong type");
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    backtest_config_ = backtest::BacktestConfig();
    log_dir_ = "logs";
    log_level_ = "info";
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = path;
        }
    }

    std::cerr << "Config file: " << config_path.string() << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Warning: config file not found, using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("config file is not valid JSON: " + std::string(e.what()));
    }
    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    try {
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_dir_ = l.value("log_dir", log_dir_);
            log_level_ = lowerCopy(l.value("level", log_level_));
        }

        if (j.contains("backtest")) {
            parseBacktest(j["backtest"]);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("malformed config: " + std::string(e.what()));
    }
}

backtest::RebalanceFrequency Config::parseRebalanceFrequency(const std::string& value) {
    const std::string v = lowerCopy(value);
    if (v == "daily") return backtest::RebalanceFrequency::DAILY;
    if (v == "weekly") return backtest::RebalanceFrequency::WEEKLY;
    if (v == "monthly") return backtest::RebalanceFrequency::MONTHLY;
    throw ConfigError("unknown rebalance_freq: " + value);
}

void Config::parseBacktest(const nlohmann::json& b) {
    if (!b.is_object()) {
        throw ConfigError("backtest section must be an object");
    }
    auto& cfg = backtest_config_;

    cfg.initial_capital = typedValue(b, "initial_capital", cfg.initial_capital);
    cfg.amount_per_stock = typedValue(b, "amount_per_stock", cfg.amount_per_stock);
    cfg.max_positions = typedValue(b, "max_positions", cfg.max_positions);
    cfg.market = lowerCopy(typedValue(b, "market", cfg.market));
    cfg.start_date = typedValue(b, "start_date", cfg.start_date);
    cfg.end_date = typedValue(b, "end_date", cfg.end_date);
    if (b.contains("rebalance_freq")) {
        cfg.rebalance_frequency = parseRebalanceFrequency(typedValue<std::string>(b, "rebalance_freq", "weekly"));
    }

    cfg.default_exchange_rate = typedValue(b, "default_exchange_rate", cfg.default_exchange_rate);
    cfg.allow_partial_fill = typedValue(b, "allow_partial_fill", cfg.allow_partial_fill);
    cfg.allow_fractional_us = typedValue(b, "allow_fractional_us", cfg.allow_fractional_us);
    cfg.tw_lot_size = typedValue(b, "tw_lot_size", cfg.tw_lot_size);

    if (b.contains("fees")) {
        const auto& fees = b["fees"];
        if (!fees.is_object()) {
            throw ConfigError("backtest.fees must be an object");
        }
        for (const auto& [country, rule] : fees.items()) {
            std::string code = country;
            std::transform(code.begin(), code.end(), code.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            auto& fee = cfg.fees[code];
            fee.rate = rule.value("rate", fee.rate);
            fee.min_fee = rule.value("min_fee", fee.min_fee);
        }
    }

    // A rule section replaces the defaults entirely
    if (b.contains("buy_conditions")) {
        cfg.buy_conditions = parseRules(b["buy_conditions"], "buy_conditions");
    }
    if (b.contains("sell_conditions")) {
        cfg.sell_conditions = parseRules(b["sell_conditions"], "sell_conditions");
    }

    if (b.contains("rebalance_strategy")) {
        const auto& r = b["rebalance_strategy"];
        if (!r.is_object()) {
            throw ConfigError("backtest.rebalance_strategy must be an object");
        }
        backtest::RebalanceSpec spec;
        spec.type = lowerCopy(r.value("type", spec.type));
        spec.params.clear();
        for (const auto& [key, v] : r.items()) {
            if (key == "type") {
                continue;
            }
            spec.params[key] = ruleParam(v, "rebalance_strategy." + key);
        }
        cfg.rebalance = spec;
    }
}

std::map<std::string, backtest::RuleSpec> Config::parseRules(const nlohmann::json& j, const std::string& section) {
    if (!j.is_object()) {
        throw ConfigError("backtest." + section + " must be an object");
    }
    std::map<std::string, backtest::RuleSpec> rules;
    for (const auto& [raw_id, body] : j.items()) {
        const std::string id = strategy::BuyPipeline::normalizeId(raw_id);
        backtest::RuleSpec spec;
        if (body.is_boolean()) {
            spec.enabled = body.get<bool>();
        } else if (body.is_object()) {
            spec.enabled = body.value("enabled", true);
            for (const auto& [key, v] : body.items()) {
                if (key == "enabled") {
                    continue;
                }
                spec.params[key] = ruleParam(v, section + "." + id + "." + key);
            }
        } else {
            throw ConfigError("backtest." + section + "." + raw_id + " must be an object or boolean");
        }
        rules[id] = spec;
    }
    return rules;
}

} // namespace finpack
