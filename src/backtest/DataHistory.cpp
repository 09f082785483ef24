#include "backtest/DataHistory.h"
#include <fstream>
#include <set>
#include <cmath>
#include "common/Logger.h"

namespace finpack {
namespace backtest {

namespace {
// Accepts a bare number or {"close": number}
std::optional<double> readClose(const nlohmann::json& v) {
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_object() && v.contains("close") && v["close"].is_number()) {
        return v["close"].get<double>();
    }
    return std::nullopt;
}
}

std::optional<MarketData> DataHistory::loadBundle(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open bundle file: {}", file_path);
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing bundle file: {} - {}", file_path, e.what());
        return std::nullopt;
    }

    auto data = fromJson(j);
    if (data) {
        LOG_INFO("Loaded bundle {}: {} dates, {} tickers, {} ranked dates",
                 file_path, data->dates.size(), data->stock_info.size(), data->sharpe_rank.size());
    }
    return data;
}

std::optional<MarketData> DataHistory::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        LOG_ERROR("Bundle root must be an object");
        return std::nullopt;
    }
    if (!j.contains("prices") || !j["prices"].is_object()) {
        LOG_ERROR("Bundle has no prices object");
        return std::nullopt;
    }
    if (!j.contains("stock_info") || !j["stock_info"].is_object()) {
        LOG_ERROR("Bundle has no stock_info object");
        return std::nullopt;
    }

    MarketData data;
    try {
        int dropped = 0;
        for (const auto& [ticker, series] : j["prices"].items()) {
            if (!series.is_object()) {
                LOG_WARN("Price series for {} is not an object, skipped", ticker);
                continue;
            }
            auto& out = data.prices[ticker];
            for (const auto& [date, v] : series.items()) {
                auto close = readClose(v);
                if (!close || !std::isfinite(*close) || *close <= 0.0) {
                    dropped++;
                    continue;
                }
                out[date] = *close;
            }
        }
        if (dropped > 0) {
            LOG_WARN("Dropped {} missing or non-positive prices", dropped);
        }

        for (const auto& [ticker, info] : j["stock_info"].items()) {
            StockInfo si;
            si.country = info.value("country", std::string(COUNTRY_US));
            if (info.contains("sector") && info["sector"].is_string()) {
                si.sector = info["sector"].get<std::string>();
            } else if (info.contains("industry") && info["industry"].is_string()) {
                si.sector = info["industry"].get<std::string>();
            }
            data.stock_info[ticker] = si;
        }

        if (j.contains("dates") && j["dates"].is_array()) {
            for (const auto& d : j["dates"]) {
                data.dates.push_back(d.get<std::string>());
            }
        } else {
            // Derive the calendar from the price series
            std::set<Date> all;
            for (const auto& [ticker, series] : data.prices) {
                for (const auto& [date, price] : series) {
                    all.insert(date);
                }
            }
            data.dates.assign(all.begin(), all.end());
        }

        if (j.contains("sharpe_rank")) parseRankings(j["sharpe_rank"], data.sharpe_rank);
        if (j.contains("growth_rank")) parseRankings(j["growth_rank"], data.growth_rank);
        if (j.contains("sharpe_values")) parseValues(j["sharpe_values"], data.sharpe_values);
        if (j.contains("growth_values")) parseValues(j["growth_values"], data.growth_values);

        if (j.contains("exchange_rates") && j["exchange_rates"].is_object()) {
            for (const auto& [date, rate] : j["exchange_rates"].items()) {
                if (rate.is_number() && rate.get<double>() > 0.0) {
                    data.exchange_rates[date] = rate.get<double>();
                }
            }
        }

        if (j.contains("benchmark") && j["benchmark"].is_object()) {
            const auto& b = j["benchmark"];
            BenchmarkSeries series;
            series.name = b.value("name", std::string("benchmark"));
            series.country = b.value("country", std::string(COUNTRY_US));
            if (b.contains("prices") && b["prices"].is_object()) {
                for (const auto& [date, v] : b["prices"].items()) {
                    auto close = readClose(v);
                    if (close && std::isfinite(*close) && *close > 0.0) {
                        series.prices[date] = *close;
                    }
                }
            }
            data.benchmark = series;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Malformed bundle: {}", e.what());
        return std::nullopt;
    }

    return data;
}

void DataHistory::parseRankings(const nlohmann::json& j, RankingTable& out) {
    if (!j.is_object()) {
        return;
    }
    for (const auto& [date, by_country] : j.items()) {
        if (!by_country.is_object()) {
            continue;
        }
        auto& day = out[date];
        for (const auto& [country, tickers] : by_country.items()) {
            day[country] = tickers.get<std::vector<Ticker>>();
        }
    }
}

void DataHistory::parseValues(const nlohmann::json& j, ValueTable& out) {
    if (!j.is_object()) {
        return;
    }
    for (const auto& [date, by_ticker] : j.items()) {
        if (!by_ticker.is_object()) {
            continue;
        }
        auto& day = out[date];
        for (const auto& [ticker, v] : by_ticker.items()) {
            if (v.is_number()) {
                day[ticker] = v.get<double>();
            }
        }
    }
}

} // namespace backtest
} // namespace finpack
