#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace finpack {

class Logger {
public:
    static Logger& getInstance();
    // console=false keeps stdout clean (file sinks only)
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info",
                    bool console = true);

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // date,ticker,side,price,shares,pnl
    void logTrade(const std::string& date, const std::string& ticker, const std::string& side,
                  double price, double shares, double pnl);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) finpack::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) finpack::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) finpack::Logger::getInstance().error(__VA_ARGS__)

} // namespace finpack
