#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace replaybt {

class Logger {
public:
    static Logger& getInstance();
    // console_stderr keeps stdout free for machine-readable output
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info",
                    bool console_stderr = false);
    void setLevel(const std::string& level);
    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

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
    
    // One CSV row per executed fill: symbol,side,price,quantity,commission,pnl
    void logTrade(const std::string& symbol, const std::string& side,
                  double price, double quantity, double commission, double pnl);
    
private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) replaybt::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) replaybt::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) replaybt::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) replaybt::Logger::getInstance().error(__VA_ARGS__)

} // namespace replaybt
