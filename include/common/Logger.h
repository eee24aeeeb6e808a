#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>

namespace optionlab {

class Logger {
public:
    static Logger& getInstance();

    // Console + rotating file sink under log_dir, plus trades.log.
    // Until this is called every LOG_* macro is a no-op.
    void initialize(const std::string& log_dir = "logs", bool console = true);
    void setLevel(spdlog::level::level_enum level);

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

    // symbol,contract,entry_date,exit_date,contracts,entry_price,exit_price,pnl,reason
    void logTrade(const std::string& symbol, const std::string& contract,
                  const std::string& entry_date, const std::string& exit_date,
                  int contracts, double entry_price, double exit_price,
                  double pnl, const std::string& reason);

    bool isInitialized() const { return initialized_; }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) optionlab::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) optionlab::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) optionlab::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) optionlab::Logger::getInstance().error(__VA_ARGS__)

} // namespace optionlab
