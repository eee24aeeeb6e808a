#include "common/Logger.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace optionlab {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, bool console) {
    if (initialized_) return;

    const std::filesystem::path logs_path = std::filesystem::absolute(log_dir);

    try {
        std::filesystem::create_directories(logs_path);

        std::vector<spdlog::sink_ptr> sinks;
        if (console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "optionlab.log").string(), 1024 * 1024 * 10, 3
        );
        sinks.push_back(file_sink);

        main_logger_ = std::make_shared<spdlog::logger>("optionlab", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::info);
        main_logger_->flush_on(spdlog::level::warn);

        trade_logger_ = std::make_shared<spdlog::logger>(
            "optionlab_trades",
            std::make_shared<spdlog::sinks::basic_file_sink_mt>((logs_path / "trades.log").string())
        );
        trade_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const std::exception& ex) {
        main_logger_.reset();
        trade_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(spdlog::level::level_enum level) {
    if (main_logger_) {
        main_logger_->set_level(level);
    }
}

void Logger::logTrade(const std::string& symbol, const std::string& contract,
                      const std::string& entry_date, const std::string& exit_date,
                      int contracts, double entry_price, double exit_price,
                      double pnl, const std::string& reason) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << symbol << "," << contract << ","
            << entry_date << "," << exit_date << ","
            << contracts << ","
            << std::fixed << std::setprecision(4) << entry_price << ","
            << std::fixed << std::setprecision(4) << exit_price << ","
            << std::fixed << std::setprecision(2) << pnl << ","
            << reason;
        trade_logger_->info(oss.str());
        trade_logger_->flush();
    }
}

} // namespace optionlab
