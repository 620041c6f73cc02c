// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    spdlog::level::level_enum Logger::level_ = spdlog::level::info;
    std::string Logger::pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%# %!] %v";
    std::once_flag Logger::init_flag_;
    std::mutex Logger::sink_mutex_;

    void Logger::init(const std::string &log_directory, const std::string &log_filename, const std::string &log_level,
                      const std::string &pattern) {
        pattern_ = pattern;
        level_ = getLogLevel(log_level);
        initialize(log_directory, log_filename);
    }

    void Logger::initialize(const std::string &log_directory, const std::string &log_filename) {
        try {
            if (!std::filesystem::exists(log_directory)) {
                std::filesystem::create_directories(log_directory);
            }

            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    (std::filesystem::path(log_directory) / log_filename).string(), true));

            auto logger = std::make_shared<spdlog::logger>("hoopscluster", sinks.begin(), sinks.end());
            logger->set_level(level_);
            logger->set_pattern(pattern_);

            spdlog::drop("hoopscluster");
            spdlog::register_logger(logger);
            spdlog::set_default_logger(logger);
            logger_ = std::move(logger);
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error &ex) {
            std::cerr << "Log directory could not be created: " << ex.what() << std::endl;
        }
    }

    void Logger::configure(const std::string &log_directory, const std::string &log_filename,
                           const std::string &log_level) {
        std::call_once(init_flag_, []() { init(); });
        std::lock_guard lock(sink_mutex_);
        level_ = getLogLevel(log_level);
        initialize(log_directory, log_filename);
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string &level) {
        static const std::unordered_map<std::string, spdlog::level::level_enum> level_map = {
                {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug}, {"info", spdlog::level::info},
                {"warn", spdlog::level::warn},   {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}};
        const auto iterator = level_map.find(level);
        return iterator != level_map.end() ? iterator->second : spdlog::level::info;
    }

} // namespace common::logging
