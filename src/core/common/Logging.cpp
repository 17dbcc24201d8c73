#include "core/common/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace infercache {
namespace core {
namespace common {

namespace {

std::mutex& configMutex() {
    static std::mutex mutex;
    return mutex;
}

LoggingConfig& activeConfig() {
    static LoggingConfig config;
    return config;
}

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

} // namespace

void configureLogging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(configMutex());
    activeConfig() = config;
}

void initializeLogging(const LoggingConfig& config, const std::string& serviceName) {
    configureLogging(config);
    try {
        std::filesystem::create_directories(config.logDirectory);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logDirectory + "/" + serviceName + ".log", config.maxFileSize * 2, config.maxFiles);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern(kPattern);

        std::shared_ptr<spdlog::logger> logger;
        if (config.console) {
            logger = std::make_shared<spdlog::logger>(serviceName,
                spdlog::sinks_init_list{console_sink, file_sink});
        } else {
            logger = std::make_shared<spdlog::logger>(serviceName, file_sink);
        }

        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(config.level));
        spdlog::info("Система логирования инициализирована: {}", config.logDirectory);
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логирования: " << e.what() << std::endl;
        throw;
    }
}

std::shared_ptr<spdlog::logger> componentLogger(const std::string& name) {
    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    LoggingConfig config;
    {
        std::lock_guard<std::mutex> lock(configMutex());
        config = activeConfig();
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = spdlog::rotating_logger_mt(name, config.logDirectory + "/" + name + ".log",
                                            config.maxFileSize, config.maxFiles);
        logger->set_pattern(kPattern);
    } catch (const spdlog::spdlog_ex& e) {
        // Логгер мог быть зарегистрирован параллельным потоком
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        std::cerr << "Ошибка инициализации логгера " << name << ": " << e.what() << std::endl;
        try {
            logger = spdlog::stdout_color_mt(name);
        } catch (const spdlog::spdlog_ex&) {
            if (auto existing = spdlog::get(name)) {
                return existing;
            }
            logger = std::make_shared<spdlog::logger>(name,
                std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
    }

    logger->set_level(spdlog::level::from_str(config.level));
    return logger;
}

} // namespace common
} // namespace core
} // namespace infercache
