#include "core/config/ServiceConfig.hpp"
#include "core/common/InferenceError.hpp"
#include <fstream>

namespace infercache {
namespace core {
namespace config {

using common::ErrorKind;
using common::InferenceError;

namespace {

nlohmann::json section(const nlohmann::json& j, const char* name) {
    if (!j.contains(name)) {
        return nlohmann::json::object();
    }
    const auto& value = j.at(name);
    if (!value.is_object()) {
        throw InferenceError(ErrorKind::Configuration, std::string("Раздел '") + name + "' должен быть объектом");
    }
    return value;
}

common::LoggingConfig loggingFromJson(const nlohmann::json& j) {
    common::LoggingConfig defaults;
    common::LoggingConfig config;
    config.logDirectory = j.value("directory", defaults.logDirectory);
    config.level = j.value("level", defaults.level);
    config.maxFileSize = j.value("max_file_size", defaults.maxFileSize);
    config.maxFiles = j.value("max_files", defaults.maxFiles);
    config.console = j.value("console", defaults.console);
    return config;
}

} // namespace

bool ServiceConfig::validate() const {
    return cacheConfig.validate() && concurrencyConfig.validate() && timeoutConfig.validate() &&
           retryConfig.validate() && schedulerConfig.validate() && maintenanceConfig.validate() &&
           loggingConfig.validate();
}

nlohmann::json ServiceConfig::toJson() const {
    return {
        {"cache", cacheConfig.toJson()},
        {"concurrency", concurrencyConfig.toJson()},
        {"timeouts", timeoutConfig.toJson()},
        {"retry", retryConfig.toJson()},
        {"scheduler", schedulerConfig.toJson()},
        {"maintenance", maintenanceConfig.toJson()},
        {"logging", {
            {"directory", loggingConfig.logDirectory},
            {"level", loggingConfig.level},
            {"max_file_size", loggingConfig.maxFileSize},
            {"max_files", loggingConfig.maxFiles},
            {"console", loggingConfig.console}
        }}
    };
}

ServiceConfig ServiceConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InferenceError(ErrorKind::Configuration, "Конфигурация должна быть JSON-объектом");
    }

    ServiceConfig config;
    try {
        config.cacheConfig = cache::CacheConfig::fromJson(section(j, "cache"));
        config.concurrencyConfig = balancer::ConcurrencyConfig::fromJson(section(j, "concurrency"));
        config.timeoutConfig = scheduler::TimeoutConfig::fromJson(section(j, "timeouts"));
        config.retryConfig = scheduler::RetryConfig::fromJson(section(j, "retry"));
        config.schedulerConfig = scheduler::SchedulerConfig::fromJson(section(j, "scheduler"));
        config.maintenanceConfig = maintenance::MaintenanceConfig::fromJson(section(j, "maintenance"));
        config.loggingConfig = loggingFromJson(section(j, "logging"));
    } catch (const nlohmann::json::exception& e) {
        throw InferenceError(ErrorKind::Configuration, std::string("Неверный тип значения: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw InferenceError(ErrorKind::Configuration, e.what());
    }

    if (!config.validate()) {
        throw InferenceError(ErrorKind::Configuration, "Конфигурация не прошла проверку");
    }
    return config;
}

ServiceConfig ServiceConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw InferenceError(ErrorKind::Configuration, "Не удалось открыть файл конфигурации: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw InferenceError(ErrorKind::Configuration,
            "Ошибка разбора " + path + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace config
} // namespace core
} // namespace infercache
