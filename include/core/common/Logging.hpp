#pragma once

#include <memory>
#include <string>
#include <cstddef>
#include <spdlog/spdlog.h>

namespace infercache {
namespace core {
namespace common {

// Параметры логирования компонентов
struct LoggingConfig {
    std::string logDirectory = "logs";
    std::string level = "info";
    size_t maxFileSize = 1024 * 1024 * 5;
    size_t maxFiles = 3;
    bool console = true;

    bool validate() const {
        return !logDirectory.empty() && maxFileSize > 0 && maxFiles > 0;
    }
};

// Установка параметров для последующих вызовов componentLogger()
void configureLogging(const LoggingConfig& config);

// Инициализация логгера по умолчанию (консоль + ротируемый файл)
void initializeLogging(const LoggingConfig& config, const std::string& serviceName);

/**
 * @brief Именованный логгер компонента
 *
 * Возвращает зарегистрированный логгер или создаёт ротируемый файловый логгер
 * `<logDirectory>/<name>.log`. При ошибке создания файла используется консоль.
 * Никогда не возвращает nullptr.
 */
std::shared_ptr<spdlog::logger> componentLogger(const std::string& name);

} // namespace common
} // namespace core
} // namespace infercache
