#pragma once

#include <stdexcept>
#include <string>

namespace infercache {
namespace core {
namespace common {

// Классификация ошибок запросов и хранилища
enum class ErrorKind {
    CacheCorruption,     // Данные записи не читаются (запись удаляется, промах)
    StorageUnavailable,  // Ошибка ввода-вывода (работа без кэша)
    DuplicateInFlight,   // Ожидание дубликата не завершилось результатом
    Timeout,             // Превышен вычисленный дедлайн
    RateLimited,
    Authentication,
    Configuration,
    NetworkTransient,
    InvalidResponse,
    Cancelled,
    Unknown
};

// Строковое представление типа ошибки
const char* toString(ErrorKind kind);

// Исключение с типом ошибки
class InferenceError : public std::runtime_error {
public:
    InferenceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace common
} // namespace core
} // namespace infercache
