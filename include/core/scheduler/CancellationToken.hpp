#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace infercache {
namespace core {
namespace scheduler {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable condition;
    bool cancelled = false;
    bool invoking = false;                  // Выполняются обработчики отмены
    std::thread::id invoker;
    uint64_t nextId = 0;
    std::map<uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

/**
 * @brief Токен отмены (только наблюдение)
 *
 * Токен по умолчанию никогда не отменяется.
 */
class CancellationToken {
public:
    /**
     * @brief RAII-регистрация обработчика отмены
     *
     * Деструктор снимает обработчик и дожидается его завершения, если он
     * уже выполняется в другом потоке.
     */
    class Registration {
    public:
        Registration() = default;
        Registration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}
        ~Registration() { reset(); }

        Registration(Registration&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_) {}
        Registration& operator=(Registration&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = other.id_;
            }
            return *this;
        }

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void reset();

    private:
        std::shared_ptr<detail::CancellationState> state_;
        uint64_t id_ = 0;
    };

    CancellationToken() = default;

    bool isCancelled() const;

    // Ожидание отмены не дольше timeout; true, если токен отменён
    bool waitFor(std::chrono::milliseconds timeout) const;

    /**
     * @brief Регистрация обработчика
     * @details Если токен уже отменён, обработчик не вызывается; вызывающий
     *          проверяет isCancelled() после регистрации
     */
    Registration onCancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// Источник отмены
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const { return CancellationToken(state_); }

    // Идемпотентно; обработчики выполняются в вызывающем потоке
    void cancel();

    bool isCancelled() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace scheduler
} // namespace core
} // namespace infercache
