#pragma once

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <mutex>

namespace infercache {
namespace core {
namespace platform {

// Статические характеристики устройства (читаются один раз)
struct DeviceProfile {
    size_t cpuCount = 1;
    uint64_t totalMemoryBytes = 0;

    double totalMemoryGiB() const {
        return static_cast<double>(totalMemoryBytes) / (1024.0 * 1024.0 * 1024.0);
    }
};

/**
 * @brief Источник сведений о ресурсах устройства
 *
 * Платформенные вызовы скрыты за интерфейсом, в тестах используется
 * StaticResourceProbe.
 */
class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;

    virtual DeviceProfile deviceProfile() const = 0;

    // Доля резидентной памяти процесса от общей памяти устройства (0..1)
    virtual double memoryPressure() const = 0;
};

// Реализация для Linux (sysinfo, /proc/self/statm) и Apple (mach, sysctl)
class SystemResourceProbe : public ResourceProbe {
public:
    DeviceProfile deviceProfile() const override;
    double memoryPressure() const override;
};

// Детерминированная реализация для тестов
class StaticResourceProbe : public ResourceProbe {
public:
    StaticResourceProbe(DeviceProfile profile, double memoryPressure)
        : profile_(profile), memoryPressure_(memoryPressure) {}

    DeviceProfile deviceProfile() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return profile_;
    }

    double memoryPressure() const override { return memoryPressure_.load(); }

    void setDeviceProfile(const DeviceProfile& profile) {
        std::lock_guard<std::mutex> lock(mutex_);
        profile_ = profile;
    }

    void setMemoryPressure(double value) { memoryPressure_ = value; }

private:
    mutable std::mutex mutex_;
    DeviceProfile profile_;
    std::atomic<double> memoryPressure_;
};

} // namespace platform
} // namespace core
} // namespace infercache
